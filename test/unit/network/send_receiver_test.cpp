#include "cloud/provider.hpp"
#include "network/local_http_server.hpp"
#include "network/original_message.hpp"
#include "network/tasked_send_receiver.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace network {
namespace test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static string location(const LocalHttpServer& server)
// The http location of the local bucket
{
    return "http://127.0.0.1:" + to_string(server.port()) + "/bucket/";
}
//---------------------------------------------------------------------------
TEST_CASE("send_receiver") {
    LocalHttpServer server("/bucket/model.bin", 20000);
    Config config;
    config.concurrentRequests = 4;
    config.timeout = chrono::milliseconds(5000);
    TaskedSendReceiverGroup group(config);

    auto provider = cloud::Provider::makeProvider(location(server));
    vector<unique_ptr<OriginalMessage>> msgs;
    for (auto i = 0u; i < 20; i++) {
        auto range = pair<uint64_t, uint64_t>(i * 1000, i * 1000 + 999);
        msgs.emplace_back(provider->makeMessage(provider->getRequest("model.bin", range)));
        verify(group.send(msgs.back().get()));
    }

    group.process(true);

    for (auto i = 0u; i < msgs.size(); i++) {
        auto& result = msgs[i]->result;
        REQUIRE(result.getState() == MessageState::Finished);
        REQUIRE(result.getResponseCodeNumber() == 206);
        REQUIRE(result.getSize() == 1000);
        REQUIRE(!memcmp(result.getData() + result.getOffset(), server.object().data() + i * 1000, 1000));
    }
    REQUIRE(server.requests == 20);
}
//---------------------------------------------------------------------------
TEST_CASE("send_receiver_sync_head") {
    LocalHttpServer server("/bucket/model.bin", 12345);
    TaskedSendReceiverGroup group;
    auto handle = group.getHandle();

    auto provider = cloud::Provider::makeProvider(location(server));
    auto message = provider->makeMessage(provider->headRequest("model.bin"));
    REQUIRE(handle.sendSync(message.get()));
    REQUIRE(handle.processSync());

    REQUIRE(message->result.success());
    REQUIRE(message->result.getSize() == 12345);
    REQUIRE(message->result.getResult().empty());
    REQUIRE(message->result.getResponse()->headResponse);
}
//---------------------------------------------------------------------------
TEST_CASE("send_receiver_failures") {
    LocalHttpServer server("/bucket/model.bin", 4000);
    TaskedSendReceiverGroup group;
    auto handle = group.getHandle();
    auto provider = cloud::Provider::makeProvider(location(server));

    SECTION("not found") {
        auto message = provider->makeMessage(provider->getRequest("missing.bin", pair<uint64_t, uint64_t>(0, 9)));
        REQUIRE(handle.sendSync(message.get()));
        REQUIRE(handle.processSync());
        REQUIRE(message->result.getState() == MessageState::Aborted);
        REQUIRE(message->result.getResponseCodeNumber() == 404);
        REQUIRE(message->result.describeFailure() == "HTTP 404 Not Found");
    }
    SECTION("truncated body") {
        server.truncateBodies = true;
        auto message = provider->makeMessage(provider->getRequest("model.bin", pair<uint64_t, uint64_t>(0, 3999)));
        REQUIRE(handle.sendSync(message.get()));
        REQUIRE(handle.processSync());
        REQUIRE(message->result.getState() == MessageState::Aborted);
        REQUIRE(message->result.getFailureCode() & static_cast<uint16_t>(MessageFailureCode::Empty));
        REQUIRE(message->result.describeFailure().starts_with("connection closed by peer"));
    }
}
//---------------------------------------------------------------------------
TEST_CASE("send_receiver_callback") {
    LocalHttpServer server("/bucket/model.bin", 3000);
    TaskedSendReceiverGroup group;
    auto provider = cloud::Provider::makeProvider(location(server));

    auto finished = 0u;
    uint64_t bytes = 0;
    auto callback = [&](MessageResult& result) {
        finished++;
        if (result.success())
            bytes += result.getSize();
    };
    vector<unique_ptr<OriginalMessage>> msgs;
    for (auto i = 0u; i < 3; i++) {
        auto request = provider->getRequest("model.bin", pair<uint64_t, uint64_t>(i * 1000, i * 1000 + 999));
        msgs.emplace_back(make_unique<OriginalCallbackMessage<decltype(callback)>>(move(callback), move(request), provider->getAddress(), provider->getPort(), provider->isHttps()));
        verify(group.send(msgs.back().get()));
    }
    group.process(true);
    REQUIRE(finished == 3);
    REQUIRE(bytes == 3000);

    group.stop();
    REQUIRE(!group.send(msgs.front().get()));
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace network
} // namespace memrun
