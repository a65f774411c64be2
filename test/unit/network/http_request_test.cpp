#include "network/http_request.hpp"
#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <string_view>
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
TEST_CASE("http_request") {
    network::HttpRequest request;

    request.method = network::HttpRequest::Method::GET;
    request.path = "/bucket/model.gguf";
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.queries.emplace("key", "value");
    request.queries.emplace("key2", "value2");
    request.headers.emplace("Host", "localhost");
    request.headers.emplace("Range", "bytes=0-99");

    auto serialize = network::HttpRequest::serialize(request);
    auto serializeView = std::string_view(reinterpret_cast<char*>(serialize->data()), serialize->size());

    auto deserializedRequest = network::HttpRequest::deserialize(serializeView);
    REQUIRE(deserializedRequest.path == "/bucket/model.gguf");
    REQUIRE(deserializedRequest.queries.size() == 2);
    REQUIRE(deserializedRequest.headers.at("Range") == "bytes=0-99");

    auto serializeAgain = network::HttpRequest::serialize(deserializedRequest);
    auto serializeAgainView = std::string_view(reinterpret_cast<char*>(serializeAgain->data()), serializeAgain->size());

    REQUIRE(serializeView == serializeAgainView);
    REQUIRE(!network::HttpRequest::isHeadRequest(serializeView));
}
//---------------------------------------------------------------------------
TEST_CASE("http_request_head") {
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::HEAD;
    request.path = "/k";
    request.headers.emplace("Host", "localhost");
    auto serialize = network::HttpRequest::serialize(request);
    auto view = std::string_view(reinterpret_cast<char*>(serialize->data()), serialize->size());
    REQUIRE(network::HttpRequest::isHeadRequest(view));
    REQUIRE(network::HttpRequest::deserialize(view).method == network::HttpRequest::Method::HEAD);

    REQUIRE_THROWS(network::HttpRequest::deserialize("GET /k HTTP/1.1\r\n"));
    REQUIRE_THROWS(network::HttpRequest::deserialize("\r\n\r\n"));
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace network
} // namespace memrun
