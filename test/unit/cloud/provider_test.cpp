#include "cloud/provider.hpp"
#include "cloud/http.hpp"
#include "network/original_message.hpp"
#include "utils/data_vector.hpp"
#include "utils/error.hpp"
#include <catch2/catch.hpp>
#include <string>
#include <string_view>
#include <utility>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace cloud {
namespace test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("provider") {
    REQUIRE(Provider::isRemoteFile("s3://a/b/c"));
    REQUIRE(Provider::isRemoteFile("minio://localhost:9000/a/"));
    REQUIRE(!Provider::isRemoteFile("a/b/c"));

    auto info = Provider::getRemoteInfo("s3://x:y/b");
    REQUIRE(info.provider == Provider::CloudService::AWS);
    REQUIRE(info.bucket == "x");
    REQUIRE(info.region == "y");
    info = Provider::getRemoteInfo("s3://x/b");
    REQUIRE(info.bucket == "x");
    REQUIRE(info.region == "");

    info = Provider::getRemoteInfo("minio://127.0.0.1:9000/bucket:eu-central-1/");
    REQUIRE(info.provider == Provider::CloudService::MinIO);
    REQUIRE(info.endpoint == "127.0.0.1");
    REQUIRE(info.port == 9000);
    REQUIRE(info.bucket == "bucket");
    REQUIRE(info.region == "eu-central-1");

    info = Provider::getRemoteInfo("https://s3.eu-west-1.amazonaws.com/public/");
    REQUIRE(info.provider == Provider::CloudService::HTTPS);
    REQUIRE(info.https);
    REQUIRE(info.port == 443);
    REQUIRE(info.bucket == "public");

    REQUIRE_THROWS_AS(Provider::getRemoteInfo("ftp://host/b/"), utils::ConfigError);
    REQUIRE_THROWS_AS(Provider::getRemoteInfo("minio://host:port/b/"), utils::ConfigError);
    REQUIRE_THROWS_AS(Provider::getRemoteInfo("minio://host:70000/b/"), utils::ConfigError);
    REQUIRE_THROWS_AS(Provider::getRemoteInfo("minio:///b/"), utils::ConfigError);

    auto aws = Provider::makeProvider("s3://x:y", true, {"key", "secret", ""});
    REQUIRE(aws->getType() == Provider::CloudService::AWS);
    REQUIRE(aws->isHttps());
    REQUIRE(aws->getPort() == 443);
}
//---------------------------------------------------------------------------
TEST_CASE("provider_errors") {
    // Region and credentials need the instance metadata without a handle
    REQUIRE_THROWS_AS(Provider::makeProvider("s3://x/", false, {"key", "secret", ""}), utils::ConfigError);
    REQUIRE_THROWS_AS(Provider::makeProvider("s3://x:y/"), utils::ConfigError);
    REQUIRE_THROWS_AS(Provider::makeProvider("s3:///"), utils::ConfigError);
    REQUIRE_THROWS_AS(Provider::makeProvider("minio://localhost:9000/b/"), utils::ConfigError);
    REQUIRE_THROWS_AS(Provider::makeProvider("minio://localhost:9000/", false, {"key", "secret", ""}), utils::ConfigError);
}
//---------------------------------------------------------------------------
TEST_CASE("provider_http") {
    auto provider = Provider::makeProvider("http://localhost:8080/bucket/");
    REQUIRE(provider->getType() == Provider::CloudService::HTTP);
    REQUIRE(provider->getAddress() == "localhost");
    REQUIRE(provider->getPort() == 8080);
    REQUIRE(!provider->isHttps());

    auto dv = provider->getRequest("dir/k", pair<uint64_t, uint64_t>(0, 9));
    REQUIRE(string_view(reinterpret_cast<char*>(dv->data()), dv->size()) == "GET /bucket/dir/k HTTP/1.1\r\nHost: localhost\r\nRange: bytes=0-9\r\n\r\n");
    dv = provider->headRequest("dir/k");
    REQUIRE(string_view(reinterpret_cast<char*>(dv->data()), dv->size()) == "HEAD /bucket/dir/k HTTP/1.1\r\nHost: localhost\r\n\r\n");

    provider = Provider::makeProvider("https://example.com/");
    REQUIRE(provider->isHttps());
    REQUIRE(provider->getPort() == 443);
    dv = provider->getRequest("file.bin");
    REQUIRE(string_view(reinterpret_cast<char*>(dv->data()), dv->size()) == "GET /file.bin HTTP/1.1\r\nHost: example.com\r\n\r\n");

    auto message = provider->makeMessage(provider->headRequest("file.bin"));
    REQUIRE(message->hostname == "example.com");
    REQUIRE(message->port == 443);
    REQUIRE(message->https);
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace cloud
} // namespace memrun
