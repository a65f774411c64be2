#include "cloud/aws.hpp"
#include "cloud/aws_signer.hpp"
#include "network/http_request.hpp"
#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <chrono>
#include <ctime>
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
// Helper to test private methods
class AWSTester {
    public:
    void test() {
        Provider::testEnvironment = true;

        auto provider = Provider::makeProvider("s3://test:test/", false, {"ABC", "ABC", "ABC"});
        AWS& aws = *static_cast<AWS*>(provider.get());
        REQUIRE(aws.getType() == Provider::CloudService::AWS);
        REQUIRE(!aws.getIAMAddress().compare("169.254.169.254"));
        REQUIRE(aws.getIAMPort() == 80);
        REQUIRE(aws.getAddress() == "test.s3.test.amazonaws.com");
        REQUIRE(aws.getPort() == 80);
        REQUIRE(!aws.isHttps());
        REQUIRE(aws.validKeys());

        auto dv = aws.downloadInstanceInfo("placement/region");
        string resultString = "GET /latest/meta-data/placement/region HTTP/1.1\r\nHost: 169.254.169.254\r\n\r\n";
        REQUIRE(string_view(reinterpret_cast<char*>(dv->data()), dv->size()) == resultString);

        dv = aws.downloadIAMUser();
        resultString = "GET /latest/meta-data/iam/security-credentials HTTP/1.1\r\nHost: 169.254.169.254\r\n\r\n";
        REQUIRE(string_view(reinterpret_cast<char*>(dv->data()), dv->size()) == resultString);

        string iamUser;
        dv = aws.downloadSecret("ABCDEF\n", iamUser);
        resultString = "GET /latest/meta-data/iam/security-credentials/ABCDEF HTTP/1.1\r\nHost: 169.254.169.254\r\n\r\n";
        REQUIRE(string_view(reinterpret_cast<char*>(dv->data()), dv->size()) == resultString);
        REQUIRE(iamUser == "ABCDEF");
        REQUIRE(!aws.downloadSecret("", iamUser));

        REQUIRE(!aws.updateSecret("{\"Code\" : \"Success\"}", iamUser));
        string keyService = "{\"AccessKeyId\" : \"ABC\", \"SecretAccessKey\" : \"ABC\", \"Token\" : \"ABC\", \"Expiration\" : \"";
        keyService += aws.fakeIAMTimestamp;
        keyService += "\"}";
        REQUIRE(aws.updateSecret(keyService, iamUser));
        REQUIRE(aws._secret->iamUser == "ABCDEF");
        REQUIRE(aws._secret->expiration > chrono::system_clock::to_time_t(chrono::system_clock::now()));
        REQUIRE(aws.validKeys(180));

        dv = aws.getRequest("a/b/c.d", pair<uint64_t, uint64_t>(0, 4194303));
        resultString = "GET /a/b/c.d? HTTP/1.1\r\nAuthorization: AWS4-HMAC-SHA256 Credential=ABC/21000101/test/s3/aws4_request, SignedHeaders=host;range;x-amz-content-sha256;x-amz-date;x-amz-request-payer;x-amz-security-token, Signature=82b170d56cc7345ce03405494cf1acae8b6e74a8dc93a4b1cb60919227f78b78\r\nHost: test.s3.test.amazonaws.com\r\nRange: bytes=0-4194303\r\nx-amz-content-sha256: e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855\r\nx-amz-date: ";
        resultString += aws.fakeAMZTimestamp;
        resultString += "\r\nx-amz-request-payer: requester\r\nx-amz-security-token: ABC\r\n\r\n";
        REQUIRE(string_view(reinterpret_cast<char*>(dv->data()), dv->size()) == resultString);

        dv = aws.getRequest("a/b/c.d");
        resultString = "GET /a/b/c.d? HTTP/1.1\r\nAuthorization: AWS4-HMAC-SHA256 Credential=ABC/21000101/test/s3/aws4_request, SignedHeaders=host;x-amz-content-sha256;x-amz-date;x-amz-request-payer;x-amz-security-token, Signature=839175aaf3e48a7f0a05fc053f48d1ef731b0fe93bfa6051f596fcce83b2542b\r\nHost: test.s3.test.amazonaws.com\r\nx-amz-content-sha256: e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855\r\nx-amz-date: ";
        resultString += aws.fakeAMZTimestamp;
        resultString += "\r\nx-amz-request-payer: requester\r\nx-amz-security-token: ABC\r\n\r\n";
        REQUIRE(string_view(reinterpret_cast<char*>(dv->data()), dv->size()) == resultString);

        dv = aws.headRequest("a/b/c.d");
        resultString = "HEAD /a/b/c.d? HTTP/1.1\r\nAuthorization: AWS4-HMAC-SHA256 Credential=ABC/21000101/test/s3/aws4_request, SignedHeaders=host;x-amz-content-sha256;x-amz-date;x-amz-request-payer;x-amz-security-token, Signature=8afc7244ca6a6eb2cc70891ea7527b11bf3120c73cf76d915bb3fbdade7919b8\r\nHost: test.s3.test.amazonaws.com\r\nx-amz-content-sha256: e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855\r\nx-amz-date: ";
        resultString += aws.fakeAMZTimestamp;
        resultString += "\r\nx-amz-request-payer: requester\r\nx-amz-security-token: ABC\r\n\r\n";
        REQUIRE(string_view(reinterpret_cast<char*>(dv->data()), dv->size()) == resultString);
        REQUIRE(network::HttpRequest::isHeadRequest(string_view(reinterpret_cast<char*>(dv->data()), dv->size())));

        // Expired instance credentials need a refresh
        keyService = "{\"AccessKeyId\" : \"ABC\", \"SecretAccessKey\" : \"ABC\", \"Token\" : \"ABC\", \"Expiration\" : \"2000-01-01T00:00:00Z\"}";
        REQUIRE(aws.updateSecret(keyService, iamUser));
        REQUIRE(!aws.validKeys());

        Provider::testEnvironment = false;
    }
};
//---------------------------------------------------------------------------
TEST_CASE("aws") {
    AWSTester tester;
    tester.test();
}
//---------------------------------------------------------------------------
TEST_CASE("minio") {
    Provider::testEnvironment = true;
    auto provider = Provider::makeProvider("minio://localhost:9000/bucket/", false, {"minio", "minio123", ""});
    REQUIRE(provider->getType() == Provider::CloudService::MinIO);
    REQUIRE(provider->getAddress() == "localhost");
    REQUIRE(provider->getPort() == 9000);

    auto dv = provider->getRequest("model dir/m.gguf", pair<uint64_t, uint64_t>(0, 9));
    string resultString = "GET /bucket/model%20dir/m.gguf? HTTP/1.1\r\nAuthorization: AWS4-HMAC-SHA256 Credential=minio/21000101/us-east-1/s3/aws4_request, SignedHeaders=host;range;x-amz-content-sha256;x-amz-date;x-amz-request-payer, Signature=828d363ac2c00dc567861457f015f64ff4b48a3101da42d94680ec2a74e293cf\r\nHost: localhost\r\nRange: bytes=0-9\r\nx-amz-content-sha256: e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855\r\nx-amz-date: 21000101T000000Z\r\nx-amz-request-payer: requester\r\n\r\n";
    REQUIRE(string_view(reinterpret_cast<char*>(dv->data()), dv->size()) == resultString);
    Provider::testEnvironment = false;
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace cloud
} // namespace memrun
