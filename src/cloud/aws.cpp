#include "cloud/aws.hpp"
#include "cloud/aws_signer.hpp"
#include "cloud/http.hpp"
#include "network/original_message.hpp"
#include "network/tasked_send_receiver.hpp"
#include "utils/data_vector.hpp"
#include "utils/error.hpp"
#include "utils/log.hpp"
#include "utils/utils.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static string buildAMZTimestamp()
// Creates the AWS timestamp
{
    stringstream s;
    const auto t = chrono::system_clock::to_time_t(chrono::system_clock::now());
    tm utc{};
    gmtime_r(&t, &utc);
    s << put_time(&utc, "%Y%m%dT%H%M%SZ");
    return s.str();
}
//---------------------------------------------------------------------------
static int64_t convertIAMTimestamp(const string& awsTimestamp)
// Converts the UTC IAM timestamp to epoch seconds
{
    istringstream s(awsTimestamp);
    tm t{};
    s >> get_time(&t, "%Y-%m-%dT%H:%M:%SZ");
    if (s.fail())
        return 0;
    return timegm(&t);
}
//---------------------------------------------------------------------------
static string_view findJsonValue(string_view content, string_view key)
// Finds "key" : "value" in the flat IAM json
{
    string needle = "\"" + string(key) + "\" : \"";
    auto pos = content.find(needle);
    if (pos == content.npos)
        return {};
    pos += needle.length();
    auto end = content.find('"', pos);
    if (end == content.npos)
        return {};
    return content.substr(pos, end - pos);
}
//---------------------------------------------------------------------------
AWS::AWS(const RemoteInfo& info) : _settings({info.bucket, info.region, info.endpoint, info.port}), _secret()
// The constructor
{
    _type = info.provider;
    _https = info.https;
}
//---------------------------------------------------------------------------
AWS::AWS(const RemoteInfo& info, const Credentials& credentials) : AWS(info)
// The static credentials constructor
{
    auto secret = make_shared<Secret>();
    secret->keyId = credentials.keyId;
    secret->secret = credentials.secret;
    secret->token = credentials.token;
    _secret = move(secret);
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> AWS::downloadInstanceInfo(const string& info)
// Builds the info http request
{
    string httpHeader = "GET /latest/meta-data/" + info + " HTTP/1.1\r\nHost: ";
    httpHeader += getIAMAddress();
    httpHeader += "\r\n\r\n";
    return make_unique<utils::DataVector<uint8_t>>(reinterpret_cast<uint8_t*>(httpHeader.data()), reinterpret_cast<uint8_t*>(httpHeader.data() + httpHeader.size()));
}
//---------------------------------------------------------------------------
string AWS::fetchInstanceMetadata(network::TaskedSendReceiverHandle& sendReceiverHandle, unique_ptr<utils::DataVector<uint8_t>> message)
// Runs a synchronous request against the instance metadata service
{
    RemoteInfo info;
    info.endpoint = getIAMAddress();
    info.port = getIAMPort();
    info.provider = CloudService::HTTP;
    HTTP http(info);
    auto originalMsg = http.makeMessage(move(message));
    verify(sendReceiverHandle.sendSync(originalMsg.get()));
    verify(sendReceiverHandle.processSync());
    if (!originalMsg->result.success())
        throw utils::ConfigError("Instance metadata request failed: " + originalMsg->result.describeFailure());
    return string(originalMsg->result.getResult());
}
//---------------------------------------------------------------------------
string AWS::getInstanceRegion(network::TaskedSendReceiverHandle& sendReceiverHandle)
// Uses the send receiver to get the region
{
    utils::Log::debug("Retrieving the region from the instance metadata");
    return fetchInstanceMetadata(sendReceiverHandle, downloadInstanceInfo("placement/region"));
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> AWS::downloadIAMUser()
// Builds the secret http request
{
    string httpHeader = "GET /latest/meta-data/iam/security-credentials HTTP/1.1\r\nHost: ";
    httpHeader += getIAMAddress();
    httpHeader += "\r\n\r\n";
    return make_unique<utils::DataVector<uint8_t>>(reinterpret_cast<uint8_t*>(httpHeader.data()), reinterpret_cast<uint8_t*>(httpHeader.data() + httpHeader.size()));
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> AWS::downloadSecret(string_view content, string& iamUser)
// Builds the secret http request
{
    auto pos = content.find("\n");
    string httpHeader = "GET /latest/meta-data/iam/security-credentials/";
    if (!content.substr(0, pos).size())
        return nullptr;
    httpHeader += content.substr(0, pos);
    httpHeader += " HTTP/1.1\r\nHost: ";
    httpHeader += getIAMAddress();
    httpHeader += "\r\n\r\n";

    iamUser = content.substr(0, pos);
    return make_unique<utils::DataVector<uint8_t>>(reinterpret_cast<uint8_t*>(httpHeader.data()), reinterpret_cast<uint8_t*>(httpHeader.data() + httpHeader.size()));
}
//---------------------------------------------------------------------------
bool AWS::updateSecret(string_view content, string_view iamUser)
// Update secret
{
    auto secret = make_shared<Secret>();
    auto keyId = findJsonValue(content, "AccessKeyId");
    auto secretKey = findJsonValue(content, "SecretAccessKey");
    auto token = findJsonValue(content, "Token");
    auto expiration = findJsonValue(content, "Expiration");
    if (keyId.empty() || secretKey.empty() || token.empty() || expiration.empty())
        return false;

    secret->keyId = keyId;
    secret->secret = secretKey;
    secret->token = token;
    secret->expiration = convertIAMTimestamp(string(expiration));
    secret->iamUser = iamUser;
    _secret = move(secret);
    return true;
}
//---------------------------------------------------------------------------
bool AWS::validKeys(uint32_t offset) const
// Checks whether keys need to be refreshed
{
    if (!_secret || _secret->secret.empty())
        return false;
    if (!_secret->expiration)
        return true;
    return _secret->expiration - offset >= chrono::system_clock::to_time_t(chrono::system_clock::now());
}
//---------------------------------------------------------------------------
void AWS::initSecret(network::TaskedSendReceiverHandle& sendReceiverHandle)
// Uses the send receiver to initialize the secret
{
    if (validKeys(180))
        return;

    utils::Log::debug("Retrieving credentials from the instance metadata");
    auto roles = fetchInstanceMetadata(sendReceiverHandle, downloadIAMUser());
    string iamUser;
    auto message = downloadSecret(roles, iamUser);
    if (!message)
        throw utils::ConfigError("No AWS credentials provided and no instance role attached");
    auto content = fetchInstanceMetadata(sendReceiverHandle, move(message));
    if (!updateSecret(content, iamUser))
        throw utils::ConfigError("Invalid credentials of instance role " + iamUser);
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> AWS::buildRequest(network::HttpRequest& request) const
// Creates and signs the request
{
    if (!_secret)
        throw runtime_error("AWS request without credentials");
    auto secret = _secret;
    request.headers.emplace("Host", getAddress());
    request.headers.emplace("x-amz-date", testEnvironment ? fakeAMZTimestamp : buildAMZTimestamp());
    request.headers.emplace("x-amz-request-payer", "requester");
    if (!secret->token.empty())
        request.headers.emplace("x-amz-security-token", secret->token);

    AWSSigner::StringToSign stringToSign = {.request = request, .region = _settings.region, .service = "s3", .requestSHA = "", .signedHeaders = "", .payloadHash = ""};
    AWSSigner::encodeCanonicalRequest(request, stringToSign);
    string httpHeader = network::HttpRequest::getRequestMethod(request.method);
    httpHeader += " ";
    httpHeader += AWSSigner::createSignedRequest(secret->keyId, secret->secret, stringToSign) + " " + network::HttpRequest::getRequestType(request.type) + "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    return make_unique<utils::DataVector<uint8_t>>(reinterpret_cast<uint8_t*>(httpHeader.data()), reinterpret_cast<uint8_t*>(httpHeader.data() + httpHeader.size()));
}
//---------------------------------------------------------------------------
string AWS::getObjectPath(const string& filePath) const
// Virtual hosted-style requests, the bucket is part of the host
{
    return "/" + utils::encodeUrlPath(filePath);
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> AWS::getRequest(const string& filePath, const optional<pair<uint64_t, uint64_t>>& range) const
// Builds the http request for downloading a blob
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::GET;
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.path = getObjectPath(filePath);

    if (range) {
        stringstream rangeString;
        rangeString << "bytes=" << range->first << "-" << range->second;
        request.headers.emplace("Range", rangeString.str());
    }

    return buildRequest(request);
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> AWS::headRequest(const string& filePath) const
// Builds the http request for the metadata of a blob
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::HEAD;
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.path = getObjectPath(filePath);
    return buildRequest(request);
}
//---------------------------------------------------------------------------
uint32_t AWS::getPort() const
// Gets the port of AWS S3
{
    return _settings.port;
}
//---------------------------------------------------------------------------
string AWS::getAddress() const
// Gets the address of AWS S3
{
    if (!_settings.endpoint.empty())
        return _settings.endpoint;
    return _settings.bucket + ".s3." + _settings.region + ".amazonaws.com";
}
//---------------------------------------------------------------------------
} // namespace memrun::cloud
