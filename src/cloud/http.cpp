#include "cloud/http.hpp"
#include "network/http_request.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <sstream>
#include <string>
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
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
HTTP::HTTP(const RemoteInfo& info) : _settings({info.endpoint, info.port, info.bucket})
// The constructor
{
    _type = info.provider;
    _https = info.https;
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> HTTP::buildRequest(network::HttpRequest& request) const
// Serializes the request
{
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.headers.emplace("Host", getAddress());

    string httpHeader = network::HttpRequest::getRequestMethod(request.method);
    httpHeader += " " + request.path + " ";
    httpHeader += network::HttpRequest::getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";

    return make_unique<utils::DataVector<uint8_t>>(reinterpret_cast<uint8_t*>(httpHeader.data()), reinterpret_cast<uint8_t*>(httpHeader.data() + httpHeader.size()));
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> HTTP::getRequest(const string& filePath, const optional<pair<uint64_t, uint64_t>>& range) const
// Builds the http request for downloading a blob
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::GET;
    request.path = _settings.bucket.empty() ? "/" + utils::encodeUrlPath(filePath) : "/" + _settings.bucket + "/" + utils::encodeUrlPath(filePath);

    if (range) {
        stringstream rangeString;
        rangeString << "bytes=" << range->first << "-" << range->second;
        request.headers.emplace("Range", rangeString.str());
    }
    return buildRequest(request);
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> HTTP::headRequest(const string& filePath) const
// Builds the http request for the metadata of a blob
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::HEAD;
    request.path = _settings.bucket.empty() ? "/" + utils::encodeUrlPath(filePath) : "/" + _settings.bucket + "/" + utils::encodeUrlPath(filePath);
    return buildRequest(request);
}
//---------------------------------------------------------------------------
uint32_t HTTP::getPort() const
// Gets the port
{
    return _settings.port;
}
//---------------------------------------------------------------------------
string HTTP::getAddress() const
// Gets the address
{
    return _settings.hostname;
}
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace memrun
