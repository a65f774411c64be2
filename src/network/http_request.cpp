#include "network/http_request.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <stdexcept>
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
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static void parseQueries(string_view queries, HttpRequest& request)
// Splits key=value&key2=value2
{
    while (true) {
        auto queryPos = queries.find('&');
        auto query = queryPos == queries.npos ? queries : queries.substr(0, queryPos);

        // the value is optional
        auto keyPos = query.find('=');
        string_view key = query, value = "";
        if (keyPos != query.npos) {
            key = query.substr(0, keyPos);
            value = query.substr(keyPos + 1);
        }
        if (!key.empty())
            request.queries.emplace(key, value);
        if (queryPos == queries.npos)
            break;
        queries = queries.substr(queryPos + 1);
    }
}
//---------------------------------------------------------------------------
HttpRequest HttpRequest::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ": ";

    HttpRequest request;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpRequest: Incomplete header!");

        auto line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (firstLine)
                throw runtime_error("Invalid HttpRequest: Missing first line!");
            break;
        }
        if (!firstLine) {
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpRequest: Headers need key and value!");
            request.headers.emplace(line.substr(0, keyPos), line.substr(keyPos + strHeaderSeperator.size()));
            continue;
        }
        firstLine = false;

        // method
        auto methodEnd = line.find(' ');
        if (methodEnd == line.npos)
            throw runtime_error("Invalid HttpRequest: Needs to start with request method!");
        auto method = line.substr(0, methodEnd);
        if (method == getRequestMethod(Method::GET))
            request.method = Method::GET;
        else if (method == getRequestMethod(Method::HEAD))
            request.method = Method::HEAD;
        else
            throw runtime_error("Invalid HttpRequest: Unsupported request method!");
        line = line.substr(methodEnd + 1);

        // path and query, requires the http type
        auto pathEnd = line.find(' ');
        if (pathEnd == line.npos)
            throw runtime_error("Invalid HttpRequest: Could not find path, or missing HTTP type!");
        auto pathQuery = line.substr(0, pathEnd);
        line = line.substr(pathEnd + 1);
        auto queriesPos = pathQuery.find('?');
        request.path = pathQuery.substr(0, queriesPos);
        if (queriesPos != pathQuery.npos)
            parseQueries(pathQuery.substr(queriesPos + 1), request);

        if (line.starts_with(strHttp1_0))
            request.type = Type::HTTP_1_0;
        else if (line.starts_with(strHttp1_1))
            request.type = Type::HTTP_1_1;
        else
            throw runtime_error("Invalid HttpRequest: Needs to be a HTTP type 1.0 or 1.1!");
    }
    return request;
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> HttpRequest::serialize(const HttpRequest& request)
// Serialize an http header
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " " + request.path;
    if (!request.queries.empty())
        httpHeader += "?";
    for (auto it = request.queries.begin(); it != request.queries.end(); ++it) {
        if (it != request.queries.begin())
            httpHeader += "&";
        httpHeader += utils::encodeUrlParameters(it->first) + "=" + utils::encodeUrlParameters(it->second);
    }
    httpHeader += " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    auto begin = reinterpret_cast<const uint8_t*>(httpHeader.data());
    return make_unique<utils::DataVector<uint8_t>>(begin, begin + httpHeader.size());
}
//---------------------------------------------------------------------------
}; // namespace network
}; // namespace memrun
