#include "network/http_response.hpp"
#include "utils/utils.hpp"
#include <stdexcept>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
optional<string_view> HttpResponse::findHeader(string_view key) const
// Header keys are case insensitive
{
    for (auto& header : headers)
        if (utils::equalsIgnoreCase(header.first, key))
            return string_view(header.second);
    return nullopt;
}
//---------------------------------------------------------------------------
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";

    HttpResponse response;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpResponse: Incomplete header!");

        auto line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (firstLine)
                throw runtime_error("Invalid HttpResponse: Missing first line!");
            break;
        }
        if (firstLine) {
            firstLine = false;
            if (line.starts_with(strHttp1_0))
                response.type = Type::HTTP_1_0;
            else if (line.starts_with(strHttp1_1))
                response.type = Type::HTTP_1_1;
            else
                throw runtime_error("Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");

            // status, e.g. "206 Partial Content"
            line = line.substr(strHttp1_1.size());
            while (line.starts_with(' '))
                line.remove_prefix(1);
            uint64_t status;
            if (line.size() < 3 || !utils::parseUnsigned(line.substr(0, 3), status))
                throw runtime_error("Invalid HttpResponse: Missing status code!");
            response.status = static_cast<uint16_t>(status);
            response.code = getCode(response.status);
        } else {
            // headers, optional whitespace around the value
            auto keyPos = line.find(':');
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpResponse: Headers need key and value!");
            auto value = line.substr(keyPos + 1);
            while (value.starts_with(' '))
                value.remove_prefix(1);
            while (value.ends_with(' '))
                value.remove_suffix(1);
            response.headers.emplace(line.substr(0, keyPos), value);
        }
    }
    return response;
}
//---------------------------------------------------------------------------
} // namespace memrun::network
