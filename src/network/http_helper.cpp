#include "network/http_helper.hpp"
#include "utils/utils.hpp"
#include <stdexcept>
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
namespace memrun {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static constexpr string_view headerEnd = "\r\n\r\n";
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header, bool headRequest)
// Detect the protocol
{
    Info info;
    info.response = HttpResponse::deserialize(header);
    info.headResponse = headRequest;
    info.headerLength = static_cast<uint32_t>(header.find(headerEnd) + headerEnd.length());

    if (auto encoding = info.response.findHeader("Transfer-Encoding"); encoding && utils::equalsIgnoreCase(*encoding, "chunked")) {
        info.encoding = Encoding::ChunkedEncoding;
    } else if (auto contentLength = info.response.findHeader("Content-Length")) {
        if (!utils::parseUnsigned(*contentLength, info.length))
            throw runtime_error("Invalid Content-Length: " + string(*contentLength));
        info.encoding = Encoding::ContentLength;
    } else if (headRequest || !info.response.success()) {
        // Error responses without framing carry no body we care about
        info.encoding = Encoding::ContentLength;
        info.length = 0;
    } else {
        throw runtime_error("Unsupported HTTP encoding protocol");
    }
    return info;
}
//---------------------------------------------------------------------------
string_view HttpHelper::retrieveContent(const uint8_t* data, uint64_t length, unique_ptr<Info>& info)
// Retrieve the content without http meta info
{
    string_view sv(reinterpret_cast<const char*>(data), length);
    if (!info) {
        if (sv.find(headerEnd) == sv.npos)
            return {};
        info = make_unique<Info>(detect(sv, false));
    }
    if (info->encoding == Encoding::ContentLength && !info->headResponse && length >= info->headerLength + info->length)
        return sv.substr(info->headerLength, info->length);
    return {};
}
//---------------------------------------------------------------------------
bool HttpHelper::finished(const uint8_t* data, uint64_t length, unique_ptr<Info>& info, bool headRequest)
// Detect end / content
{
    if (!info) {
        string_view sv(reinterpret_cast<const char*>(data), length);
        if (sv.find(headerEnd) == sv.npos)
            return false;
        info = make_unique<Info>(detect(sv, headRequest));
    }
    if (info->headResponse)
        return true;
    switch (info->encoding) {
        case Encoding::ContentLength:
            return length >= info->headerLength + info->length;
        case Encoding::ChunkedEncoding: {
            string_view sv(reinterpret_cast<const char*>(data), length);
            auto end = sv.find("0\r\n\r\n"sv, info->headerLength);
            if (end == sv.npos)
                return false;
            info->length = end - info->headerLength;
            return true;
        }
        default: {
            info = nullptr;
            throw runtime_error("Unsupported HTTP transfer protocol");
        }
    }
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace memrun
