#pragma once
#include "network/http_response.hpp"
#include <cstdint>
#include <memory>
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
/// Detects the framing of http responses
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        Unknown,
        ContentLength,
        ChunkedEncoding
    };

    struct Info {
        /// The response header
        HttpResponse response;
        /// The body length, for HEAD responses the announced object size
        uint64_t length = 0;
        /// The header length
        uint32_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::Unknown;
        /// Response to a HEAD request, no body follows the header
        bool headResponse = false;
    };

    private:
    /// Detect the protocol of a complete header
    [[nodiscard]] static Info detect(std::string_view header, bool headRequest);

    public:
    /// Retrieve the body without http meta info
    [[nodiscard]] static std::string_view retrieveContent(const uint8_t* data, uint64_t length, std::unique_ptr<Info>& info);
    /// Detect end of the response, false while the header is still incomplete
    [[nodiscard]] static bool finished(const uint8_t* data, uint64_t length, std::unique_ptr<Info>& info, bool headRequest = false);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace memrun
