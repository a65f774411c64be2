#pragma once
#include <cassert>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
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
namespace memrun::utils {
//---------------------------------------------------------------------------
#ifndef NDEBUG
#define verify(expression) assert(expression)
#else
#define verify(expression) ((void) (expression))
#endif
//---------------------------------------------------------------------------
/// Encode url special characters in %HEX
std::string encodeUrlParameters(const std::string& encode);
/// Encode an object key for the request path, keeps the slashes
std::string encodeUrlPath(std::string_view path);
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Build sha256 of the data encoded as hex
std::string sha256Encode(const uint8_t* data, uint64_t length);
/// Sign with hmac and return sha256 encoded signature
std::pair<std::unique_ptr<uint8_t[]>, uint64_t> hmacSign(const uint8_t* keyData, uint64_t keyLength, const uint8_t* msgData, uint64_t msgLength);
/// Replace every occurrence of needle in input
std::string replaceAll(std::string_view input, std::string_view needle, std::string_view replacement);
/// Case insensitive comparison of ascii strings
bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs);
/// Parse an unsigned decimal number, the full input needs to be consumed
bool parseUnsigned(std::string_view input, uint64_t& result);
//---------------------------------------------------------------------------
} // namespace memrun::utils
