#include "utils/utils.hpp"
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <utility>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/sha.h>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace memrun {
namespace utils {
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char* hex = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(hex[input[i] >> 4]);
        output.push_back(hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
static bool isUnreserved(char c)
// RFC 3986 unreserved characters
{
    return isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~';
}
//---------------------------------------------------------------------------
string encodeUrlParameters(const string& encode)
// Encodes a string for url
{
    string result;
    for (auto c : encode) {
        if (isUnreserved(c)) {
            result += c;
        } else {
            result += "%";
            result += hexEncode(reinterpret_cast<const uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string encodeUrlPath(string_view path)
// Encodes every path segment, the separators stay
{
    string result;
    result.reserve(path.size());
    for (auto c : path) {
        if (isUnreserved(c) || c == '/') {
            result += c;
        } else {
            result += "%";
            result += hexEncode(reinterpret_cast<const uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string sha256Encode(const uint8_t* data, uint64_t length)
// Encodes the data as sha256 hex string
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestUpdate(mdctx.get(), data, length) <= 0)
        throw runtime_error("OpenSSL Error!");

    unsigned digestLength = SHA256_DIGEST_LENGTH;
    if (EVP_DigestFinal_ex(mdctx.get(), hash, &digestLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    return hexEncode(hash, SHA256_DIGEST_LENGTH);
}
//---------------------------------------------------------------------------
pair<unique_ptr<uint8_t[]>, uint64_t> hmacSign(const uint8_t* keyData, uint64_t keyLength, const uint8_t* msgData, uint64_t msgLength)
// Encodes the msg with the key with hmac-sha256
{
    unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)> mac(EVP_MAC_fetch(nullptr, "HMAC", nullptr), EVP_MAC_free);
    if (!mac)
        throw runtime_error("OpenSSL Error!");

    OSSL_PARAM params[2];
    string digest = "SHA2-256";
    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest.data(), digest.size());
    params[1] = OSSL_PARAM_construct_end();

    unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)> mctx(EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free);
    if (!mctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_MAC_init(mctx.get(), keyData, keyLength, params) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_MAC_update(mctx.get(), msgData, msgLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    size_t len;
    if (EVP_MAC_final(mctx.get(), nullptr, &len, 0) <= 0)
        throw runtime_error("OpenSSL Error!");

    auto hash = make_unique<uint8_t[]>(len);
    if (EVP_MAC_final(mctx.get(), hash.get(), &len, len) <= 0)
        throw runtime_error("OpenSSL Error!");

    return {move(hash), len};
}
//---------------------------------------------------------------------------
string replaceAll(string_view input, string_view needle, string_view replacement)
// Replaces all occurrences, an empty needle leaves the input untouched
{
    if (needle.empty())
        return string(input);
    string result;
    result.reserve(input.size());
    size_t pos = 0;
    while (true) {
        auto found = input.find(needle, pos);
        if (found == string_view::npos)
            break;
        result.append(input.substr(pos, found - pos));
        result.append(replacement);
        pos = found + needle.size();
    }
    result.append(input.substr(pos));
    return result;
}
//---------------------------------------------------------------------------
bool equalsIgnoreCase(string_view lhs, string_view rhs)
// Ascii case insensitive equality
{
    if (lhs.size() != rhs.size())
        return false;
    for (size_t i = 0; i < lhs.size(); i++)
        if (tolower(static_cast<unsigned char>(lhs[i])) != tolower(static_cast<unsigned char>(rhs[i])))
            return false;
    return true;
}
//---------------------------------------------------------------------------
bool parseUnsigned(string_view input, uint64_t& result)
// Parses a decimal number
{
    if (input.empty())
        return false;
    auto end = input.data() + input.size();
    auto [ptr, ec] = from_chars(input.data(), end, result);
    return ec == errc() && ptr == end;
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace memrun
