#include "utils/utils.hpp"
#include <catch2/catch.hpp>
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
namespace memrun::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("utils_crypto") {
    REQUIRE(sha256Encode(nullptr, 0) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    string abc = "abc";
    REQUIRE(sha256Encode(reinterpret_cast<const uint8_t*>(abc.data()), abc.size()) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    string key = "key";
    string msg = "The quick brown fox jumps over the lazy dog";
    auto [hash, length] = hmacSign(reinterpret_cast<const uint8_t*>(key.data()), key.size(), reinterpret_cast<const uint8_t*>(msg.data()), msg.size());
    REQUIRE(hexEncode(hash.get(), length) == "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");

    const uint8_t bytes[] = {0x0a, 0xff};
    REQUIRE(hexEncode(bytes, 2) == "0aff");
    REQUIRE(hexEncode(bytes, 2, true) == "0AFF");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_encoding") {
    REQUIRE(encodeUrlParameters("a b/c") == "a%20b%2Fc");
    REQUIRE(encodeUrlParameters("A-z_0.~") == "A-z_0.~");
    REQUIRE(encodeUrlPath("models/llama 3/model.gguf") == "models/llama%203/model.gguf");
    REQUIRE(encodeUrlPath("a+b=c") == "a%2Bb%3Dc");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_strings") {
    REQUIRE(replaceAll("{{memfd}}:{{memfd}}", "{{memfd}}", "/proc/self/fd/3") == "/proc/self/fd/3:/proc/self/fd/3");
    REQUIRE(replaceAll("-m model", "{{memfd}}", "/x") == "-m model");
    REQUIRE(replaceAll("abc", "", "x") == "abc");
    REQUIRE(replaceAll("aaa", "aa", "b") == "ba");

    REQUIRE(equalsIgnoreCase("Content-Length", "content-length"));
    REQUIRE(!equalsIgnoreCase("Content-Length", "content-lengt"));

    uint64_t value = 0;
    REQUIRE(parseUnsigned("10000000", value));
    REQUIRE(value == 10000000);
    REQUIRE(parseUnsigned("18446744073709551615", value));
    REQUIRE(value == 18446744073709551615ull);
    REQUIRE(!parseUnsigned("", value));
    REQUIRE(!parseUnsigned("12a", value));
    REQUIRE(!parseUnsigned("-1", value));
    REQUIRE(!parseUnsigned("18446744073709551616", value));
}
//---------------------------------------------------------------------------
} // namespace memrun::utils::test
