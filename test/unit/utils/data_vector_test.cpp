#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <utility>
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
TEST_CASE("data_vector") {
    DataVector<uint64_t> dv;
    dv.reserve(1);
    *dv.data() = 42;
    REQUIRE(dv.size() == 0);
    REQUIRE(dv.empty());
    dv.resize(1);
    REQUIRE(*dv.cdata() == 42);
    REQUIRE(dv.capacity() == 1);
    dv.resize(2);
    *(dv.data() + 1) = 43;
    REQUIRE(dv.size() == 2);
    REQUIRE(dv.capacity() == 2);
    REQUIRE(*dv.cdata() == 42);
    REQUIRE(*(dv.cdata() + 1) == 43);

    auto view = dv.view(1, 1);
    REQUIRE(view.size() == 1);
    REQUIRE(view[0] == 43);

    auto dv2 = std::move(dv);
    REQUIRE(dv2.size() == 2);
    REQUIRE(dv2.capacity() == 2);
    REQUIRE(*(dv2.cdata() + 1) == 43);

    dv2.clear();
    REQUIRE(dv2.empty());
    REQUIRE(dv2.capacity() == 2);
}
//---------------------------------------------------------------------------
TEST_CASE("data_vector_range") {
    const uint8_t bytes[] = {1, 2, 3, 4};
    DataVector<uint8_t> dv(bytes, bytes + 4);
    REQUIRE(dv.size() == 4);
    REQUIRE(dv.cdata()[3] == 4);
    dv.reserve(16);
    REQUIRE(dv.size() == 4);
    REQUIRE(dv.cdata()[0] == 1);
}
//---------------------------------------------------------------------------
} // namespace memrun::utils::test
