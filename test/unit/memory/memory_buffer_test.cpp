#include "memory/memory_buffer.hpp"
#include "utils/error.hpp"
#include <catch2/catch.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <numeric>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::memory::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static vector<uint8_t> readPath(const string& path)
// Reads the whole file behind the path
{
    ifstream file(path, ios::binary);
    REQUIRE(file.good());
    return vector<uint8_t>(istreambuf_iterator<char>(file), istreambuf_iterator<char>());
}
//---------------------------------------------------------------------------
TEST_CASE("memory_buffer_write") {
    auto buffer = MemoryBuffer::create("memory_buffer_test");
    REQUIRE(buffer.valid());
    buffer.preallocate(16);
    REQUIRE(buffer.size() == 16);

    // Untouched bytes read as zero
    auto reference = buffer.resolveReference();
    REQUIRE(!reference.isOwning());
    REQUIRE(reference.getPath() == "/proc/self/fd/" + to_string(reference.getDescriptor()));
    REQUIRE(readPath(reference.getPath()) == vector<uint8_t>(16, 0));

    vector<uint8_t> data = {1, 2, 3, 4};
    buffer.writeAt(data, 12);
    auto content = readPath(reference.getPath());
    REQUIRE(content.size() == 16);
    REQUIRE(content[12] == 1);
    REQUIRE(content[15] == 4);

    REQUIRE_THROWS_AS(buffer.writeAt(data, 13), utils::WriteError);
}
//---------------------------------------------------------------------------
TEST_CASE("memory_buffer_write_order") {
    vector<uint8_t> source(1000);
    iota(source.begin(), source.end(), 0);
    vector<pair<uint64_t, uint64_t>> chunks = {{0, 300}, {300, 300}, {600, 300}, {900, 100}};

    vector<uint8_t> expected;
    auto permutations = 0;
    sort(chunks.begin(), chunks.end());
    do {
        auto buffer = MemoryBuffer::create("memory_buffer_test");
        buffer.preallocate(source.size());
        for (auto& [offset, length] : chunks)
            buffer.writeAt(span<const uint8_t>(source.data() + offset, length), offset);
        auto content = readPath(buffer.resolveReference().getPath());
        if (expected.empty())
            expected = content;
        REQUIRE(content == expected);
        permutations++;
    } while (next_permutation(chunks.begin(), chunks.end()));
    REQUIRE(permutations == 24);
    REQUIRE(expected == source);
}
//---------------------------------------------------------------------------
TEST_CASE("memory_buffer_consume") {
    auto buffer = MemoryBuffer::create("memory_buffer_test");
    buffer.preallocate(4);
    vector<uint8_t> data = {9, 8, 7, 6};
    buffer.writeAt(data, 0);

    auto reference = move(buffer).consume();
    REQUIRE(!buffer.valid());
    REQUIRE(reference.isOwning());
    // The descriptor has to survive exec
    auto flags = fcntl(reference.getDescriptor(), F_GETFD);
    REQUIRE(flags >= 0);
    REQUIRE((flags & FD_CLOEXEC) == 0);
    REQUIRE(readPath(reference.getPath()) == data);

    REQUIRE_THROWS_AS(buffer.resolveReference(), utils::AllocationError);
    REQUIRE_THROWS_AS(buffer.writeAt(data, 0), utils::WriteError);

    auto fd = reference.getDescriptor();
    {
        auto moved = move(reference);
        REQUIRE(moved.getDescriptor() == fd);
        REQUIRE(reference.getDescriptor() == -1);
    }
    // The owning reference closed the descriptor
    REQUIRE(fcntl(fd, F_GETFD) == -1);
}
//---------------------------------------------------------------------------
} // namespace memrun::memory::test
