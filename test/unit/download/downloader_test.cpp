#include "download/downloader.hpp"
#include "download/fake_object_store.hpp"
#include "memory/memory_buffer.hpp"
#include "utils/error.hpp"
#include <catch2/catch.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <unistd.h>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::download::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static vector<uint8_t> readBack(const memory::MemoryBuffer& buffer)
// Reads the buffer through its descriptor
{
    auto reference = buffer.resolveReference();
    vector<uint8_t> content(buffer.size());
    uint64_t offset = 0;
    while (offset < content.size()) {
        auto res = ::pread(reference.getDescriptor(), content.data() + offset, content.size() - offset, static_cast<off_t>(offset));
        REQUIRE(res > 0);
        offset += static_cast<uint64_t>(res);
    }
    return content;
}
//---------------------------------------------------------------------------
TEST_CASE("downloader_scenario") {
    FakeObjectStore store(10000000);
    Downloader downloader(store, {"models", "llama.gguf"});

    vector<Progress> progress;
    mutex progressMutex;
    downloader.setProgressCallback([&](const Progress& p) {
        lock_guard lock(progressMutex);
        progress.push_back(p);
    });

    auto plan = downloader.plan();
    REQUIRE(plan.ranges.size() == 3);
    REQUIRE(plan.concurrency == 4);

    auto buffer = memory::MemoryBuffer::create("downloader_test");
    downloader.execute(plan, buffer);
    REQUIRE(buffer.size() == 10000000);
    REQUIRE(readBack(buffer) == store.object());
    REQUIRE(store.issued == 3);

    REQUIRE(progress.size() == 3);
    REQUIRE(progress.back().totalRanges == 3);
    REQUIRE(progress.back().totalBytes == 10000000);
    uint64_t maxCompleted = 0;
    for (auto& p : progress)
        maxCompleted = max(maxCompleted, p.completedRanges);
    REQUIRE(maxCompleted == 3);
}
//---------------------------------------------------------------------------
TEST_CASE("downloader_bounded_admission") {
    FakeObjectStore store(1000);
    Downloader downloader(store, {"b", "k"});

    DownloadPlan plan;
    plan.totalSize = 1000;
    plan.chunkSize = 10;
    plan.concurrency = 3;
    plan.ranges = DownloadPlan::partition(plan.totalSize, plan.chunkSize);

    auto buffer = memory::MemoryBuffer::create("downloader_test");
    downloader.execute(plan, buffer);
    REQUIRE(store.issued == 100);
    REQUIRE(store.maxInFlight <= 3);
    REQUIRE(store.maxInFlight >= 1);
    REQUIRE(readBack(buffer) == store.object());
}
//---------------------------------------------------------------------------
TEST_CASE("downloader_short_body") {
    FakeObjectStore store(1000);
    store.shortRangeStart = 0;
    store.delay = chrono::milliseconds(2);
    Downloader downloader(store, {"b", "k"});

    DownloadPlan plan;
    plan.totalSize = 1000;
    plan.chunkSize = 50;
    plan.concurrency = 4;
    plan.ranges = DownloadPlan::partition(plan.totalSize, plan.chunkSize);

    auto buffer = memory::MemoryBuffer::create("downloader_test");
    try {
        downloader.execute(plan, buffer);
        FAIL("short body accepted");
    } catch (const utils::TransferError& e) {
        REQUIRE(e.getStart() == 0);
        REQUIRE(e.getEnd() == 49);
    }
    // Admitted siblings were drained, nothing is in flight any more
    REQUIRE(store.issued == store.settled);
    REQUIRE(store.inFlight == 0);
    // No new ranges were admitted after the failure was observed
    REQUIRE(store.issued < plan.ranges.size());
}
//---------------------------------------------------------------------------
TEST_CASE("downloader_stops_admission_after_failure") {
    DownloadPlan plan;
    plan.totalSize = 100;
    plan.chunkSize = 10;
    plan.concurrency = 1;
    plan.ranges = DownloadPlan::partition(plan.totalSize, plan.chunkSize);

    // The single slot only frees up once the failure is recorded
    for (auto run = 0; run < 200; run++) {
        FakeObjectStore store(100);
        store.delay = chrono::microseconds(0);
        if (run % 2)
            store.failRangeStart = 0;
        else
            store.shortRangeStart = 0;
        Downloader downloader(store, {"b", "k"});

        auto buffer = memory::MemoryBuffer::create("downloader_test");
        REQUIRE_THROWS_AS(downloader.execute(plan, buffer), utils::TransferError);
        REQUIRE(store.issued == 1);
        REQUIRE(store.settled == 1);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("downloader_error_result") {
    FakeObjectStore store(1000);
    store.failRangeStart = 500;
    Downloader downloader(store, {"b", "k"});

    DownloadPlan plan;
    plan.totalSize = 1000;
    plan.chunkSize = 100;
    plan.concurrency = 2;
    plan.ranges = DownloadPlan::partition(plan.totalSize, plan.chunkSize);

    auto buffer = memory::MemoryBuffer::create("downloader_test");
    try {
        downloader.execute(plan, buffer);
        FAIL("failed range accepted");
    } catch (const utils::TransferError& e) {
        REQUIRE(e.getStart() == 500);
        REQUIRE(e.getEnd() == 599);
        REQUIRE(string(e.what()).find("HTTP 503 Service Unavailable") != string::npos);
    }
    REQUIRE(store.issued == store.settled);
}
//---------------------------------------------------------------------------
TEST_CASE("downloader_plan_idempotent") {
    FakeObjectStore store(20000003);
    Downloader downloader(store, {"b", "k"});
    auto first = downloader.plan();
    auto second = downloader.plan();
    REQUIRE(first == second);
    REQUIRE(first.isValid());
    REQUIRE(store.heads == 2);
    REQUIRE(store.issued == 0);
}
//---------------------------------------------------------------------------
TEST_CASE("downloader_metadata_error") {
    FakeObjectStore store(10);
    store.failHead = true;
    Downloader downloader(store, {"b", "missing"});
    REQUIRE_THROWS_AS(downloader.plan(), utils::MetadataError);
}
//---------------------------------------------------------------------------
TEST_CASE("downloader_empty_object") {
    FakeObjectStore store(0);
    Downloader downloader(store, {"b", "empty"});
    auto plan = downloader.plan();
    auto buffer = memory::MemoryBuffer::create("downloader_test");
    downloader.execute(plan, buffer);
    REQUIRE(buffer.size() == 0);
    REQUIRE(store.issued == 0);
}
//---------------------------------------------------------------------------
} // namespace memrun::download::test
