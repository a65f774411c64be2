#include "download/download_plan.hpp"
#include "download/sizing_policy.hpp"
#include <algorithm>
#include <stdexcept>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace download {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
string ByteRange::toHeader() const
// bytes=start-end
{
    return "bytes=" + to_string(start) + "-" + to_string(end);
}
//---------------------------------------------------------------------------
DownloadPlan DownloadPlan::build(uint64_t totalSize)
// Builds the plan
{
    DownloadPlan plan;
    plan.totalSize = totalSize;
    plan.chunkSize = SizingPolicy::computeChunkSize(totalSize);
    plan.concurrency = SizingPolicy::computeConcurrency(totalSize);
    plan.ranges = partition(totalSize, plan.chunkSize);
    return plan;
}
//---------------------------------------------------------------------------
vector<ByteRange> DownloadPlan::partition(uint64_t totalSize, uint64_t chunkSize)
// Partitions the object, the last range is truncated
{
    if (!chunkSize)
        throw invalid_argument("chunk size must be positive");
    vector<ByteRange> ranges;
    ranges.reserve((totalSize + chunkSize - 1) / chunkSize);
    for (uint64_t start = 0; start < totalSize; start += chunkSize) {
        auto end = min(start + chunkSize, totalSize) - 1;
        ranges.push_back({start, end});
    }
    return ranges;
}
//---------------------------------------------------------------------------
bool DownloadPlan::isValid() const
// Contiguous, non-overlapping and complete
{
    if (!totalSize)
        return ranges.empty();
    if (ranges.empty() || ranges.front().start != 0 || ranges.back().end != totalSize - 1)
        return false;
    uint64_t covered = 0;
    for (size_t i = 0; i < ranges.size(); i++) {
        if (ranges[i].end < ranges[i].start)
            return false;
        if (i && ranges[i].start != ranges[i - 1].end + 1)
            return false;
        covered += ranges[i].length();
    }
    return covered == totalSize;
}
//---------------------------------------------------------------------------
}; // namespace download
}; // namespace memrun
