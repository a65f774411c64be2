#include "download/sizing_policy.hpp"
#include <algorithm>
#include <cmath>
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
uint64_t SizingPolicy::computeChunkSize(uint64_t totalSize)
// Computes the chunk size
{
    if (!totalSize)
        return minChunkSize;
    return clamp(totalSize / targetChunks, minChunkSize, maxChunkSize);
}
//---------------------------------------------------------------------------
unsigned SizingPolicy::computeConcurrency(uint64_t totalSize)
// Computes the concurrency
{
    auto gb = static_cast<double>(totalSize) / static_cast<double>(1ull << 30);
    if (gb <= lowerBoundGiB)
        return minConcurrency;
    if (gb >= upperBoundGiB)
        return maxConcurrency;
    auto fraction = (gb - lowerBoundGiB) / (upperBoundGiB - lowerBoundGiB);
    return minConcurrency + static_cast<unsigned>(lround(fraction * (maxConcurrency - minConcurrency)));
}
//---------------------------------------------------------------------------
}; // namespace download
}; // namespace memrun
