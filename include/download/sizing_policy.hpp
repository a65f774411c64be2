#pragma once
#include <cstdint>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::download {
//---------------------------------------------------------------------------
/// Maps the object size to the ranged fetch size and the number of fetches in flight
struct SizingPolicy {
    /// Targeted number of ranges per object
    static constexpr uint64_t targetChunks = 75;
    /// Smallest range size
    static constexpr uint64_t minChunkSize = 4ull << 20;
    /// Largest range size
    static constexpr uint64_t maxChunkSize = 128ull << 20;
    /// Minimal concurrency, used up to half a GiB
    static constexpr unsigned minConcurrency = 4;
    /// Maximal concurrency, used from 10 GiB on
    static constexpr unsigned maxConcurrency = 16;
    /// Upper size (GiB) of the minimal concurrency
    static constexpr double lowerBoundGiB = 0.5;
    /// Lower size (GiB) of the maximal concurrency
    static constexpr double upperBoundGiB = 10.0;

    /// The range size, totalSize / 75 clamped to [4 MiB, 128 MiB]
    [[nodiscard]] static uint64_t computeChunkSize(uint64_t totalSize);
    /// The concurrency, interpolated linearly between the bounds
    [[nodiscard]] static unsigned computeConcurrency(uint64_t totalSize);
};
//---------------------------------------------------------------------------
} // namespace memrun::download
