#pragma once
#include <cstdint>
#include <string>
#include <vector>
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
/// Inclusive byte range of the object
struct ByteRange {
    /// First byte
    uint64_t start;
    /// Last byte
    uint64_t end;

    /// Number of bytes
    [[nodiscard]] uint64_t length() const { return end - start + 1; }
    /// The http range header value
    [[nodiscard]] std::string toHeader() const;
    /// Equality
    bool operator==(const ByteRange&) const = default;
};
//---------------------------------------------------------------------------
/// The immutable partition of an object into ranged fetches
struct DownloadPlan {
    /// The object size
    uint64_t totalSize = 0;
    /// The size of all but the last range
    uint64_t chunkSize = 0;
    /// The fetches in flight
    unsigned concurrency = 0;
    /// Contiguous ranges covering [0, totalSize)
    std::vector<ByteRange> ranges;

    /// Builds the plan for an object of totalSize bytes using the sizing policy
    [[nodiscard]] static DownloadPlan build(uint64_t totalSize);
    /// Splits [0, totalSize) into ceil(totalSize / chunkSize) ranges
    [[nodiscard]] static std::vector<ByteRange> partition(uint64_t totalSize, uint64_t chunkSize);
    /// Checks that the ranges cover the object exactly once
    [[nodiscard]] bool isValid() const;
    /// Equality
    bool operator==(const DownloadPlan&) const = default;
};
//---------------------------------------------------------------------------
} // namespace memrun::download
