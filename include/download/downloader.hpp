#pragma once
#include "download/download_plan.hpp"
#include "download/object_store.hpp"
#include <cstdint>
#include <functional>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::memory {
class MemoryBuffer;
} // namespace memrun::memory
//---------------------------------------------------------------------------
namespace memrun::download {
//---------------------------------------------------------------------------
/// Snapshot after one range settled
struct Progress {
    /// Ranges written
    uint64_t completedRanges;
    /// All ranges
    uint64_t totalRanges;
    /// Bytes written
    uint64_t completedBytes;
    /// Object size
    uint64_t totalBytes;
};
//---------------------------------------------------------------------------
/// Plans and runs the ranged fetches of one object into a memory buffer.
///
/// execute admits at most plan.concurrency fetches at a time. A slot is taken
/// before a fetch is issued and returned as soon as the fetch settles, before
/// its body is written. Every range is written to its own offset, writes of
/// different ranges never overlap, so completion order does not matter.
/// After the first failure no new range is admitted, the admitted ones run to
/// completion and the first error is rethrown.
class Downloader {
    public:
    /// Called from the thread that settled a range
    using ProgressCallback = std::function<void(const Progress& progress)>;

    private:
    /// The store
    ObjectStore& _store;
    /// The object
    ObjectLocator _locator;
    /// Optional progress listener
    ProgressCallback _progress;

    public:
    /// Constructor
    Downloader(ObjectStore& store, ObjectLocator locator);

    /// Set the progress listener
    void setProgressCallback(ProgressCallback progress) { _progress = std::move(progress); }
    /// The locator
    [[nodiscard]] const ObjectLocator& getLocator() const { return _locator; }

    /// Looks up the size and partitions the object, throws MetadataError
    [[nodiscard]] DownloadPlan plan() const;
    /// Fetches all ranges into the buffer, throws AllocationError, TransferError or WriteError
    void execute(const DownloadPlan& plan, memory::MemoryBuffer& buffer) const;
};
//---------------------------------------------------------------------------
} // namespace memrun::download
