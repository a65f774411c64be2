#pragma once
#include "download/download_plan.hpp"
#include "utils/data_vector.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
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
/// Identifies the remote object
struct ObjectLocator {
    /// The bucket
    std::string bucket;
    /// The key
    std::string key;
};
//---------------------------------------------------------------------------
/// The settled result of one ranged fetch
struct ChunkResult {
    /// The requested range
    ByteRange range;
    /// The received buffer, may contain a protocol header in front of the body
    std::unique_ptr<utils::DataVector<uint8_t>> buffer;
    /// Body offset inside the buffer
    uint64_t bodyOffset = 0;
    /// Body length
    uint64_t bodyLength = 0;
    /// Failure description, empty on success
    std::string error;

    /// Did the fetch succeed
    [[nodiscard]] bool success() const { return error.empty() && buffer; }
    /// The body
    [[nodiscard]] std::span<const uint8_t> body() const {
        if (!buffer)
            return {};
        return buffer->view(bodyOffset, bodyLength);
    }
};
//---------------------------------------------------------------------------
/// The remote storage the downloader reads from
class ObjectStore {
    public:
    /// Invoked exactly once per ranged fetch, possibly on another thread
    using Completion = std::function<void(ChunkResult&& result)>;

    /// Destructor
    virtual ~ObjectStore() = default;
    /// The object size in bytes, throws MetadataError
    [[nodiscard]] virtual uint64_t headSize(const ObjectLocator& locator) = 0;
    /// Starts an asynchronous fetch of the inclusive range
    virtual void rangedGet(const ObjectLocator& locator, const ByteRange& range, Completion completion) = 0;
};
//---------------------------------------------------------------------------
} // namespace memrun::download
