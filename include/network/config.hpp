#pragma once
#include <chrono>
#include <cstdint>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::network {
//---------------------------------------------------------------------------
/// Config for the number of retriever threads and their requests
struct Config {
    /// Default concurrent requests per retriever thread
    static constexpr unsigned defaultConcurrentRequests = 16;
    /// Default receive chunk size
    static constexpr uint32_t defaultChunkSize = 64u * 1024;
    /// Default number of retriever threads
    static constexpr unsigned defaultRetrievers = 2;

    /// Concurrent requests per retriever thread
    unsigned concurrentRequests = defaultConcurrentRequests;
    /// The receive chunk size
    uint32_t chunkSize = defaultChunkSize;
    /// The number of retriever threads
    unsigned retrievers = defaultRetrievers;
    /// The timeout of a single socket operation
    std::chrono::milliseconds timeout{30 * 1000};
    /// Verify the tls certificate of the server
    bool verifyPeer = true;

    /// Get the total outstanding requests
    constexpr auto totalRequests() const { return retrievers * concurrentRequests; }
};
//---------------------------------------------------------------------------
} // namespace memrun::network
