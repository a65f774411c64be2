#pragma once
#include "network/socket.hpp"
#include <chrono>
#include <unordered_map>
#include <vector>
#include <sys/poll.h>
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
/// Exchanges messages with the poll interface.
/// Completions follow the io_uring semantics, errors are reported as -errno.
class PollSocket : public Socket {
    private:
    /// The request infos with timeout and message flags
    struct RequestInfo {
        /// The real request
        Request* request;
        /// The deadline
        std::chrono::steady_clock::time_point timeout;
        /// The flags
        int32_t flags;
    };
    /// The ready request vector
    std::vector<Request*> _ready;
    /// The fd to request mapping
    std::unordered_map<int, RequestInfo> _fdToRequest;
    /// The pollfd vector
    std::vector<pollfd> _pollfds;
    /// The submitted requests since last invocation
    int32_t _submitted = 0;
    /// The number of ready fds of the last poll
    int _readyFds = 0;

    public:
    /// The destructor
    ~PollSocket() noexcept override = default;

    /// Prepare a submission send with timeout
    bool send(Request& req, std::chrono::milliseconds timeout, int32_t msg_flags = 0) override;
    /// Prepare a submission recv with timeout
    bool recv(Request& req, std::chrono::milliseconds timeout, int32_t msg_flags = 0) override;

    /// Get a completion event and mark it as seen; return the Request
    [[nodiscard]] Request* complete() override;
    /// Submit the requests
    int32_t submit() override;

    private:
    /// Add the fd to our submission queue
    bool enqueue(Request& req, short events, std::chrono::steady_clock::time_point timeout, int32_t flags);
};
//---------------------------------------------------------------------------
} // namespace memrun::network
