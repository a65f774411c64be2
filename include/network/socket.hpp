#pragma once
#include <chrono>
#include <cstdint>
#include <linux/time_types.h>
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
struct MessageTask;
//---------------------------------------------------------------------------
/// The asynchronous send and receive interface of the event loop.
/// A completed request carries the transferred bytes or -errno in length.
class Socket {
    public:
    /// Direction of a request
    enum class EventType : uint8_t {
        read = 0,
        write = 1
    };

    /// One pending transfer on a connected descriptor
    struct Request {
        union Data {
            uint8_t* data;
            const uint8_t* cdata;
        };
        /// Target buffer for reads, source buffer for writes
        Data data;
        /// Bytes requested, afterwards bytes moved or -errno
        int64_t length;
        int32_t fd;
        EventType event;
        /// Message that is resumed on completion
        MessageTask* messageTask;
#ifdef MEMRUN_HAS_IO_URING
        /// Linked timeout of the submission
        __kernel_timespec kernelTimeout = {.tv_sec = 0, .tv_nsec = 0};
#endif
    };

    public:
    /// The destructor
    virtual ~Socket() noexcept = default;
    /// Queue a send that is abandoned after timeout
    virtual bool send(Request& req, std::chrono::milliseconds timeout, int32_t msg_flags = 0) = 0;
    /// Queue a recv that is abandoned after timeout
    virtual bool recv(Request& req, std::chrono::milliseconds timeout, int32_t msg_flags = 0) = 0;

    /// Reap one completion, nullptr if the event belongs to the socket itself
    [[nodiscard]] virtual Request* complete() = 0;
    /// Hand the queued requests to the kernel and return how many will complete
    virtual int32_t submit() = 0;
};
//---------------------------------------------------------------------------
} // namespace memrun::network
