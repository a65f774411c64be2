#pragma once
#ifndef MEMRUN_HAS_IO_URING
#error "You must not include io_uring_socket.hpp when building without uring support"
#endif
#include "network/socket.hpp"
#include <liburing.h>
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
/// Exchanges messages with io_uring for minimizing syscalls
class IOUringSocket : public Socket {
    private:
    /// The uring buffer
    struct io_uring _uring;

    public:
    /// The IO Uring Socket Constructor
    explicit IOUringSocket(uint32_t entries);
    /// The destructor
    ~IOUringSocket() noexcept override;

    /// Prepare a submission send with a linked timeout
    bool send(Request& req, std::chrono::milliseconds timeout, int32_t msg_flags = 0) override;
    /// Prepare a submission recv with a linked timeout
    bool recv(Request& req, std::chrono::milliseconds timeout, int32_t msg_flags = 0) override;

    /// Get a completion (cqe) event and mark it as seen; nullptr for timeout events
    [[nodiscard]] Request* complete() override;
    /// Submit uring to the kernel and return the number of submitted entries
    int32_t submit() override;

    private:
    /// Prepare a send or recv sqe
    io_uring_sqe* prepare(Request& req, int32_t msg_flags);
    /// Link a timeout to the last sqe
    bool linkTimeout(io_uring_sqe* sqe, Request& req, std::chrono::milliseconds timeout);
};
//---------------------------------------------------------------------------
} // namespace memrun::network
