#ifdef MEMRUN_HAS_IO_URING
#include "network/io_uring_socket.hpp"
#include <cassert>
#include <cstring>
#include <stdexcept>
#include <sys/socket.h>
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
using namespace std;
//---------------------------------------------------------------------------
IOUringSocket::IOUringSocket(uint32_t entries)
// Constructor that inits uring queue
{
    struct io_uring_params params;
    memset(&params, 0, sizeof(params));

    if (io_uring_queue_init_params(entries, &_uring, &params) < 0)
        throw runtime_error("Uring init error!");

    if (!(params.features & IORING_FEAT_FAST_POLL)) {
        io_uring_queue_exit(&_uring);
        throw runtime_error("Uring init error - IORING_FEAT_FAST_POLL not available in the kernel!");
    }
}
//---------------------------------------------------------------------------
io_uring_sqe* IOUringSocket::prepare(Request& req, int32_t msg_flags)
// Prepare a submission (sqe)
{
    assert(req.length > 0);
    auto sqe = io_uring_get_sqe(&_uring);
    if (!sqe)
        return nullptr;
    if (req.event == EventType::read)
        io_uring_prep_recv(sqe, req.fd, req.data.data, static_cast<size_t>(req.length), msg_flags);
    else
        io_uring_prep_send(sqe, req.fd, req.data.cdata, static_cast<size_t>(req.length), msg_flags | MSG_NOSIGNAL);
    io_uring_sqe_set_data(sqe, &req);
    return sqe;
}
//---------------------------------------------------------------------------
bool IOUringSocket::linkTimeout(io_uring_sqe* sqe, Request& req, chrono::milliseconds timeout)
// The timeout cancels the linked sqe
{
    if (timeout.count() <= 0)
        return true;
    sqe->flags |= IOSQE_IO_LINK;
    req.kernelTimeout.tv_sec = timeout.count() / 1000;
    req.kernelTimeout.tv_nsec = (timeout.count() % 1000) * 1000 * 1000;
    auto timeoutSqe = io_uring_get_sqe(&_uring);
    if (!timeoutSqe)
        return false;
    io_uring_prep_link_timeout(timeoutSqe, &req.kernelTimeout, 0);
    io_uring_sqe_set_data(timeoutSqe, nullptr);
    return true;
}
//---------------------------------------------------------------------------
bool IOUringSocket::send(Request& req, chrono::milliseconds timeout, int32_t msg_flags)
// Prepare a submission send with timeout
{
    if (req.event != EventType::write)
        return false;
    auto sqe = prepare(req, msg_flags);
    return sqe && linkTimeout(sqe, req, timeout);
}
//---------------------------------------------------------------------------
bool IOUringSocket::recv(Request& req, chrono::milliseconds timeout, int32_t msg_flags)
// Prepare a submission recv with timeout
{
    if (req.event != EventType::read)
        return false;
    auto sqe = prepare(req, msg_flags);
    return sqe && linkTimeout(sqe, req, timeout);
}
//---------------------------------------------------------------------------
IOUringSocket::Request* IOUringSocket::complete()
// Get a completion (cqe) event and mark it as seen; return the SQE attached Request
{
    io_uring_cqe* cqe;
    auto res = io_uring_wait_cqe(&_uring, &cqe);
    if (res)
        throw runtime_error("io_uring_wait_cqe error!");
    auto req = static_cast<Request*>(io_uring_cqe_get_data(cqe));
    if (req)
        req->length = cqe->res;
    io_uring_cqe_seen(&_uring, cqe);
    return req;
}
//---------------------------------------------------------------------------
int32_t IOUringSocket::submit()
// Submit uring to the kernel and return the number of submitted entries
{
    return io_uring_submit(&_uring);
}
//---------------------------------------------------------------------------
IOUringSocket::~IOUringSocket() noexcept
// The destructor
{
    io_uring_queue_exit(&_uring);
}
//---------------------------------------------------------------------------
} // namespace memrun::network
#endif
