#include "network/poll_socket.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
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
bool PollSocket::send(Request& req, chrono::milliseconds timeout, int32_t msg_flags)
// Prepare a submission send with timeout
{
    if (req.event != EventType::write)
        return false;
    auto deadline = timeout.count() > 0 ? chrono::steady_clock::now() + timeout : chrono::steady_clock::time_point::max();
    return enqueue(req, POLLOUT, deadline, msg_flags);
}
//---------------------------------------------------------------------------
bool PollSocket::recv(Request& req, chrono::milliseconds timeout, int32_t msg_flags)
// Prepare a submission recv with timeout
{
    if (req.event != EventType::read)
        return false;
    auto deadline = timeout.count() > 0 ? chrono::steady_clock::now() + timeout : chrono::steady_clock::time_point::max();
    return enqueue(req, POLLIN, deadline, msg_flags);
}
//---------------------------------------------------------------------------
PollSocket::Request* PollSocket::complete()
// Get a completion event and mark it as seen; return the Request
{
    while (_ready.empty()) {
        if (_pollfds.empty())
            throw runtime_error("PollSocket: no pending requests");
        // Poll wait up to 1ms, a stale result of submit is consumed first
        if (_readyFds <= 0) {
            _readyFds = ::poll(_pollfds.data(), _pollfds.size(), 1);
            if (_readyFds < 0 && errno != EINTR)
                throw runtime_error("PollSocket: poll error " + string(strerror(errno)));
        }
        _readyFds = 0;

        auto currentTime = chrono::steady_clock::now();
        for (auto pit = _pollfds.begin(); pit != _pollfds.end();) {
            auto it = _fdToRequest.find(pit->fd);
            if (it == _fdToRequest.end())
                throw runtime_error("PollSocket: couldn't find request");
            auto& info = it->second;
            auto& req = *info.request;
            if (pit->revents & (POLLIN | POLLOUT)) {
                if (req.event == EventType::read)
                    req.length = ::recv(it->first, req.data.data, static_cast<size_t>(req.length), info.flags | MSG_DONTWAIT);
                else
                    req.length = ::send(it->first, req.data.cdata, static_cast<size_t>(req.length), info.flags | MSG_DONTWAIT | MSG_NOSIGNAL);
                if (req.length == -1)
                    req.length = -errno;
            } else if (pit->revents & (POLLERR | POLLHUP | POLLNVAL)) {
                int err = 0;
                socklen_t len = sizeof(err);
                if (::getsockopt(it->first, SOL_SOCKET, SO_ERROR, &err, &len) != 0)
                    err = EIO;
                req.length = err ? -err : -ECONNRESET;
            } else if (info.timeout < currentTime) {
                req.length = -ETIMEDOUT;
            } else {
                pit->revents = 0;
                ++pit;
                continue;
            }
            _ready.push_back(&req);
            _fdToRequest.erase(it);
            pit = _pollfds.erase(pit);
        }
    }
    auto req = _ready.back();
    _ready.pop_back();
    return req;
}
//---------------------------------------------------------------------------
bool PollSocket::enqueue(Request& req, short events, chrono::steady_clock::time_point timeout, int32_t flags)
// One outstanding request per fd
{
    if (_fdToRequest.contains(req.fd))
        return false;
    _pollfds.push_back(pollfd{req.fd, events, 0});
    _fdToRequest.emplace(req.fd, RequestInfo{&req, timeout, flags});
    ++_submitted;
    return true;
}
//---------------------------------------------------------------------------
int32_t PollSocket::submit()
// Submit requests
{
    auto sub = _submitted;
    _submitted = 0;
    // Do the poll here, but don't wait or work on the results
    if (!_pollfds.empty())
        _readyFds = ::poll(_pollfds.data(), _pollfds.size(), 0);
    return sub;
}
//---------------------------------------------------------------------------
} // namespace memrun::network
