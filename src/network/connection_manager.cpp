#include "network/connection_manager.hpp"
#ifdef MEMRUN_HAS_IO_URING
#include "network/io_uring_socket.hpp"
#endif
#include "network/poll_socket.hpp"
#include "network/tls_connection.hpp"
#include "network/tls_context.hpp"
#include "utils/log.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
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
ConnectionManager::ConnectionManager([[maybe_unused]] unsigned uringEntries, bool verifyPeer)
// The constructor
{
#ifdef MEMRUN_HAS_IO_URING
    // Init fails on kernels without the uring syscall or the required features
    try {
        _socketWrapper = make_unique<IOUringSocket>(uringEntries);
    } catch (const runtime_error& error) {
        utils::Log::debug("io_uring unavailable, falling back to poll: ", error.what());
        _socketWrapper = make_unique<PollSocket>();
    }
#else
    _socketWrapper = make_unique<PollSocket>();
#endif
    _context = make_unique<TLSContext>(verifyPeer);
}
//---------------------------------------------------------------------------
const addrinfo* ConnectionManager::resolve(const string& hostname, uint32_t port)
// Resolves the address once per host and port
{
    auto key = hostname + ":" + to_string(port);
    if (auto it = _dns.find(key); it != _dns.end())
        return it->second->addr.get();

    addrinfo hints = {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    addrinfo* temp = nullptr;
    auto portString = to_string(port);
    if (auto res = getaddrinfo(hostname.c_str(), portString.c_str(), &hints, &temp); res != 0)
        throw runtime_error("hostname getaddrinfo error for " + hostname + ": " + gai_strerror(res));
    auto entry = make_unique<DnsEntry>(unique_ptr<addrinfo, decltype(&freeaddrinfo)>(temp, &freeaddrinfo));
    auto addr = entry->addr.get();
    _dns.emplace(move(key), move(entry));
    return addr;
}
//---------------------------------------------------------------------------
void ConnectionManager::configure(int32_t fd, const TCPSettings& tcpSettings)
// Settings for the socket
{
    auto option = [fd](int level, int name, const int& value, const char* description) {
        if (value > 0 && setsockopt(fd, level, name, &value, sizeof(value)))
            throw runtime_error(string("Socket creation error! - ") + description + " error: " + strerror(errno));
    };

    // No blocking mode
    if (tcpSettings.nonBlocking > 0) {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
            throw runtime_error("Socket creation error! - non blocking error");
    }
    // The socket must not leak into the launched program
    if (fcntl(fd, F_SETFD, FD_CLOEXEC) < 0)
        throw runtime_error("Socket creation error! - close on exec error");

    option(SOL_SOCKET, SO_KEEPALIVE, tcpSettings.keepAlive, "keep alive");
    option(SOL_TCP, TCP_KEEPIDLE, tcpSettings.keepIdle, "keep idle");
    option(SOL_TCP, TCP_KEEPINTVL, tcpSettings.keepIntvl, "keep intvl");
    option(SOL_TCP, TCP_KEEPCNT, tcpSettings.keepCnt, "keep cnt");
    option(SOL_TCP, TCP_NODELAY, tcpSettings.noDelay, "nodelay");
    option(SOL_SOCKET, SO_RCVBUF, tcpSettings.recvBuffer, "recvbuf");
    option(SOL_TCP, TCP_LINGER2, tcpSettings.linger, "linger timeout");
}
//---------------------------------------------------------------------------
int32_t ConnectionManager::connect(const string& hostname, uint32_t port, bool tls, const TCPSettings& tcpSettings)
// Creates a new socket connection
{
    auto addr = resolve(hostname, port);
    auto fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (fd == -1)
        throw runtime_error("Socket creation error! " + string(strerror(errno)));

    try {
        configure(fd, tcpSettings);

        // Connect to remote, the non blocking connect is awaited with poll
        auto connectRes = ::connect(fd, addr->ai_addr, addr->ai_addrlen);
        if (connectRes < 0 && errno != EINPROGRESS)
            throw runtime_error("Socket creation error! " + string(strerror(errno)));
        if (connectRes < 0) {
            pollfd pollEvent = {fd, POLLOUT, 0};
            auto t = poll(&pollEvent, 1, static_cast<int>(tcpSettings.timeout.count()));
            if (t != 1)
                throw runtime_error("Socket creation error! Timeout reached");
            int socketError;
            socklen_t socketErrorLen = sizeof(socketError);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &socketError, &socketErrorLen))
                throw runtime_error("Socket creation error! Could not retrieve socket options!");
            if (socketError)
                throw runtime_error("Socket creation error! " + string(strerror(socketError)));
        }
    } catch (const runtime_error&) {
        close(fd);
        throw;
    }

    auto socketEntry = make_unique<SocketEntry>();
    socketEntry->fd = fd;
    socketEntry->hostname = hostname;
    if (tls)
        socketEntry->tls = make_unique<TLSConnection>(*_context);
    _fdSockets.emplace(fd, move(socketEntry));
    utils::Log::trace("Connected to ", hostname, ":", port, " on fd ", fd);
    return fd;
}
//---------------------------------------------------------------------------
void ConnectionManager::disconnect(int32_t fd)
// Closes the socket
{
    auto socketIt = _fdSockets.find(fd);
    if (socketIt == _fdSockets.end())
        return;
    _fdSockets.erase(socketIt);
    close(fd);
}
//---------------------------------------------------------------------------
TLSConnection* ConnectionManager::getTLSConnection(int32_t fd)
// Get the tls connection of the fd
{
    auto it = _fdSockets.find(fd);
    assert(it != _fdSockets.end());
    return it->second->tls.get();
}
//---------------------------------------------------------------------------
ConnectionManager::~ConnectionManager()
// The destructor
{
    for (auto& f : _fdSockets)
        close(f.first);
    _fdSockets.clear();
}
//---------------------------------------------------------------------------
} // namespace memrun::network
