#pragma once
#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <netdb.h>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace network {
//---------------------------------------------------------------------------
class TLSConnection;
class Socket;
class TLSContext;
//---------------------------------------------------------------------------
// This class opens and closes the sockets and owns their optional tls connection.
// The address resolution is cached per host and port.
// Not thread safe, every event loop owns its own connection manager.
class ConnectionManager {
    public:
    /// The tcp settings
    struct TCPSettings {
        /// flag for nonBlocking
        int nonBlocking = 1;
        /// flag for noDelay
        int noDelay = 0;
        /// flag for recv no wait
        int recvNoWait = 0;
        /// flag for keepAlive
        int keepAlive = 1;
        /// time for tcp keepIdle
        int keepIdle = 1;
        /// time for tcp keepIntvl
        int keepIntvl = 1;
        /// keepalive count before the connection is dropped
        int keepCnt = 1;
        /// recv buffer for tcp
        int recvBuffer = 0;
        /// Lingering of tcp packets
        int linger = 1;
        /// The timeout of a single send, recv or connect
        std::chrono::milliseconds timeout{30 * 1000};
    };

    private:
    /// The resolved addresses of a host
    struct DnsEntry {
        /// The addr
        std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addr;

        /// The constructor
        explicit DnsEntry(std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> address) : addr(std::move(address)) {}
    };
    /// The fd socket entry
    struct SocketEntry {
        /// The optional tls connection
        std::unique_ptr<TLSConnection> tls;
        /// The fd
        int32_t fd;
        /// The hostname
        std::string hostname;
    };

    /// The socket wrapper
    std::unique_ptr<Socket> _socketWrapper;
    /// The active sockets
    std::unordered_map<int32_t, std::unique_ptr<SocketEntry>> _fdSockets;
    /// The resolved addresses, key is host:port
    std::unordered_map<std::string, std::unique_ptr<DnsEntry>> _dns;
    /// The tls context
    std::unique_ptr<TLSContext> _context;

    /// Resolves the address
    const addrinfo* resolve(const std::string& hostname, uint32_t port);
    /// Applies the socket options
    void configure(int32_t fd, const TCPSettings& tcpSettings);

    public:
    /// The constructor
    explicit ConnectionManager(unsigned uringEntries, bool verifyPeer = true);
    /// The destructor
    ~ConnectionManager();

    /// Creates a new socket connection, throws runtime_error
    [[nodiscard]] int32_t connect(const std::string& hostname, uint32_t port, bool tls, const TCPSettings& tcpSettings);
    /// Closes the socket
    void disconnect(int32_t fd);

    /// Get the socket
    Socket& getSocketConnection() {
        assert(_socketWrapper);
        return *_socketWrapper.get();
    }

    /// Get the tls connection of the fd
    TLSConnection* getTLSConnection(int32_t fd);
};
//---------------------------------------------------------------------------
}; // namespace network
}; // namespace memrun
