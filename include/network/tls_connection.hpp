#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <openssl/types.h>
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
struct HTTPSMessage;
class TLSContext;
class ConnectionManager;
//---------------------------------------------------------------------------
/// Drives OpenSSL over a BIO pair so that all socket traffic goes through
/// the event loop. SSL reads and writes the internal BIO, the network BIO is
/// drained into send requests and filled from recv requests.
//---------------------------------------------------------------------------
class TLSConnection {
    public:
    /// Where a TLS operation stands after one step
    enum class Progress : uint16_t {
        Init,
        SendingInit,
        Sending,
        ReceivingInit,
        Receiving,
        Progress,
        Finished,
        Aborted
    };

    private:
    /// Byte counters of the transfer between the BIO pair and the socket
    struct State {
        // Outgoing: pending in the network BIO, taken from it, written to the socket
        size_t internalBioWrite = 0;
        int64_t networkBioRead = 0;
        size_t socketWrite = 0;
        // Incoming: room in the network BIO, put into it, read from the socket
        size_t internalBioRead = 0;
        int64_t networkBioWrite = 0;
        size_t socketRead = 0;
        Progress progress = Progress::Init;

        void reset() {
            internalBioWrite = 0;
            networkBioRead = 0;
            socketWrite = 0;
            internalBioRead = 0;
            networkBioWrite = 0;
            socketRead = 0;
        }
    };
    /// The message this connection belongs to
    HTTPSMessage* _message;
    TLSContext& _context;
    SSL* _ssl;
    /// SSL side of the pair
    BIO* _internalBio;
    /// Socket side of the pair
    BIO* _networkBio;
    /// Staging buffer between the network BIO and the socket
    std::unique_ptr<char[]> _buffer;
    State _state;
    /// Expected peer name, also sent as SNI
    std::string _hostname;

    public:
    /// The constructor
    explicit TLSConnection(TLSContext& context);
    /// The destructor
    ~TLSConnection();

    /// Initialize SSL for the message, sets SNI and the expected host name
    [[nodiscard]] bool init(HTTPSMessage* message, const std::string& hostname);

    /// Decrypt up to bufferLength bytes of the response
    [[nodiscard]] Progress recv(ConnectionManager& connectionManager, char* buffer, int64_t bufferLength, int64_t& resultLength);
    /// Encrypt and send the request
    [[nodiscard]] Progress send(ConnectionManager& connectionManager, const char* buffer, int64_t bufferLength, int64_t& resultLength);
    /// Run the client handshake
    [[nodiscard]] Progress connect(ConnectionManager& connectionManager);
    /// Keep the session for later connections to the same host
    void cacheSession();

    private:
    /// Release the SSL object and its BIO pair
    void destroy();
    /// Retry an SSL call until it completes or needs socket traffic
    template <typename F>
    Progress operationHelper(ConnectionManager& connectionManager, F&& func, int64_t& result);
    /// Move pending bytes between the network BIO and the socket
    Progress process(ConnectionManager& connectionManager);
};
//---------------------------------------------------------------------------
} // namespace memrun::network
