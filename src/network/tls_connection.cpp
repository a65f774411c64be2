#include "network/tls_connection.hpp"
#include "network/connection_manager.hpp"
#include "network/https_message.hpp"
#include "network/socket.hpp"
#include "network/tls_context.hpp"
#include <cassert>
#include <cerrno>
#include <memory>
#include <utility>
#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <sys/socket.h>
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
using namespace std;
//---------------------------------------------------------------------------
TLSConnection::TLSConnection(TLSContext& context) : _message(nullptr), _context(context), _ssl(nullptr), _internalBio(nullptr), _networkBio(nullptr), _state()
// The constructor
{
}
//---------------------------------------------------------------------------
TLSConnection::~TLSConnection()
// The destructor
{
    destroy();
}
//---------------------------------------------------------------------------
bool TLSConnection::init(HTTPSMessage* message, const string& hostname)
// Initialize SSL
{
    assert(!_ssl);
    _message = message;
    _hostname = hostname;
    if (!_context._ctx)
        return false;
    _ssl = SSL_new(_context._ctx);
    if (!_ssl)
        return false;
    SSL_set_connect_state(_ssl);
    if (BIO_new_bio_pair(&_internalBio, _message->chunkSize, &_networkBio, _message->chunkSize) != 1)
        return false;
    SSL_set_bio(_ssl, _internalBio, _internalBio);
    // Server name indication and certificate host check
    if (SSL_set_tlsext_host_name(_ssl, _hostname.c_str()) != 1)
        return false;
    if (_context.verifiesPeer() && SSL_set1_host(_ssl, _hostname.c_str()) != 1)
        return false;
    _context.reuseSession(_hostname, _ssl);
    _buffer = make_unique<char[]>(_message->chunkSize);
    return true;
}
//---------------------------------------------------------------------------
void TLSConnection::destroy()
// Free SSL
{
    _state.reset();
    if (_ssl) {
        // The internal bio is owned by the ssl object
        SSL_free(_ssl);
        _ssl = nullptr;
        _internalBio = nullptr;
    }
    if (_networkBio) {
        BIO_free(_networkBio);
        _networkBio = nullptr;
    }
}
//---------------------------------------------------------------------------
void TLSConnection::cacheSession()
// Keep the session for later connections
{
    if (_ssl)
        _context.cacheSession(_hostname, _ssl);
}
//---------------------------------------------------------------------------
template <typename F>
TLSConnection::Progress TLSConnection::operationHelper(ConnectionManager& connectionManager, F&& func, int64_t& result)
// Helper function that handles the SSL_op calls
{
    while (true) {
        if (_state.progress == Progress::Aborted)
            return Progress::Aborted;
        if (_state.progress != Progress::Finished && _state.progress != Progress::Init) {
            // Continue the shadow layer until the bios are drained
            process(connectionManager);
            if (_state.progress != Progress::Finished && _state.progress != Progress::Aborted)
                return Progress::Progress;
            continue;
        }

        ERR_clear_error();
        auto status = func();
        auto error = SSL_get_error(_ssl, status);
        switch (error) {
            case SSL_ERROR_NONE: {
                result = status;
                return Progress::Finished;
            }
            case SSL_ERROR_WANT_WRITE: // fallthrough
            case SSL_ERROR_WANT_READ: {
                _state.progress = Progress::SendingInit;
                auto progress = process(connectionManager);
                if (progress == Progress::Aborted)
                    return Progress::Aborted;
                // Nothing was pending on the socket side, retry the ssl operation
                if (progress == Progress::Finished)
                    continue;
                return Progress::Progress;
            }
            default: {
                result = status;
                _state.progress = Progress::Aborted;
                return Progress::Aborted;
            }
        }
    }
}
//---------------------------------------------------------------------------
TLSConnection::Progress TLSConnection::recv(ConnectionManager& connectionManager, char* buffer, int64_t bufferLength, int64_t& resultLength)
// Recv a TLS encrypted message
{
    assert(in_range<int>(bufferLength));
    auto ssl = this->_ssl;
    auto sslRead = [ssl, buffer, bufferLength = static_cast<int>(bufferLength)]() {
        return SSL_read(ssl, buffer, bufferLength);
    };
    return operationHelper(connectionManager, sslRead, resultLength);
}
//---------------------------------------------------------------------------
TLSConnection::Progress TLSConnection::send(ConnectionManager& connectionManager, const char* buffer, int64_t bufferLength, int64_t& resultLength)
// Send a TLS encrypted message
{
    assert(in_range<int>(bufferLength));
    auto ssl = this->_ssl;
    auto sslWrite = [ssl, buffer, bufferLength = static_cast<int>(bufferLength)]() {
        return SSL_write(ssl, buffer, bufferLength);
    };
    return operationHelper(connectionManager, sslWrite, resultLength);
}
//---------------------------------------------------------------------------
TLSConnection::Progress TLSConnection::connect(ConnectionManager& connectionManager)
// SSL/TLS connect
{
    int64_t unused;
    auto ssl = this->_ssl;
    auto sslConnect = [ssl]() {
        return SSL_connect(ssl);
    };
    return operationHelper(connectionManager, sslConnect, unused);
}
//---------------------------------------------------------------------------
TLSConnection::Progress TLSConnection::process(ConnectionManager& connectionManager)
// Workhorse for sending and receiving the ssl encrypted messages using the shadow stack
{
    auto& request = _message->request;
    auto fail = [this](MessageFailureCode code) {
        _message->originalMessage->result.failureCode |= static_cast<uint16_t>(code);
        _state.progress = Progress::Aborted;
        return _state.progress;
    };

    switch (_state.progress) {
        case Progress::SendingInit: {
            // Check for send requirements from SSL
            _state.reset();
            _state.internalBioWrite = BIO_ctrl_pending(_networkBio);
            if (_state.internalBioWrite) {
                auto readSize = _message->chunkSize > _state.internalBioWrite ? _state.internalBioWrite : _message->chunkSize;
                assert(in_range<int>(readSize));
                _state.networkBioRead = BIO_read(_networkBio, _buffer.get(), static_cast<int>(readSize));
            }
        } // fallthrough
        case Progress::Sending: {
            // Check for send requirements to the socket
            if (_state.internalBioWrite) {
                // Not the first send part, so check request result
                if (_state.progress == Progress::Sending) {
                    if (request->length > 0) {
                        _state.socketWrite += static_cast<uint64_t>(request->length);
                    } else if (request->length != -EINPROGRESS && request->length != -EAGAIN) {
                        if (request->length == -ETIMEDOUT || request->length == -ECANCELED || request->length == -EINTR)
                            return fail(MessageFailureCode::Timeout);
                        return fail(MessageFailureCode::Send);
                    }
                }
                if (_state.networkBioRead >= 0 && static_cast<size_t>(_state.networkBioRead) != _state.socketWrite) {
                    // As long as not finished
                    _state.progress = Progress::Sending;
                    auto writeSize = static_cast<size_t>(_state.networkBioRead) - _state.socketWrite;
                    const uint8_t* ptr = reinterpret_cast<uint8_t*>(_buffer.get()) + _state.socketWrite;
                    request = make_unique<Socket::Request>(Socket::Request{.data = {.cdata = ptr}, .length = static_cast<int64_t>(writeSize), .fd = _message->fd, .event = Socket::EventType::write, .messageTask = _message});
                    connectionManager.getSocketConnection().send(*request, _message->tcpSettings.timeout);
                    return _state.progress;
                }
            }
            _state.progress = Progress::ReceivingInit;
        } // fallthrough
        case Progress::ReceivingInit: {
            // Check for recv requirements from SSL
            _state.internalBioRead = BIO_ctrl_get_read_request(_networkBio);
        } // fallthrough
        case Progress::Receiving: {
            // Check for recv requirements for the socket
            if (!_state.internalBioRead) {
                _state.progress = Progress::Finished;
                return _state.progress;
            }
            // Not the first recv part, so check request result
            if (_state.progress == Progress::Receiving) {
                if (request->length == 0) {
                    return fail(MessageFailureCode::Empty);
                } else if (request->length > 0) {
                    assert(in_range<int>(request->length));
                    _state.networkBioWrite += BIO_write(_networkBio, _buffer.get() + _state.socketRead, static_cast<int>(request->length));
                    _state.socketRead += static_cast<size_t>(request->length);
                    if (_state.networkBioWrite < 0 || static_cast<size_t>(_state.networkBioWrite) != _state.socketRead)
                        return fail(MessageFailureCode::TLS);
                } else if (request->length != -EINPROGRESS && request->length != -EAGAIN) {
                    if (request->length == -ETIMEDOUT || request->length == -ECANCELED || request->length == -EINTR)
                        return fail(MessageFailureCode::Timeout);
                    return fail(MessageFailureCode::Recv);
                }
            }
            if (!_state.networkBioWrite) {
                _state.progress = Progress::Receiving;
                uint64_t readSize = _message->chunkSize > (_state.internalBioRead - _state.socketRead) ? _state.internalBioRead - _state.socketRead : _message->chunkSize;
                uint8_t* ptr = reinterpret_cast<uint8_t*>(_buffer.get()) + _state.socketRead;
                assert(in_range<int64_t>(readSize));
                request = make_unique<Socket::Request>(Socket::Request{.data = {.data = ptr}, .length = static_cast<int64_t>(readSize), .fd = _message->fd, .event = Socket::EventType::read, .messageTask = _message});
                connectionManager.getSocketConnection().recv(*request, _message->tcpSettings.timeout, _message->tcpSettings.recvNoWait ? MSG_DONTWAIT : 0);
                return _state.progress;
            }
            _state.progress = Progress::Finished;
            return _state.progress;
        }
        default: {
            return _state.progress;
        }
    }
}
//---------------------------------------------------------------------------
}; // namespace network
}; // namespace memrun
