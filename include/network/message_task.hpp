#pragma once
#include "network/connection_manager.hpp"
#include "network/message_result.hpp"
#include "network/original_message.hpp"
#include "network/socket.hpp"
#include <cstdint>
#include <memory>
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
/// This implements a message task
/// After each execute invocation a new request was added to the socket queue and requires submission
/// A failed message is aborted, there are no retries
struct MessageTask {
    /// Type of the message task
    enum class Type : uint8_t {
        HTTP,
        HTTPS
    };

    /// Original sending message
    OriginalMessage* originalMessage;
    /// The TCP Settings
    const ConnectionManager::TCPSettings& tcpSettings;
    /// The connection, -1 if not connected
    int32_t fd;
    /// The pending socket request
    std::unique_ptr<Socket::Request> request;
    /// The offset in the send buffer
    int64_t sendBufferOffset;
    /// The offset in the receive buffer
    int64_t receiveBufferOffset;
    /// The chunksize
    uint32_t chunkSize;
    /// The message task class
    Type type;
    /// Expect a header only response
    bool headRequest;

    /// The pure virtual callback
    virtual MessageState execute(ConnectionManager& connectionManager) = 0;
    /// The pure virtual destructor
    virtual ~MessageTask() = default;

    /// Builds the message task according to the sending message
    static std::unique_ptr<MessageTask> buildMessageTask(OriginalMessage* sendingMessage, const ConnectionManager::TCPSettings& tcpSettings, uint32_t chunkSize);

    protected:
    /// The constructor
    MessageTask(OriginalMessage* sendingMessage, const ConnectionManager::TCPSettings& tcpSettings, uint32_t chunkSize);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace memrun
