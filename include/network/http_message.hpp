#pragma once
#include "network/connection_manager.hpp"
#include "network/http_helper.hpp"
#include "network/message_task.hpp"
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
namespace memrun::network {
//---------------------------------------------------------------------------
/// Implements a http message roundtrip
struct HTTPMessage : public MessageTask {
    /// HTTP info header
    std::unique_ptr<HttpHelper::Info> info;

    /// The constructor
    HTTPMessage(OriginalMessage* sendingMessage, const ConnectionManager::TCPSettings& tcpSettings, uint32_t chunkSize);
    /// The destructor
    ~HTTPMessage() override = default;
    /// The message execute callback
    MessageState execute(ConnectionManager& connectionManager) override;

    protected:
    /// Opens the connection, false if aborted
    bool open(ConnectionManager& connectionManager, bool tls);
    /// Checks the received bytes for a complete response, true if the message is done
    bool checkReceived(ConnectionManager& connectionManager);
    /// Grows the receive buffer for the next chunk and returns the write position
    uint8_t* prepareReceive();
    /// Marks the message as failed and closes the connection
    MessageState abort(ConnectionManager& connectionManager, MessageFailureCode code);
    /// Closes the connection
    void close(ConnectionManager& connectionManager);
};
//---------------------------------------------------------------------------
} // namespace memrun::network
