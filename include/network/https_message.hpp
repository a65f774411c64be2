#pragma once
#include "network/connection_manager.hpp"
#include "network/http_message.hpp"
#include <cstdint>
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
class TLSConnection;
//---------------------------------------------------------------------------
/// Implements a https message roundtrip
struct HTTPSMessage : public HTTPMessage {
    /// The tls layer, owned by the connection manager
    TLSConnection* tlsLayer;

    /// The constructor
    HTTPSMessage(OriginalMessage* sendingMessage, const ConnectionManager::TCPSettings& tcpSettings, uint32_t chunkSize);
    /// The destructor
    ~HTTPSMessage() override = default;
    /// The message execute callback
    MessageState execute(ConnectionManager& connectionManager) override;
};
//---------------------------------------------------------------------------
} // namespace memrun::network
