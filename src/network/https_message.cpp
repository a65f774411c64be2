#include "network/https_message.hpp"
#include "network/tls_connection.hpp"
#include "utils/data_vector.hpp"
#include <cassert>
#include <utility>
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
HTTPSMessage::HTTPSMessage(OriginalMessage* message, const ConnectionManager::TCPSettings& tcpSettings, uint32_t chunkSize) : HTTPMessage(message, tcpSettings, chunkSize), tlsLayer(nullptr)
// The constructor
{
    type = Type::HTTPS;
}
//---------------------------------------------------------------------------
MessageState HTTPSMessage::execute(ConnectionManager& connectionManager)
// executes the task
{
    auto& state = originalMessage->result.state;
    switch (state) {
        case MessageState::Init: {
            if (!open(connectionManager, true))
                return state;
            tlsLayer = connectionManager.getTLSConnection(fd);
            if (!tlsLayer->init(this, originalMessage->hostname))
                return abort(connectionManager, MessageFailureCode::TLS);
            state = MessageState::TLSHandshake;
            sendBufferOffset = 0;
        } // fallthrough
        case MessageState::TLSHandshake: {
            // Handshake procedure
            auto status = tlsLayer->connect(connectionManager);
            if (status == TLSConnection::Progress::Aborted)
                return abort(connectionManager, MessageFailureCode::TLS);
            if (status != TLSConnection::Progress::Finished)
                return state;
            state = MessageState::InitSending;
        } // fallthrough
        case MessageState::InitSending: // fallthrough
        case MessageState::Sending: {
            state = MessageState::Sending;
            auto ptr = originalMessage->message->cdata() + sendBufferOffset;
            auto length = static_cast<int64_t>(originalMessage->message->size()) - sendBufferOffset;

            int64_t result = 0;
            auto status = tlsLayer->send(connectionManager, reinterpret_cast<const char*>(ptr), length, result);
            if (status == TLSConnection::Progress::Aborted)
                return abort(connectionManager, MessageFailureCode::Send);
            if (status != TLSConnection::Progress::Finished)
                return state;
            sendBufferOffset += result;
            if (sendBufferOffset >= static_cast<int64_t>(originalMessage->message->size())) {
                state = MessageState::InitReceiving;
                receiveBufferOffset = 0;
                originalMessage->result.getDataVector().clear();
            }
            return execute(connectionManager);
        }
        case MessageState::InitReceiving: {
            prepareReceive();
            state = MessageState::Receiving;
        } // fallthrough
        case MessageState::Receiving: {
            auto& receive = originalMessage->result.getDataVector();
            int64_t result = 0;
            assert(in_range<int64_t>(chunkSize));
            auto status = tlsLayer->recv(connectionManager, reinterpret_cast<char*>(receive.data() + receiveBufferOffset), static_cast<int64_t>(chunkSize), result);
            if (status == TLSConnection::Progress::Aborted)
                return abort(connectionManager, MessageFailureCode::Recv);
            if (status != TLSConnection::Progress::Finished)
                return state;

            // Session tickets arrive with the first response bytes
            if (!receiveBufferOffset)
                tlsLayer->cacheSession();
            receiveBufferOffset += result;
            receive.resize(static_cast<uint64_t>(receiveBufferOffset));
            if (checkReceived(connectionManager)) {
                tlsLayer = nullptr;
                return state;
            }
            prepareReceive();
            return execute(connectionManager);
        }
        default:
            break;
    }
    return state;
}
//---------------------------------------------------------------------------
}; // namespace network
}; // namespace memrun
