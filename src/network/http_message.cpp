#include "network/http_message.hpp"
#include "network/http_response.hpp"
#include "utils/data_vector.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
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
HTTPMessage::HTTPMessage(OriginalMessage* message, const ConnectionManager::TCPSettings& tcpSettings, uint32_t chunkSize) : MessageTask(message, tcpSettings, chunkSize), info()
// The constructor
{
    type = Type::HTTP;
}
//---------------------------------------------------------------------------
MessageState HTTPMessage::execute(ConnectionManager& connectionManager)
// executes the task
{
    auto& state = originalMessage->result.state;
    switch (state) {
        case MessageState::Init: {
            if (!open(connectionManager, false))
                return state;
            state = MessageState::InitSending;
            sendBufferOffset = 0;
        } // fallthrough
        case MessageState::InitSending: // fallthrough
        case MessageState::Sending: {
            if (state != MessageState::InitSending) {
                if (request->length > 0) {
                    sendBufferOffset += request->length;
                } else if (request->length != -EINPROGRESS && request->length != -EAGAIN) {
                    if (request->length == -ETIMEDOUT || request->length == -ECANCELED || request->length == -EINTR)
                        return abort(connectionManager, MessageFailureCode::Timeout);
                    return abort(connectionManager, MessageFailureCode::Send);
                }
                if (sendBufferOffset >= static_cast<int64_t>(originalMessage->message->size())) {
                    state = MessageState::InitReceiving;
                    receiveBufferOffset = 0;
                    originalMessage->result.getDataVector().clear();
                    return execute(connectionManager);
                }
            }
            state = MessageState::Sending;
            auto ptr = originalMessage->message->cdata() + sendBufferOffset;
            auto length = static_cast<int64_t>(originalMessage->message->size()) - sendBufferOffset;
            request = make_unique<Socket::Request>(Socket::Request{.data = {.cdata = ptr}, .length = length, .fd = fd, .event = Socket::EventType::write, .messageTask = this});
            connectionManager.getSocketConnection().send(*request, tcpSettings.timeout);
            break;
        }
        case MessageState::InitReceiving: // fallthrough
        case MessageState::Receiving: {
            // check after first successful receiving if we are finished
            if (state != MessageState::InitReceiving) {
                if (request->length == 0) {
                    return abort(connectionManager, MessageFailureCode::Empty);
                } else if (request->length > 0) {
                    receiveBufferOffset += request->length;
                    originalMessage->result.getDataVector().resize(static_cast<uint64_t>(receiveBufferOffset));
                    if (checkReceived(connectionManager))
                        return state;
                } else if (request->length != -EINPROGRESS && request->length != -EAGAIN) {
                    if (request->length == -ETIMEDOUT || request->length == -ECANCELED || request->length == -EINTR)
                        return abort(connectionManager, MessageFailureCode::Timeout);
                    return abort(connectionManager, MessageFailureCode::Recv);
                }
            }
            auto ptr = prepareReceive();
            request = make_unique<Socket::Request>(Socket::Request{.data = {.data = ptr}, .length = static_cast<int64_t>(chunkSize), .fd = fd, .event = Socket::EventType::read, .messageTask = this});
            connectionManager.getSocketConnection().recv(*request, tcpSettings.timeout, tcpSettings.recvNoWait ? MSG_DONTWAIT : 0);
            state = MessageState::Receiving;
            break;
        }
        default:
            break;
    }
    return state;
}
//---------------------------------------------------------------------------
bool HTTPMessage::open(ConnectionManager& connectionManager, bool tls)
// Opens the connection
{
    try {
        fd = connectionManager.connect(originalMessage->hostname, originalMessage->port, tls, tcpSettings);
    } catch (const exception& e) {
        originalMessage->result.failureMessage = e.what();
        abort(connectionManager, MessageFailureCode::Socket);
        return false;
    }
    return true;
}
//---------------------------------------------------------------------------
bool HTTPMessage::checkReceived(ConnectionManager& connectionManager)
// Checks whether the http response is complete
{
    auto& receive = originalMessage->result.getDataVector();
    try {
        if (!HttpHelper::finished(receive.cdata(), static_cast<uint64_t>(receiveBufferOffset), info, headRequest))
            return false;
    } catch (const exception& e) {
        originalMessage->result.failureMessage = e.what();
        abort(connectionManager, MessageFailureCode::HTTP);
        return true;
    }

    auto success = info->response.success();
    originalMessage->result.response = move(info);
    if (!success) {
        abort(connectionManager, MessageFailureCode::HTTP);
        return true;
    }
    close(connectionManager);
    originalMessage->result.state = MessageState::Finished;
    return true;
}
//---------------------------------------------------------------------------
uint8_t* HTTPMessage::prepareReceive()
// Grows the receive buffer for the next chunk
{
    auto& receive = originalMessage->result.getDataVector();
    // Reserve the full response once the header announced its length
    if (info && receive.capacity() < receive.size() + chunkSize)
        receive.reserve(max(info->length + info->headerLength + chunkSize, receive.capacity() + receive.capacity() / 2));
    receive.resize(static_cast<uint64_t>(receiveBufferOffset) + chunkSize);
    return receive.data() + receiveBufferOffset;
}
//---------------------------------------------------------------------------
MessageState HTTPMessage::abort(ConnectionManager& connectionManager, MessageFailureCode code)
// Marks the message as failed
{
    originalMessage->result.failureCode |= static_cast<uint16_t>(code);
    if (originalMessage->result.failureMessage.empty() && request && request->length < 0)
        originalMessage->result.failureMessage = strerror(static_cast<int>(-request->length));
    // Trim the unused receive chunk
    if (!originalMessage->result.response)
        originalMessage->result.getDataVector().resize(static_cast<uint64_t>(receiveBufferOffset));
    close(connectionManager);
    originalMessage->result.state = MessageState::Aborted;
    utils::Log::debug("Request to ", originalMessage->hostname, " aborted: ", originalMessage->result.describeFailure());
    return MessageState::Aborted;
}
//---------------------------------------------------------------------------
void HTTPMessage::close(ConnectionManager& connectionManager)
// Closes the connection
{
    if (fd >= 0) {
        connectionManager.disconnect(fd);
        fd = -1;
    }
}
//---------------------------------------------------------------------------
} // namespace memrun::network
