#include "network/message_task.hpp"
#include "network/http_message.hpp"
#include "network/http_request.hpp"
#include "network/https_message.hpp"
#include <string_view>
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
MessageTask::MessageTask(OriginalMessage* message, const ConnectionManager::TCPSettings& tcpSettings, uint32_t chunkSize) : originalMessage(message), tcpSettings(tcpSettings), fd(-1), request(), sendBufferOffset(0), receiveBufferOffset(0), chunkSize(chunkSize), type(Type::HTTP), headRequest(false)
// The constructor
{
    string_view s(reinterpret_cast<const char*>(message->message->cdata()), message->message->size());
    headRequest = HttpRequest::isHeadRequest(s);
}
//---------------------------------------------------------------------------
unique_ptr<MessageTask> MessageTask::buildMessageTask(OriginalMessage* sendingMessage, const ConnectionManager::TCPSettings& tcpSettings, uint32_t chunkSize)
// Builds the message task according to the sending message
{
    if (sendingMessage->https)
        return make_unique<HTTPSMessage>(sendingMessage, tcpSettings, chunkSize);
    return make_unique<HTTPMessage>(sendingMessage, tcpSettings, chunkSize);
}
//---------------------------------------------------------------------------
}; // namespace network
}; // namespace memrun
