#include "network/tasked_send_receiver.hpp"
#include "network/message_task.hpp"
#include "network/original_message.hpp"
#include "network/socket.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
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
TaskedSendReceiverGroup::TaskedSendReceiverGroup(const Config& config) : _submissions(), _mutex(), _cv(), _sendReceivers(), _resizeMutex(), _config(config), _tcpSettings(), _stopped(false)
// Initializes the group
{
    _tcpSettings.timeout = _config.timeout;
}
//---------------------------------------------------------------------------
TaskedSendReceiverGroup::~TaskedSendReceiverGroup()
// The destructor
{
    stop();
}
//---------------------------------------------------------------------------
bool TaskedSendReceiverGroup::send(OriginalMessage* msg)
// Adds a message to the submission queue
{
    if (!msg || _stopped)
        return false;
    {
        lock_guard<mutex> lock(_mutex);
        _submissions.push_back(msg);
    }
    _cv.notify_one();
    return true;
}
//---------------------------------------------------------------------------
OriginalMessage* TaskedSendReceiverGroup::consume()
// Takes the next submission
{
    lock_guard<mutex> lock(_mutex);
    if (_submissions.empty())
        return nullptr;
    auto msg = _submissions.front();
    _submissions.pop_front();
    return msg;
}
//---------------------------------------------------------------------------
bool TaskedSendReceiverGroup::empty()
// Are submissions queued
{
    lock_guard<mutex> lock(_mutex);
    return _submissions.empty();
}
//---------------------------------------------------------------------------
void TaskedSendReceiverGroup::waitForSubmissions()
// Waits for new work
{
    unique_lock<mutex> lock(_mutex);
    _cv.wait_for(lock, idleWait, [this] { return !_submissions.empty() || _stopped; });
}
//---------------------------------------------------------------------------
TaskedSendReceiverHandle TaskedSendReceiverGroup::getHandle()
// Creates a new tasked send receiver
{
    lock_guard<mutex> lg(_resizeMutex);
    auto& ref = _sendReceivers.emplace_back(unique_ptr<TaskedSendReceiver>(new TaskedSendReceiver(*this)));
    return TaskedSendReceiverHandle(this, ref.get());
}
//---------------------------------------------------------------------------
void TaskedSendReceiverGroup::process(bool oneQueueInvocation)
// Makes the current thread a send receiver handling async requests
{
    auto handle = getHandle();
    handle.process(oneQueueInvocation);
}
//---------------------------------------------------------------------------
void TaskedSendReceiverGroup::stop()
// Stops all deamons
{
    {
        lock_guard<mutex> lock(_mutex);
        _stopped = true;
    }
    _cv.notify_all();
}
//---------------------------------------------------------------------------
TaskedSendReceiverHandle::TaskedSendReceiverHandle(TaskedSendReceiverGroup* group, TaskedSendReceiver* sendReceiver) : _group(group), _sendReceiver(sendReceiver)
// The constructor
{
}
//---------------------------------------------------------------------------
TaskedSendReceiverHandle::TaskedSendReceiverHandle(TaskedSendReceiverHandle&& other) noexcept : _group(other._group), _sendReceiver(other._sendReceiver)
// Move constructor
{
    other._sendReceiver = nullptr;
}
//---------------------------------------------------------------------------
TaskedSendReceiverHandle& TaskedSendReceiverHandle::operator=(TaskedSendReceiverHandle&& other) noexcept
// Move assignment
{
    if (this != &other) {
        _group = other._group;
        _sendReceiver = other._sendReceiver;
        other._sendReceiver = nullptr;
    }
    return *this;
}
//---------------------------------------------------------------------------
bool TaskedSendReceiverHandle::sendSync(OriginalMessage* msg)
// Adds a message to the submission queue
{
    if (!_sendReceiver)
        return false;
    _sendReceiver->sendSync(msg);
    return true;
}
//---------------------------------------------------------------------------
void TaskedSendReceiverHandle::stop()
// Stops the deamon
{
    if (!_sendReceiver)
        return;
    _sendReceiver->stop();
    _group->_cv.notify_all();
}
//---------------------------------------------------------------------------
bool TaskedSendReceiverHandle::sendReceive(bool local, bool oneQueueInvocation)
// Calls the underlying TaskedSendReceiver's sendReceive
{
    if (!_sendReceiver)
        return false;
    _sendReceiver->sendReceive(local, oneQueueInvocation);
    return true;
}
//---------------------------------------------------------------------------
TaskedSendReceiver::TaskedSendReceiver(TaskedSendReceiverGroup& group) : _group(group), _submissions(), _connectionManager(make_unique<ConnectionManager>(group._config.concurrentRequests << 2, group._config.verifyPeer)), _messageTasks(), _stopDeamon(false)
// The constructor
{
}
//---------------------------------------------------------------------------
TaskedSendReceiver::~TaskedSendReceiver() = default;
//---------------------------------------------------------------------------
void TaskedSendReceiver::sendSync(OriginalMessage* msg)
// Adds a message to the local submission queue
{
    _submissions.emplace(msg);
}
//---------------------------------------------------------------------------
bool TaskedSendReceiver::start(OriginalMessage* original)
// Starts the message process
{
    auto messageTask = MessageTask::buildMessageTask(original, _group._tcpSettings, _group._config.chunkSize);
    if (messageTask->execute(*_connectionManager) == MessageState::Aborted) {
        if (original->requiresFinish())
            original->finish();
        return false;
    }
    _messageTasks.emplace_back(move(messageTask));
    return true;
}
//---------------------------------------------------------------------------
void TaskedSendReceiver::finish(MessageTask* task)
// Removes the finished task
{
    auto it = find_if(_messageTasks.begin(), _messageTasks.end(), [task](const auto& t) { return t.get() == task; });
    if (it == _messageTasks.end())
        return;
    // The task is released first, the callback may release the original message
    auto original = task->originalMessage;
    _messageTasks.erase(it);
    if (original->requiresFinish())
        original->finish();
}
//---------------------------------------------------------------------------
void TaskedSendReceiver::sendReceive(bool local, bool oneQueueInvocation)
// Starts new requests within the concurrency limit, submits them, and handles the completions
{
    // Current requests in flight
    auto count = 0u;
    auto concurrency = _group._config.concurrentRequests;

    auto emplaceNewRequest = [&] {
        while (_messageTasks.size() < concurrency) {
            auto original = _group.consume();
            if (!original)
                break;
            start(original);
        }
    };

    auto emplaceLocalRequest = [&] {
        while (!_submissions.empty() && _messageTasks.size() < concurrency) {
            auto original = _submissions.front();
            _submissions.pop();
            start(original);
        }
    };

    auto stopped = [&] {
        return _stopDeamon || (!local && _group._stopped);
    };

    // iterate over all messages
    while (!stopped() || count) {
        if (count > 0) {
            // get completion
            auto req = _connectionManager->getSocketConnection().complete();
            count--;

            // nullptr for internal timeout events, skip this one
            if (!req)
                continue;

            auto task = req->messageTask;
            auto status = task->execute(*_connectionManager);
            if (status == MessageState::Finished || status == MessageState::Aborted)
                finish(task);
        }
        if (!stopped() && _messageTasks.size() < concurrency)
            local ? emplaceLocalRequest() : emplaceNewRequest();

        auto cnt = _connectionManager->getSocketConnection().submit();
        if (cnt < 0)
            throw runtime_error("socket submit error: " + to_string(-cnt));
        count += static_cast<unsigned>(cnt);

        if (!count) {
            auto empty = local ? _submissions.empty() : _group.empty();
            if (empty && oneQueueInvocation)
                break;
            if (empty && !local && !stopped())
                _group.waitForSubmissions();
        }
    }
    _stopDeamon = false;
}
//---------------------------------------------------------------------------
}; // namespace network
}; // namespace memrun
