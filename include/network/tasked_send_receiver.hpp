#pragma once
#include "network/config.hpp"
#include "network/connection_manager.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>
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
class TaskedSendReceiver;
class TaskedSendReceiverHandle;
struct MessageTask;
struct OriginalMessage;
//---------------------------------------------------------------------------
/// Shared submission queue with multiple TaskedSendReceivers
class TaskedSendReceiverGroup {
    /// The global submission queue
    std::deque<OriginalMessage*> _submissions;
    /// Guards the submissions
    std::mutex _mutex;
    /// Wakes idle send receivers
    std::condition_variable _cv;

    /// The send receivers
    std::vector<std::unique_ptr<TaskedSendReceiver>> _sendReceivers;
    /// Resize the vector
    std::mutex _resizeMutex;

    /// The config
    Config _config;
    /// The TCP settings
    ConnectionManager::TCPSettings _tcpSettings;
    /// Stops all deamons
    std::atomic<bool> _stopped;

    /// The idle wait of a deamon without work
    static constexpr std::chrono::milliseconds idleWait{50};

    /// Takes the next submission, nullptr if empty
    OriginalMessage* consume();
    /// Are submissions queued
    bool empty();
    /// Waits until a submission arrives or the group is stopped
    void waitForSubmissions();

    public:
    /// Initializes the group
    explicit TaskedSendReceiverGroup(const Config& config = Config());
    /// Destructor
    ~TaskedSendReceiverGroup();

    /// Adds a message to the submission queue
    [[nodiscard]] bool send(OriginalMessage* msg);
    /// Gets a tasked send receiver
    [[nodiscard]] TaskedSendReceiverHandle getHandle();
    /// Submits group queue and waits for result
    void process(bool oneQueueInvocation = true);
    /// Stops all deamons once their in-flight requests are done
    void stop();

    /// Get the config
    [[nodiscard]] const Config& getConfig() const { return _config; }
    /// Get the concurrent requests
    [[nodiscard]] unsigned getConcurrentRequests() const { return _config.concurrentRequests; }

    friend TaskedSendReceiver;
    friend TaskedSendReceiverHandle;
};
//---------------------------------------------------------------------------
/// Implements a send receive roundtrip with the help of the socket interface
/// TaskedSendReceiver uses one event loop and can contain multiple requests
class TaskedSendReceiver {
    private:
    /// The shared group
    TaskedSendReceiverGroup& _group;
    /// The local message group
    std::queue<OriginalMessage*> _submissions;
    /// The connection manager
    std::unique_ptr<ConnectionManager> _connectionManager;
    /// The current tasks
    std::vector<std::unique_ptr<MessageTask>> _messageTasks;
    /// Stops the daemon
    std::atomic<bool> _stopDeamon;

    public:
    /// The destructor
    ~TaskedSendReceiver();
    /// Get the group
    [[nodiscard]] const TaskedSendReceiverGroup* getGroup() const { return &_group; }

    private:
    /// Delete copy
    TaskedSendReceiver(const TaskedSendReceiver& other) = delete;
    /// Delete copy assignment
    TaskedSendReceiver& operator=(const TaskedSendReceiver& other) = delete;
    /// The constructor
    explicit TaskedSendReceiver(TaskedSendReceiverGroup& group);

    /// Adds a message to the local submission queue
    void sendSync(OriginalMessage* msg);
    /// Stops the deamon
    void stop() { _stopDeamon = true; }
    /// Starts a message, false if it was aborted immediately
    bool start(OriginalMessage* original);
    /// Removes the finished task and calls its completion
    void finish(MessageTask* task);
    /// Submits queue and waits for result
    void sendReceive(bool local = false, bool oneQueueInvocation = true);

    friend TaskedSendReceiverGroup;
    friend TaskedSendReceiverHandle;
};
//---------------------------------------------------------------------------
/// Handle to a TaskedSendReceiver
class TaskedSendReceiverHandle {
    private:
    /// The shared group
    TaskedSendReceiverGroup* _group;
    /// The send receiver
    TaskedSendReceiver* _sendReceiver;

    /// Constructor
    TaskedSendReceiverHandle(TaskedSendReceiverGroup* group, TaskedSendReceiver* sendReceiver);
    /// Delete copy
    TaskedSendReceiverHandle(const TaskedSendReceiverHandle& other) = delete;
    /// Delete copy assignment
    TaskedSendReceiverHandle& operator=(const TaskedSendReceiverHandle& other) = delete;

    /// Submits queue and waits for result
    bool sendReceive(bool local, bool oneQueueInvocation = true);

    public:
    /// Move constructor
    TaskedSendReceiverHandle(TaskedSendReceiverHandle&& other) noexcept;
    /// Move assignment
    TaskedSendReceiverHandle& operator=(TaskedSendReceiverHandle&& other) noexcept;
    /// Destructor
    ~TaskedSendReceiverHandle() = default;

    /// Process group submissions (should be used for async requests)
    inline bool process(bool oneQueueInvocation = true) { return sendReceive(false, oneQueueInvocation); }
    /// Process local submissions (should be used for sync requests)
    inline bool processSync(bool oneQueueInvocation = true) { return sendReceive(true, oneQueueInvocation); }
    /// Adds a message to the local submission queue
    bool sendSync(OriginalMessage* msg);
    /// Stops the handle thread if deamon
    void stop();
    /// Returns the underlying TaskedSendReceiver
    TaskedSendReceiver* get() { return _sendReceiver; }
    /// Checks whether a TaskedSendReceiver is present
    inline bool has() const { return _sendReceiver; }

    friend TaskedSendReceiverGroup;
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace memrun
