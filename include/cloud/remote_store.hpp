#pragma once
#include "cloud/provider.hpp"
#include "download/object_store.hpp"
#include "network/config.hpp"
#include "network/tasked_send_receiver.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <thread>
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
struct OriginalMessage;
} // namespace network
namespace cloud {
//---------------------------------------------------------------------------
/// The object store backed by a remote provider and the send receiver group.
/// Ranged fetches are processed by the retriever threads, the size lookup runs synchronously
/// on the calling thread.
class RemoteStore : public download::ObjectStore {
    /// The group
    network::TaskedSendReceiverGroup _group;
    /// The handle for synchronous requests
    network::TaskedSendReceiverHandle _syncHandle;
    /// The provider
    std::unique_ptr<Provider> _provider;
    /// The bucket the provider is bound to
    std::string _bucket;
    /// The retriever threads
    std::vector<std::thread> _retrievers;
    /// Guards the messages
    std::mutex _mutex;
    /// The issued messages, released with the store
    std::vector<std::unique_ptr<network::OriginalMessage>> _messages;

    public:
    /// Creates the provider for the location and starts the retrievers, throws ConfigError
    RemoteStore(const std::string& location, bool https, const Provider::Credentials& credentials, const network::Config& config = network::Config());
    /// Stops the retrievers
    ~RemoteStore() override;
    /// No copies
    RemoteStore(const RemoteStore&) = delete;
    /// No copy assignment
    RemoteStore& operator=(const RemoteStore&) = delete;

    /// The object size from a HEAD request, throws MetadataError
    [[nodiscard]] uint64_t headSize(const download::ObjectLocator& locator) override;
    /// Issues the ranged GET to the retrievers
    void rangedGet(const download::ObjectLocator& locator, const download::ByteRange& range, Completion completion) override;

    /// The provider
    [[nodiscard]] const Provider& getProvider() const { return *_provider; }
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace memrun
