#include "cloud/remote_store.hpp"
#include "network/original_message.hpp"
#include "utils/data_vector.hpp"
#include "utils/error.hpp"
#include "utils/log.hpp"
#include "utils/utils.hpp"
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
namespace cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
RemoteStore::RemoteStore(const string& location, bool https, const Provider::Credentials& credentials, const network::Config& config) : _group(config), _syncHandle(_group.getHandle()), _provider(), _bucket(), _retrievers(), _mutex(), _messages()
// The constructor
{
    _bucket = Provider::getRemoteInfo(location).bucket;
    _provider = Provider::makeProvider(location, https, credentials, &_syncHandle);
    utils::Log::debug("Remote store at ", _provider->getAddress(), ":", _provider->getPort(), _provider->isHttps() ? " (https)" : "");
    for (auto i = 0u; i < config.retrievers; i++)
        _retrievers.emplace_back([this] { _group.process(false); });
}
//---------------------------------------------------------------------------
RemoteStore::~RemoteStore()
// The destructor
{
    _group.stop();
    for (auto& t : _retrievers)
        t.join();
}
//---------------------------------------------------------------------------
uint64_t RemoteStore::headSize(const download::ObjectLocator& locator)
// Runs the HEAD request
{
    if (locator.bucket != _bucket)
        throw utils::MetadataError("Store is bound to bucket " + _bucket + ", not " + locator.bucket);

    auto message = _provider->makeMessage(_provider->headRequest(locator.key));
    verify(_syncHandle.sendSync(message.get()));
    verify(_syncHandle.processSync());

    auto& result = message->result;
    if (!result.success())
        throw utils::MetadataError("HEAD " + locator.bucket + "/" + locator.key + " failed: " + result.describeFailure());
    if (!result.getResponse()->response.findHeader("Content-Length"))
        throw utils::MetadataError("HEAD " + locator.bucket + "/" + locator.key + " returned no Content-Length");
    return result.getSize();
}
//---------------------------------------------------------------------------
void RemoteStore::rangedGet(const download::ObjectLocator& locator, const download::ByteRange& range, Completion completion)
// Issues the ranged GET
{
    if (locator.bucket != _bucket)
        throw utils::TransferError(range.start, range.end, "store is bound to bucket " + _bucket);

    auto callback = [range, completion = move(completion)](network::MessageResult& result) {
        download::ChunkResult chunk;
        chunk.range = range;
        if (result.success()) {
            chunk.bodyOffset = result.getOffset();
            chunk.bodyLength = result.getSize();
            chunk.buffer = result.moveDataVector();
        } else {
            chunk.error = result.describeFailure();
            if (chunk.error.empty())
                chunk.error = "request not processed";
        }
        completion(move(chunk));
    };

    auto request = _provider->getRequest(locator.key, pair<uint64_t, uint64_t>(range.start, range.end));
    auto message = make_unique<network::OriginalCallbackMessage<decltype(callback)>>(move(callback), move(request), _provider->getAddress(), _provider->getPort(), _provider->isHttps());
    auto original = message.get();
    {
        lock_guard<mutex> lock(_mutex);
        _messages.emplace_back(move(message));
    }
    // A stopped group never picks the message up, settle it here
    if (!_group.send(original))
        original->finish();
}
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace memrun
