#include "network/tls_context.hpp"
#include "utils/log.hpp"
#include <openssl/crypto.h>
#include <openssl/ssl.h>
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
TLSContext::TLSContext(bool verifyPeer) : _ctx(nullptr), _verifyPeer(verifyPeer), _sessionCache()
// Construct the TLS Context
{
    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx)
        return;

    SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION);
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
    if (_verifyPeer) {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1)
            utils::Log::warn("Could not load the default certificate store");
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    }
}
//---------------------------------------------------------------------------
TLSContext::~TLSContext()
// The destructor
{
    for (auto& entry : _sessionCache)
        SSL_SESSION_free(entry.second);
    if (_ctx)
        SSL_CTX_free(_ctx);
}
//---------------------------------------------------------------------------
bool TLSContext::cacheSession(const string& hostname, SSL* ssl)
// Caches the SSL session
{
    if (SSL_session_reused(ssl))
        return false;
    auto session = SSL_get1_session(ssl);
    if (!session)
        return false;
    auto& entry = _sessionCache[hostname];
    if (entry)
        SSL_SESSION_free(entry);
    entry = session;
    return true;
}
//---------------------------------------------------------------------------
bool TLSContext::dropSession(const string& hostname)
// Drop the SSL session from cache
{
    auto it = _sessionCache.find(hostname);
    if (it == _sessionCache.end())
        return false;
    SSL_SESSION_free(it->second);
    _sessionCache.erase(it);
    return true;
}
//---------------------------------------------------------------------------
bool TLSContext::reuseSession(const string& hostname, SSL* ssl)
// Reuses the SSL session
{
    auto it = _sessionCache.find(hostname);
    if (it == _sessionCache.end())
        return false;
    return SSL_set_session(ssl, it->second) == 1;
}
//---------------------------------------------------------------------------
} // namespace memrun::network
