#pragma once
#include <string>
#include <unordered_map>
#include <openssl/ssl.h>
#include <openssl/types.h>
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
// Although the tls context can be used safe in multi-threading enviornments,
// we allow only one context per thread to avoid locking.
// This simplifies also the caching of sessions.
class TLSContext {
    /// The ssl context
    SSL_CTX* _ctx;
    /// Verify the server certificate
    bool _verifyPeer;
    /// The session cache, key is the hostname
    std::unordered_map<std::string, SSL_SESSION*> _sessionCache;

    public:
    /// The constructor
    explicit TLSContext(bool verifyPeer = true);
    /// The destructor
    ~TLSContext();
    /// No copies
    TLSContext(const TLSContext&) = delete;
    /// No copy assignment
    TLSContext& operator=(const TLSContext&) = delete;

    /// Caches the SSL session
    bool cacheSession(const std::string& hostname, SSL* ssl);
    /// Drops the SSL session
    bool dropSession(const std::string& hostname);
    /// Reuses a SSL session
    bool reuseSession(const std::string& hostname, SSL* ssl);
    /// Does the context verify the peer
    [[nodiscard]] bool verifiesPeer() const { return _verifyPeer; }

    friend TLSConnection;
};
//---------------------------------------------------------------------------
} // namespace memrun::network
