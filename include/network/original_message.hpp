#pragma once
#include "network/message_result.hpp"
#include "utils/data_vector.hpp"
#include <cstdint>
#include <memory>
#include <string>
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
/// This is the original request message struct
struct OriginalMessage {
    /// The serialized request
    std::unique_ptr<utils::DataVector<uint8_t>> message;
    /// The result
    MessageResult result;

    /// The hostname
    std::string hostname;
    /// The port
    uint32_t port;
    /// Use tls for the connection
    bool https;

    /// The constructor
    OriginalMessage(std::unique_ptr<utils::DataVector<uint8_t>> message, std::string hostname, uint32_t port, bool https) : message(std::move(message)), result(), hostname(std::move(hostname)), port(port), https(https) {}
    /// The destructor
    virtual ~OriginalMessage() = default;

    /// Callback required
    virtual bool requiresFinish() { return false; }
    /// Callback
    virtual void finish() {}
};
//---------------------------------------------------------------------------
/// The callback original message
template <typename Callback>
struct OriginalCallbackMessage : public OriginalMessage {
    /// The callback
    Callback callback;

    /// The constructor
    OriginalCallbackMessage(Callback&& callback, std::unique_ptr<utils::DataVector<uint8_t>> message, std::string hostname, uint32_t port, bool https) : OriginalMessage(std::move(message), std::move(hostname), port, https), callback(std::forward<Callback>(callback)) {}
    /// The destructor
    ~OriginalCallbackMessage() override = default;

    /// Override if callback required
    bool requiresFinish() override { return true; }
    /// Callback
    void finish() override {
        callback(result);
    }
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace memrun
