#pragma once
#include "cloud/provider.hpp"
#include "network/http_request.hpp"
#include <cstdint>
#include <memory>
#include <optional>
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
namespace cloud {
//---------------------------------------------------------------------------
/// Implements unsigned http requests, e.g., against public buckets
class HTTP : public Provider {
    public:
    /// The settings for plain http requests
    struct Settings {
        /// The hostname
        std::string hostname;
        /// The port
        uint32_t port;
        /// The bucket, empty if the path is served at the root
        std::string bucket;
    };

    private:
    /// The settings
    Settings _settings;

    /// Serializes the request
    [[nodiscard]] std::unique_ptr<utils::DataVector<uint8_t>> buildRequest(network::HttpRequest& request) const;

    public:
    /// The constructor
    explicit HTTP(const RemoteInfo& info);

    /// Get the settings
    [[nodiscard]] inline const Settings& getSettings() const { return _settings; }

    /// Builds the http request for downloading a blob
    [[nodiscard]] std::unique_ptr<utils::DataVector<uint8_t>> getRequest(const std::string& filePath, const std::optional<std::pair<uint64_t, uint64_t>>& range = std::nullopt) const override;
    /// Builds the http request for the metadata of a blob
    [[nodiscard]] std::unique_ptr<utils::DataVector<uint8_t>> headRequest(const std::string& filePath) const override;

    /// Get the address of the server
    [[nodiscard]] std::string getAddress() const override;
    /// Get the port of the server
    [[nodiscard]] uint32_t getPort() const override;

    friend Provider;
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace memrun
