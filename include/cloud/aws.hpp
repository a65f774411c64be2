#pragma once
#include "cloud/provider.hpp"
#include "network/http_request.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
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
namespace test {
class AWSTester;
}; // namespace test
//---------------------------------------------------------------------------
/// Implements the AWS S3 logic
/// Requests are built by one thread, the secret is not synchronized
class AWS : public Provider {
    public:
    /// The settings for AWS requests
    struct Settings {
        /// The bucket name
        std::string bucket;
        /// The aws region
        std::string region;
        /// The custom endpoint
        std::string endpoint;
        /// The port
        uint32_t port = 80;
    };

    /// The secret
    struct Secret {
        /// The IAM role
        std::string iamUser;
        /// The key id
        std::string keyId;
        /// The secret
        std::string secret;
        /// The session token
        std::string token;
        /// The expiration, 0 for static keys
        int64_t expiration = 0;
    };

    /// The fake AMZ timestamp
    static constexpr const char* fakeAMZTimestamp = "21000101T000000Z";
    /// The fake IAM timestamp
    static constexpr const char* fakeIAMTimestamp = "2100-01-01T00:00:00Z";

    protected:
    /// The settings
    Settings _settings;
    /// The secret
    std::shared_ptr<Secret> _secret;

    public:
    /// The constructor
    explicit AWS(const RemoteInfo& info);
    /// The static credentials constructor
    AWS(const RemoteInfo& info, const Credentials& credentials);

    /// Get the region of the instance
    [[nodiscard]] static std::string getInstanceRegion(network::TaskedSendReceiverHandle& sendReceiverHandle);
    /// Initialize or refresh the secret from the instance metadata
    void initSecret(network::TaskedSendReceiverHandle& sendReceiverHandle) override;

    /// Builds the http request for downloading a blob
    [[nodiscard]] std::unique_ptr<utils::DataVector<uint8_t>> getRequest(const std::string& filePath, const std::optional<std::pair<uint64_t, uint64_t>>& range = std::nullopt) const override;
    /// Builds the http request for the metadata of a blob
    [[nodiscard]] std::unique_ptr<utils::DataVector<uint8_t>> headRequest(const std::string& filePath) const override;
    /// Get the address of the server
    [[nodiscard]] std::string getAddress() const override;
    /// Get the port of the server
    [[nodiscard]] uint32_t getPort() const override;
    /// Get the settings
    [[nodiscard]] inline const Settings& getSettings() const { return _settings; }

    protected:
    /// The request path of an object
    [[nodiscard]] virtual std::string getObjectPath(const std::string& filePath) const;
    /// Creates the generic http request and signs it
    [[nodiscard]] std::unique_ptr<utils::DataVector<uint8_t>> buildRequest(network::HttpRequest& request) const;

    private:
    /// Builds the secret http request
    [[nodiscard]] static std::unique_ptr<utils::DataVector<uint8_t>> downloadIAMUser();
    /// Builds the secret http request
    [[nodiscard]] static std::unique_ptr<utils::DataVector<uint8_t>> downloadSecret(std::string_view content, std::string& iamUser);
    /// Update secret
    bool updateSecret(std::string_view content, std::string_view iamUser);
    /// Checks whether the keys are still valid
    [[nodiscard]] bool validKeys(uint32_t offset = 60) const;

    /// Builds the info http request
    [[nodiscard]] static std::unique_ptr<utils::DataVector<uint8_t>> downloadInstanceInfo(const std::string& info = "instance-type");
    /// Runs a request against the instance metadata service and returns the body
    [[nodiscard]] static std::string fetchInstanceMetadata(network::TaskedSendReceiverHandle& sendReceiverHandle, std::unique_ptr<utils::DataVector<uint8_t>> message);
    /// Get the IAM address
    [[nodiscard]] static constexpr std::string_view getIAMAddress() { return "169.254.169.254"; }
    /// Get the port of the IAM server
    [[nodiscard]] static constexpr uint32_t getIAMPort() { return 80; }

    friend Provider;
    friend test::AWSTester;
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace memrun
