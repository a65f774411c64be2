#pragma once
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
//---------------------------------------------------------------------------
namespace network {
class TaskedSendReceiverHandle;
struct OriginalMessage;
} // namespace network
namespace utils {
template <typename T>
class DataVector;
} // namespace utils
//---------------------------------------------------------------------------
namespace cloud {
//---------------------------------------------------------------------------
/// Implements the object store provider abstraction
/// A provider builds the serialized requests, the transport is done by the send receivers
class Provider {
    public:
    /// The remote prefixes count
    static constexpr unsigned remoteFileCount = 4;
    /// The remote prefixes
    static constexpr std::string_view remoteFile[] = {"https://", "http://", "s3://", "minio://"};
    /// Are we currently testing the providers
    static bool testEnvironment;

    /// The cloud service enum
    enum class CloudService : uint8_t {
        HTTPS = 0,
        HTTP = 1,
        AWS = 2,
        MinIO = 3
    };

    /// RemoteInfo struct
    struct RemoteInfo {
        /// The provider
        CloudService provider = Provider::CloudService::HTTPS;
        /// The bucket name
        std::string bucket = "";
        /// The region name
        std::string region = "";
        /// The endpoint
        std::string endpoint = "";
        /// The port
        uint32_t port = 80;
        /// Use tls
        bool https = false;
    };

    /// The static credentials
    struct Credentials {
        /// The access key id
        std::string keyId;
        /// The secret access key
        std::string secret;
        /// The optional session token
        std::string token;
    };

    protected:
    /// The type
    CloudService _type;
    /// Use tls
    bool _https = false;

    public:
    /// Initialize or refresh the secret, throws if no credentials can be found
    virtual void initSecret(network::TaskedSendReceiverHandle& /*sendReceiverHandle*/) {}
    /// Builds the http request for downloading a blob, optionally restricted to the inclusive byte range
    [[nodiscard]] virtual std::unique_ptr<utils::DataVector<uint8_t>> getRequest(const std::string& filePath, const std::optional<std::pair<uint64_t, uint64_t>>& range = std::nullopt) const = 0;
    /// Builds the http request for retrieving the metadata of a blob
    [[nodiscard]] virtual std::unique_ptr<utils::DataVector<uint8_t>> headRequest(const std::string& filePath) const = 0;
    /// Get the address of the server
    [[nodiscard]] virtual std::string getAddress() const = 0;
    /// Get the port of the server
    [[nodiscard]] virtual uint32_t getPort() const = 0;
    /// Is the connection encrypted
    [[nodiscard]] bool isHttps() const { return _https; }
    /// Wraps a request of this provider into a message
    [[nodiscard]] std::unique_ptr<network::OriginalMessage> makeMessage(std::unique_ptr<utils::DataVector<uint8_t>> request) const;

    /// The destructor
    virtual ~Provider() noexcept = default;
    /// Gets the cloud provider type
    [[nodiscard]] CloudService getType() const { return _type; }
    /// Is it a remote file?
    [[nodiscard]] static bool isRemoteFile(std::string_view fileName) noexcept;
    /// Get a region and bucket name, throws for unknown schemes
    [[nodiscard]] static Provider::RemoteInfo getRemoteInfo(const std::string& fileName);

    /// Create a provider, the handle is required to resolve a missing region or credentials from the instance metadata
    [[nodiscard]] static std::unique_ptr<Provider> makeProvider(const std::string& filepath, bool https = false, const Credentials& credentials = Credentials(), network::TaskedSendReceiverHandle* sendReceiverHandle = nullptr);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace memrun
