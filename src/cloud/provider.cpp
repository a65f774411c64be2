#include "cloud/provider.hpp"
#include "cloud/aws.hpp"
#include "cloud/http.hpp"
#include "cloud/minio.hpp"
#include "network/original_message.hpp"
#include "network/tasked_send_receiver.hpp"
#include "utils/data_vector.hpp"
#include "utils/error.hpp"
#include "utils/utils.hpp"
#include <string>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
bool Provider::testEnvironment = false;
//---------------------------------------------------------------------------
bool Provider::isRemoteFile(string_view fileName) noexcept
// Is it a remote file?
{
    for (auto i = 0u; i < remoteFileCount; i++)
        if (fileName.starts_with(remoteFile[i]))
            return true;

    return false;
}
//---------------------------------------------------------------------------
// Get a region and bucket name
Provider::RemoteInfo Provider::getRemoteInfo(const string& fileName) {
    for (auto i = 0u; i < remoteFileCount; i++) {
        if (!fileName.starts_with(remoteFile[i]))
            continue;

        Provider::RemoteInfo info;
        info.provider = static_cast<CloudService>(i);
        info.https = info.provider == CloudService::HTTPS;
        // Handle providers the same except MinIO and plain http include the endpoint
        auto sub = fileName.substr(remoteFile[i].size());
        if (info.provider != CloudService::AWS) {
            auto pos = sub.find('/');
            auto addressPort = sub.substr(0, pos);
            if (auto colonPos = addressPort.find(':'); colonPos != string::npos) {
                info.endpoint = addressPort.substr(0, colonPos);
                uint64_t port = 0;
                if (!utils::parseUnsigned(string_view(addressPort).substr(colonPos + 1), port) || !port || port > 65535)
                    throw utils::ConfigError("Invalid port in " + fileName);
                info.port = static_cast<uint32_t>(port);
            } else {
                info.endpoint = addressPort;
                info.port = info.https ? 443 : 80;
            }
            if (info.endpoint.empty())
                throw utils::ConfigError("Missing endpoint in " + fileName);
            sub = pos == string::npos ? "" : sub.substr(pos + 1);
        }
        auto pos = sub.find('/');
        auto bucketRegion = sub.substr(0, pos);
        if (auto colonPos = bucketRegion.find(':'); colonPos != string::npos) {
            info.bucket = bucketRegion.substr(0, colonPos);
            info.region = bucketRegion.substr(colonPos + 1);
        } else {
            info.bucket = bucketRegion;
        }
        return info;
    }
    throw utils::ConfigError("Unsupported remote location: " + fileName);
}
//---------------------------------------------------------------------------
unique_ptr<network::OriginalMessage> Provider::makeMessage(unique_ptr<utils::DataVector<uint8_t>> request) const
// Wraps a request of this provider into a message
{
    return make_unique<network::OriginalMessage>(move(request), getAddress(), getPort(), isHttps());
}
//---------------------------------------------------------------------------
unique_ptr<Provider> Provider::makeProvider(const string& filepath, bool https, const Credentials& credentials, network::TaskedSendReceiverHandle* sendReceiverHandle)
// Create a provider
{
    auto info = getRemoteInfo(filepath);
    if (https) {
        info.https = true;
        if (info.port == 80)
            info.port = 443;
    }
    switch (info.provider) {
        case CloudService::AWS: {
            if (info.bucket.empty())
                throw utils::ConfigError("Missing bucket in " + filepath);
            if (info.region.empty() && sendReceiverHandle)
                info.region = AWS::getInstanceRegion(*sendReceiverHandle);
            if (info.region.empty())
                throw utils::ConfigError("Could not determine the AWS region, set AWS_REGION or --region");

            if (credentials.keyId.empty()) {
                if (!sendReceiverHandle)
                    throw utils::ConfigError("No AWS credentials provided");
                auto aws = make_unique<AWS>(info);
                aws->initSecret(*sendReceiverHandle);
                return aws;
            }
            return make_unique<AWS>(info, credentials);
        }
        case CloudService::MinIO: {
            if (info.bucket.empty())
                throw utils::ConfigError("Missing bucket in " + filepath);
            if (info.region.empty())
                info.region = MinIO::defaultRegion;
            if (credentials.keyId.empty())
                throw utils::ConfigError("No credentials provided for the S3 compatible endpoint " + info.endpoint);
            return make_unique<MinIO>(info, credentials);
        }
        case CloudService::HTTP: // fallthrough
        case CloudService::HTTPS: {
            return make_unique<HTTP>(info);
        }
    }
    throw utils::ConfigError("Unsupported remote location: " + filepath);
}
//---------------------------------------------------------------------------
} // namespace memrun::cloud
