#pragma once
#include "cloud/aws.hpp"
#include <string>
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
/// Implements the MinIO logic using the AWS S3 compatibility API
class MinIO : public AWS {
    public:
    /// The signing region if none is given
    static constexpr const char* defaultRegion = "us-east-1";

    /// The custom endpoint constructor
    MinIO(const RemoteInfo& info, const Credentials& credentials) : AWS(info, credentials) {}
    /// Get the address of the server
    [[nodiscard]] std::string getAddress() const override;

    protected:
    /// Path-style object path
    [[nodiscard]] std::string getObjectPath(const std::string& filePath) const override;

    friend Provider;
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace memrun
