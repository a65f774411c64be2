#pragma once
#include "cloud/provider.hpp"
#include "utils/log.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <vector>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::launcher {
//---------------------------------------------------------------------------
/// The run configuration from the command line with environment fallbacks
struct Settings {
    /// Looks up an environment variable, nullptr if unset
    using Environment = std::function<const char*(const char* name)>;

    /// The bucket (S3_BUCKET)
    std::string bucket;
    /// The key (S3_KEY)
    std::string key;
    /// The token replaced in the program arguments (MEMFD_PLACEHOLDER)
    std::string placeholder = "{{memfd}}";
    /// The log level
    utils::Log::Level logLevel = utils::Log::Level::Info;
    /// A custom S3 compatible endpoint, host[:port]
    std::string endpoint;
    /// The region (AWS_REGION, AWS_DEFAULT_REGION)
    std::string region;
    /// Use tls
    bool https = true;
    /// The number of retriever threads
    unsigned retrievers;
    /// Anonymous requests against a public bucket
    bool noSignRequest = false;
    /// Print the usage only
    bool help = false;
    /// The static credentials (AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN)
    cloud::Provider::Credentials credentials;
    /// The program
    std::string program;
    /// The program arguments
    std::vector<std::string> args;

    /// Constructor
    Settings();

    /// Parses the arguments, throws ConfigError
    [[nodiscard]] static Settings parse(int argc, const char* const* argv, const Environment& environment);
    /// Parses the arguments with the process environment
    [[nodiscard]] static Settings parse(int argc, const char* const* argv);
    /// The usage text
    [[nodiscard]] static std::string usage(std::string_view name);

    /// The remote location understood by the provider, throws ConfigError
    [[nodiscard]] std::string location() const;
    /// A one line description without secrets
    [[nodiscard]] std::string describe() const;
};
//---------------------------------------------------------------------------
} // namespace memrun::launcher
