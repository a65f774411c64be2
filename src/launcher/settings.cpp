#include "launcher/settings.hpp"
#include "network/config.hpp"
#include "utils/error.hpp"
#include "utils/utils.hpp"
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
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
using namespace std;
//---------------------------------------------------------------------------
Settings::Settings() : retrievers(network::Config::defaultRetrievers)
// Constructor
{
}
//---------------------------------------------------------------------------
static bool parseSwitch(string_view value, bool& result)
// 0/1 and false/true
{
    if (value == "1" || utils::equalsIgnoreCase(value, "true")) {
        result = true;
        return true;
    }
    if (value == "0" || utils::equalsIgnoreCase(value, "false")) {
        result = false;
        return true;
    }
    return false;
}
//---------------------------------------------------------------------------
Settings Settings::parse(int argc, const char* const* argv)
// Uses the process environment
{
    return parse(argc, argv, [](const char* name) -> const char* { return getenv(name); });
}
//---------------------------------------------------------------------------
Settings Settings::parse(int argc, const char* const* argv, const Environment& environment)
// Flags first, the first positional argument starts the program command
{
    Settings settings;
    auto placeholderSet = false;

    auto env = [&environment](const char* name) -> string {
        auto value = environment ? environment(name) : nullptr;
        return value ? value : "";
    };

    auto i = 1;
    for (; i < argc; i++) {
        string_view arg = argv[i];
        if (arg == "--") {
            i++;
            break;
        }
        if (arg == "-h" || arg == "--help") {
            settings.help = true;
            continue;
        }
        if (!arg.starts_with("--")) {
            if (arg.starts_with("-") && arg.size() > 1)
                throw utils::ConfigError("Unknown option " + string(arg));
            break;
        }

        auto name = arg.substr(2);
        optional<string_view> inlineValue;
        if (auto pos = name.find('='); pos != string_view::npos) {
            inlineValue = name.substr(pos + 1);
            name = name.substr(0, pos);
        }

        if (name == "no-sign-request") {
            if (inlineValue && !parseSwitch(*inlineValue, settings.noSignRequest))
                throw utils::ConfigError("Invalid value for --no-sign-request: " + string(*inlineValue));
            if (!inlineValue)
                settings.noSignRequest = true;
            continue;
        }

        auto value = [&]() -> string {
            if (inlineValue)
                return string(*inlineValue);
            if (i + 1 >= argc)
                throw utils::ConfigError("Missing value for --" + string(name));
            return argv[++i];
        };

        if (name == "bucket") {
            settings.bucket = value();
        } else if (name == "key") {
            settings.key = value();
        } else if (name == "memfd-placeholder") {
            settings.placeholder = value();
            placeholderSet = true;
        } else if (name == "log-level") {
            auto level = value();
            if (!utils::Log::parseLevel(level, settings.logLevel))
                throw utils::ConfigError("Invalid log level " + level + ", expected trace, debug, info, warn or error");
        } else if (name == "endpoint") {
            settings.endpoint = value();
        } else if (name == "region") {
            settings.region = value();
        } else if (name == "https") {
            auto v = value();
            if (!parseSwitch(v, settings.https))
                throw utils::ConfigError("Invalid value for --https: " + v);
        } else if (name == "retrievers") {
            auto v = value();
            uint64_t retrievers = 0;
            if (!utils::parseUnsigned(v, retrievers) || !retrievers || retrievers > 64)
                throw utils::ConfigError("Invalid number of retrievers: " + v);
            settings.retrievers = static_cast<unsigned>(retrievers);
        } else {
            throw utils::ConfigError("Unknown option --" + string(name));
        }
    }

    // Everything after the program belongs to it
    if (i < argc) {
        settings.program = argv[i++];
        for (; i < argc; i++)
            settings.args.emplace_back(argv[i]);
    }

    if (settings.bucket.empty())
        settings.bucket = env("S3_BUCKET");
    if (settings.key.empty())
        settings.key = env("S3_KEY");
    if (!placeholderSet) {
        if (auto placeholder = env("MEMFD_PLACEHOLDER"); !placeholder.empty())
            settings.placeholder = placeholder;
    }
    if (settings.region.empty())
        settings.region = env("AWS_REGION");
    if (settings.region.empty())
        settings.region = env("AWS_DEFAULT_REGION");
    settings.credentials.keyId = env("AWS_ACCESS_KEY_ID");
    settings.credentials.secret = env("AWS_SECRET_ACCESS_KEY");
    settings.credentials.token = env("AWS_SESSION_TOKEN");

    if (settings.help)
        return settings;

    if (settings.bucket.empty())
        throw utils::ConfigError("S3_BUCKET environment variable not set and --bucket not provided");
    if (settings.key.empty())
        throw utils::ConfigError("S3_KEY environment variable not set and --key not provided");
    if (settings.placeholder.empty())
        throw utils::ConfigError("The memfd placeholder must not be empty");
    if (settings.program.empty())
        throw utils::ConfigError("Missing program to execute");
    if (settings.bucket.find_first_of(":/") != string::npos)
        throw utils::ConfigError("Invalid bucket name " + settings.bucket);
    if (settings.credentials.keyId.empty() != settings.credentials.secret.empty())
        throw utils::ConfigError("AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY must be set together");
    return settings;
}
//---------------------------------------------------------------------------
string Settings::location() const
// Composes the provider location
{
    if (noSignRequest) {
        auto host = endpoint;
        if (host.empty()) {
            if (region.empty())
                throw utils::ConfigError("Unsigned requests need --endpoint or a region");
            host = "s3." + region + ".amazonaws.com";
        }
        return (https ? "https://" : "http://") + host + "/" + bucket + "/";
    }
    auto bucketRegion = region.empty() ? bucket : bucket + ":" + region;
    if (!endpoint.empty())
        return "minio://" + endpoint + "/" + bucketRegion + "/";
    return "s3://" + bucketRegion + "/";
}
//---------------------------------------------------------------------------
string Settings::describe() const
// The configuration for the log
{
    stringstream s;
    s << "bucket=" << bucket << " key=" << key << " program=" << program << " args=[";
    for (auto it = args.begin(); it != args.end(); ++it)
        s << (it == args.begin() ? "" : ", ") << *it;
    s << "] placeholder=" << placeholder << " log_level=" << utils::Log::getLevelName(logLevel);
    if (!endpoint.empty())
        s << " endpoint=" << endpoint;
    if (!region.empty())
        s << " region=" << region;
    s << " https=" << (https ? 1 : 0) << " retrievers=" << retrievers;
    if (noSignRequest)
        s << " unsigned";
    return s.str();
}
//---------------------------------------------------------------------------
string Settings::usage(string_view name)
// The help text
{
    stringstream s;
    s << "Usage: " << name << " [options] [--] <program> [args...]\n"
      << "Downloads an object from S3 into an anonymous memory file and executes the program.\n"
      << "Every occurrence of the placeholder in the arguments is replaced by the memory file path,\n"
      << "which is also passed as MEMFD_PATH in the environment.\n\n"
      << "Options:\n"
      << "  --bucket <name>              S3 bucket (default: $S3_BUCKET)\n"
      << "  --key <key>                  S3 key (default: $S3_KEY)\n"
      << "  --memfd-placeholder <token>  Argument placeholder (default: $MEMFD_PLACEHOLDER or {{memfd}})\n"
      << "  --log-level <level>          trace, debug, info, warn or error (default: info)\n"
      << "  --region <region>            AWS region (default: $AWS_REGION, $AWS_DEFAULT_REGION or instance metadata)\n"
      << "  --endpoint <host[:port]>     S3 compatible endpoint using path-style requests\n"
      << "  --https <0|1>                Use tls (default: 1)\n"
      << "  --retrievers <n>             Network threads (default: " << network::Config::defaultRetrievers << ")\n"
      << "  --no-sign-request            Anonymous requests for public buckets\n"
      << "  -h, --help                   Print this help\n\n"
      << "Credentials are taken from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and AWS_SESSION_TOKEN,\n"
      << "or from the instance metadata service if unset.\n";
    return s.str();
}
//---------------------------------------------------------------------------
} // namespace memrun::launcher
