#include "cloud/remote_store.hpp"
#include "launcher/launcher.hpp"
#include <catch2/catch.hpp>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("MinIO Integration") {
    // Get the environment, the object needs to be uploaded beforehand
    const char* bucket = getenv("AWS_S3_BUCKET");
    const char* region = getenv("AWS_S3_REGION");
    const char* endpoint = getenv("AWS_S3_ENDPOINT");
    const char* key = getenv("AWS_S3_ACCESS_KEY");
    const char* secret = getenv("AWS_S3_SECRET_ACCESS_KEY");
    const char* object = getenv("AWS_S3_OBJECT");
    if (!bucket || !region || !endpoint || !key || !secret || !object) {
        WARN("MinIO environment not set, skipping");
        return;
    }

    string location = "minio://";
    location = location + endpoint + "/" + bucket + ":" + region + "/";
    network::Config config;
    config.retrievers = 2;
    cloud::RemoteStore store(location, false, {key, secret, ""}, config);

    download::ObjectLocator locator{bucket, object};
    auto size = store.headSize(locator);

    vector<string> seenArgs;
    vector<char> content;
    auto executor = [&](const string&, const string&, const vector<string>& args, const vector<string>&) {
        seenArgs = args;
        ifstream file(args.at(0), ios::binary);
        content.assign(istreambuf_iterator<char>(file), istreambuf_iterator<char>());
    };
    launcher::Launcher launcher(store, locator, "sh", {"{{memfd}}"}, "{{memfd}}", executor);
    const char* environment[] = {"PATH=/usr/bin:/bin", nullptr};
    launcher.run(environment);

    REQUIRE(launcher.getState() == launcher::Launcher::State::HandedOff);
    REQUIRE(seenArgs.at(0).starts_with("/proc/self/fd/"));
    REQUIRE(content.size() == size);
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace memrun
