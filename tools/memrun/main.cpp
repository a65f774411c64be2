#include "cloud/remote_store.hpp"
#include "launcher/launcher.hpp"
#include "launcher/settings.hpp"
#include "network/config.hpp"
#include "utils/error.hpp"
#include "utils/log.hpp"
#include <exception>
#include <iostream>
#include <unistd.h>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
#ifndef MEMRUN_VERSION
#define MEMRUN_VERSION "dev"
#endif
//---------------------------------------------------------------------------
using namespace std;
using namespace memrun;
//---------------------------------------------------------------------------
int main(int argc, char** argv)
// Downloads the object and replaces this process with the program
{
    launcher::Settings settings;
    try {
        settings = launcher::Settings::parse(argc, argv);
    } catch (const utils::ConfigError& e) {
        cerr << e.what() << "\n\n"
             << launcher::Settings::usage(argv[0]);
        return 1;
    }
    if (settings.help) {
        cout << launcher::Settings::usage(argv[0]);
        return 0;
    }

    utils::Log::setLevel(settings.logLevel);
    utils::Log::info("Starting memrun ", MEMRUN_VERSION);
    utils::Log::info("Configuration: ", settings.describe());

    try {
        network::Config config;
        config.retrievers = settings.retrievers;
        cloud::RemoteStore store(settings.location(), settings.https, settings.credentials, config);

        launcher::Launcher launcher(store, {settings.bucket, settings.key}, settings.program, settings.args, settings.placeholder);
        launcher.run(environ);
    } catch (const utils::Error& e) {
        utils::Log::error("Failed during ", utils::Error::getStageName(e.getStage()), ": ", e.what());
        return 1;
    } catch (const exception& e) {
        utils::Log::error(e.what());
        return 1;
    }
    return 0;
}
//---------------------------------------------------------------------------
