#include "launcher/launcher.hpp"
#include "download/fake_object_store.hpp"
#include "utils/error.hpp"
#include <catch2/catch.hpp>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>
#include <fcntl.h>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::launcher::test {
//---------------------------------------------------------------------------
using namespace std;
using download::test::FakeObjectStore;
//---------------------------------------------------------------------------
namespace {
/// Records the handoff instead of replacing the test process
struct RecordingExecutor {
    /// Was the executor called
    bool called = false;
    /// The resolved program
    string program;
    /// The argv[0] name
    string name;
    /// The arguments
    vector<string> args;
    /// The environment
    vector<string> environment;
    /// The object as seen through the substituted path
    vector<uint8_t> content;
    /// Fail like an execve of a broken binary
    bool failExec = false;

    /// The executor
    Launcher::Executor get() {
        return [this](const string& p, const string& n, const vector<string>& a, const vector<string>& e) {
            called = true;
            program = p;
            name = n;
            args = a;
            environment = e;
            ifstream file(a.at(1), ios::binary);
            content.assign(istreambuf_iterator<char>(file), istreambuf_iterator<char>());
            if (failExec)
                throw utils::ExecError(p, "Exec format error");
        };
    }
};
/// The environment of the runs
const char* environment[] = {"PATH=/usr/bin:/bin", "HOME=/root", nullptr};
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("launcher_handoff") {
    FakeObjectStore store(10000000);
    RecordingExecutor executor;
    Launcher launcher(store, {"models", "model.gguf"}, "sh", {"-m", "{{memfd}}", "--alias={{memfd}}", "-t", "6"}, "{{memfd}}", executor.get());
    REQUIRE(launcher.getState() == Launcher::State::Idle);

    launcher.run(environment);
    REQUIRE(launcher.getState() == Launcher::State::HandedOff);
    REQUIRE(!launcher.getFailedStage());
    REQUIRE(executor.called);
    REQUIRE((executor.program == "/usr/bin/sh" || executor.program == "/bin/sh"));
    REQUIRE(executor.name == "sh");

    auto& path = executor.args.at(1);
    REQUIRE(path.starts_with("/proc/self/fd/"));
    REQUIRE(executor.args == vector<string>{"-m", path, "--alias=" + path, "-t", "6"});
    REQUIRE(executor.environment == vector<string>{"PATH=/usr/bin:/bin", "HOME=/root", "MEMFD_PATH=" + path});
    REQUIRE(executor.content == store.object());
    REQUIRE(launcher.getTimer().getMilliseconds(utils::Timer::Download) > 0);

    REQUIRE_THROWS_AS(launcher.run(environment), logic_error);
}
//---------------------------------------------------------------------------
TEST_CASE("launcher_short_body") {
    FakeObjectStore store(10000000);
    store.shortRangeStart = 4194304;
    RecordingExecutor executor;
    Launcher launcher(store, {"models", "model.gguf"}, "sh", {"{{memfd}}"}, "{{memfd}}", executor.get());

    REQUIRE_THROWS_AS(launcher.run(environment), utils::TransferError);
    REQUIRE(launcher.getState() == Launcher::State::Failed);
    REQUIRE(launcher.getFailedStage() == utils::Stage::Downloading);
    REQUIRE(!executor.called);
    REQUIRE(store.issued == store.settled);
}
//---------------------------------------------------------------------------
TEST_CASE("launcher_metadata_error") {
    FakeObjectStore store(10);
    store.failHead = true;
    RecordingExecutor executor;
    Launcher launcher(store, {"models", "missing"}, "sh", {"{{memfd}}"}, "{{memfd}}", executor.get());

    REQUIRE_THROWS_AS(launcher.run(environment), utils::MetadataError);
    REQUIRE(launcher.getState() == Launcher::State::Failed);
    REQUIRE(launcher.getFailedStage() == utils::Stage::Planning);
    REQUIRE(store.issued == 0);
    REQUIRE(!executor.called);
}
//---------------------------------------------------------------------------
TEST_CASE("launcher_missing_program") {
    FakeObjectStore store(10);
    RecordingExecutor executor;
    Launcher launcher(store, {"models", "model.gguf"}, "memrun-no-such-program", {"{{memfd}}"}, "{{memfd}}", executor.get());

    REQUIRE_THROWS_AS(launcher.run(environment), utils::ExecError);
    REQUIRE(launcher.getState() == Launcher::State::Failed);
    REQUIRE(launcher.getFailedStage() == utils::Stage::Exec);
    // Nothing was downloaded
    REQUIRE(store.heads == 0);
    REQUIRE(!executor.called);
}
//---------------------------------------------------------------------------
TEST_CASE("launcher_exec_error") {
    FakeObjectStore store(1000);
    RecordingExecutor executor;
    executor.failExec = true;
    Launcher launcher(store, {"models", "model.gguf"}, "sh", {"-m", "{{memfd}}"}, "{{memfd}}", executor.get());

    REQUIRE_THROWS_AS(launcher.run(environment), utils::ExecError);
    REQUIRE(launcher.getState() == Launcher::State::Failed);
    REQUIRE(launcher.getFailedStage() == utils::Stage::Exec);
    REQUIRE(executor.called);
    REQUIRE(executor.content == store.object());

    // The memory file is closed with the reference once the exec failed
    auto& path = executor.args.at(1);
    REQUIRE(path.starts_with("/proc/self/fd/"));
    auto descriptor = stoi(path.substr(14));
    errno = 0;
    REQUIRE(::fcntl(descriptor, F_GETFD) == -1);
    REQUIRE(errno == EBADF);
}
//---------------------------------------------------------------------------
TEST_CASE("launcher_find_variable") {
    REQUIRE(string(Launcher::findVariable(environment, "PATH")) == "/usr/bin:/bin");
    REQUIRE(Launcher::findVariable(environment, "PAT") == nullptr);
    REQUIRE(Launcher::findVariable(environment, "SHELL") == nullptr);
    REQUIRE(Launcher::findVariable(nullptr, "PATH") == nullptr);
}
//---------------------------------------------------------------------------
} // namespace memrun::launcher::test
