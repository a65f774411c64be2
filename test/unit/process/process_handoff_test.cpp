#include "process/process_handoff.hpp"
#include "memory/memory_buffer.hpp"
#include "utils/error.hpp"
#include <catch2/catch.hpp>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::process::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("process_handoff_substitute") {
    memory::ExternalFileReference reference("/proc/self/fd/7", -1, false);
    vector<string> args = {"-m", "{{memfd}}", "--mmap={{memfd}},{{memfd}}", "-c", "32768"};
    auto result = ProcessHandoff::substitutePlaceholder(args, ProcessHandoff::defaultPlaceholder, reference);
    REQUIRE(result == vector<string>{"-m", "/proc/self/fd/7", "--mmap=/proc/self/fd/7,/proc/self/fd/7", "-c", "32768"});
    // The input is left untouched
    REQUIRE(args[1] == "{{memfd}}");

    result = ProcessHandoff::substitutePlaceholder(args, "@MODEL@", reference);
    REQUIRE(result == args);
}
//---------------------------------------------------------------------------
TEST_CASE("process_handoff_environment") {
    memory::ExternalFileReference reference("/proc/self/fd/7", -1, false);
    const char* base[] = {"PATH=/usr/bin", "MEMFD_PATH=/stale", "MEMFD_PATHX=keep", nullptr};
    auto environment = ProcessHandoff::buildEnvironment(reference, base);
    REQUIRE(environment == vector<string>{"PATH=/usr/bin", "MEMFD_PATHX=keep", "MEMFD_PATH=/proc/self/fd/7"});

    environment = ProcessHandoff::buildEnvironment(reference, nullptr);
    REQUIRE(environment == vector<string>{"MEMFD_PATH=/proc/self/fd/7"});
}
//---------------------------------------------------------------------------
TEST_CASE("process_handoff_resolve") {
    REQUIRE(ProcessHandoff::resolveProgram("/bin/sh", nullptr) == "/bin/sh");
    auto sh = ProcessHandoff::resolveProgram("sh", "/nonexistent:/usr/bin:/bin");
    REQUIRE((sh == "/usr/bin/sh" || sh == "/bin/sh"));
    REQUIRE_THROWS_AS(ProcessHandoff::resolveProgram("memrun-no-such-program", "/usr/bin:/bin"), utils::ExecError);
    REQUIRE_THROWS_AS(ProcessHandoff::resolveProgram("/nonexistent/program", nullptr), utils::ExecError);
    REQUIRE_THROWS_AS(ProcessHandoff::resolveProgram("/etc/passwd", nullptr), utils::ExecError);
    REQUIRE_THROWS_AS(ProcessHandoff::resolveProgram("", nullptr), utils::ExecError);
}
//---------------------------------------------------------------------------
TEST_CASE("process_handoff_exec_failure") {
    REQUIRE_THROWS_AS(ProcessHandoff::execReplace("/nonexistent/program", "program", {}, {}), utils::ExecError);
}
//---------------------------------------------------------------------------
TEST_CASE("process_handoff_exec") {
    auto buffer = memory::MemoryBuffer::create("process_handoff_test");
    string content = "hello";
    buffer.preallocate(content.size());
    buffer.writeAt(span<const uint8_t>(reinterpret_cast<const uint8_t*>(content.data()), content.size()), 0);

    auto reference = ProcessHandoff::finalize(move(buffer));
    REQUIRE(reference.isOwning());
    // Without operands $0 is argv[0], the name as given
    vector<string> args = {"-c", "test \"$(cat {{memfd}})\" = hello && test \"$MEMFD_PATH\" = {{memfd}} && test \"$0\" = sh"};
    auto childArgs = ProcessHandoff::substitutePlaceholder(args, ProcessHandoff::defaultPlaceholder, reference);
    auto environment = ProcessHandoff::buildEnvironment(reference, nullptr);

    auto pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        try {
            ProcessHandoff::execReplace("/bin/sh", "sh", childArgs, environment);
        } catch (const utils::ExecError&) {
            _exit(127);
        }
    }
    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);
}
//---------------------------------------------------------------------------
} // namespace memrun::process::test
