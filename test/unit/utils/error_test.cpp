#include "utils/error.hpp"
#include <catch2/catch.hpp>
#include <string>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("error_stages") {
    TransferError transfer(4194304, 8388607, "short body");
    REQUIRE(transfer.getStage() == Stage::Downloading);
    REQUIRE(transfer.getStart() == 4194304);
    REQUIRE(transfer.getEnd() == 8388607);
    REQUIRE(string(transfer.what()).find("4194304-8388607") != string::npos);
    REQUIRE(string(transfer.what()).find("short body") != string::npos);

    WriteError write(10, 20, "No space left on device");
    REQUIRE(write.getStage() == Stage::Downloading);
    REQUIRE(write.getOffset() == 10);

    REQUIRE(MetadataError("404").getStage() == Stage::Planning);
    REQUIRE(AllocationError("ENOMEM").getStage() == Stage::Allocation);
    REQUIRE(ConfigError("missing").getStage() == Stage::Configuration);

    ExecError exec("llama-server", "not found in PATH");
    REQUIRE(exec.getStage() == Stage::Exec);
    REQUIRE(exec.getProgram() == "llama-server");

    REQUIRE(Error::getStageName(Stage::Planning) == "planning");
    REQUIRE(Error::getStageName(Stage::Exec) == "exec");

    // Every error is catchable as the common base
    REQUIRE_THROWS_AS(throw TransferError(0, 1, "x"), Error);
}
//---------------------------------------------------------------------------
} // namespace memrun::utils::test
