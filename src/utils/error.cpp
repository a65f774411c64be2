#include "utils/error.hpp"
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace utils {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
Error::Error(Stage stage, const string& message) : runtime_error(message), _stage(stage)
// Constructor
{
}
//---------------------------------------------------------------------------
string_view Error::getStageName(Stage stage)
// The stage name used in log lines
{
    switch (stage) {
        case Stage::Configuration: return "configuration";
        case Stage::Planning: return "planning";
        case Stage::Allocation: return "allocation";
        case Stage::Downloading: return "downloading";
        case Stage::Exec: return "exec";
    }
    return "unknown";
}
//---------------------------------------------------------------------------
ConfigError::ConfigError(const string& message) : Error(Stage::Configuration, message)
// Constructor
{
}
//---------------------------------------------------------------------------
MetadataError::MetadataError(const string& message) : Error(Stage::Planning, "Failed to get object metadata: " + message)
// Constructor
{
}
//---------------------------------------------------------------------------
AllocationError::AllocationError(const string& message) : Error(Stage::Allocation, "Failed to allocate memory file: " + message)
// Constructor
{
}
//---------------------------------------------------------------------------
TransferError::TransferError(uint64_t start, uint64_t end, const string& reason)
    : Error(Stage::Downloading, "Failed to download range " + to_string(start) + "-" + to_string(end) + ": " + reason), _start(start), _end(end)
// Constructor
{
}
//---------------------------------------------------------------------------
WriteError::WriteError(uint64_t offset, uint64_t length, const string& reason)
    : Error(Stage::Downloading, "Failed to write " + to_string(length) + " bytes at offset " + to_string(offset) + ": " + reason), _offset(offset)
// Constructor
{
}
//---------------------------------------------------------------------------
ExecError::ExecError(const string& program, const string& reason) : Error(Stage::Exec, "Failed to execute " + program + ": " + reason), _program(program)
// Constructor
{
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace memrun
