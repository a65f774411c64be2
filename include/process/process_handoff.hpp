#pragma once
#include "memory/memory_buffer.hpp"
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
namespace memrun::process {
//---------------------------------------------------------------------------
/// Exposes a finished memory buffer to a program that replaces this process
class ProcessHandoff {
    public:
    /// The default placeholder in the program arguments
    static constexpr std::string_view defaultPlaceholder = "{{memfd}}";
    /// The environment variable that carries the reference into the child
    static constexpr std::string_view referenceVariable = "MEMFD_PATH";

    /// Consumes the buffer, the descriptor is owned by the returned reference and survives exec
    [[nodiscard]] static memory::ExternalFileReference finalize(memory::MemoryBuffer&& buffer);
    /// Replaces every occurrence of token in every argument with the reference path
    [[nodiscard]] static std::vector<std::string> substitutePlaceholder(const std::vector<std::string>& args, std::string_view token, const memory::ExternalFileReference& reference);
    /// The environment of the child, the base entries plus the reference variable
    [[nodiscard]] static std::vector<std::string> buildEnvironment(const memory::ExternalFileReference& reference, const char* const* base);
    /// Resolves the program via PATH like execvp, throws ExecError if it is not executable
    [[nodiscard]] static std::string resolveProgram(const std::string& program, const char* searchPath);
    /// Replaces the process image with the resolved path, name becomes argv[0], only returns by throwing ExecError
    [[noreturn]] static void execReplace(const std::string& path, const std::string& name, const std::vector<std::string>& args, const std::vector<std::string>& environment);
};
//---------------------------------------------------------------------------
} // namespace memrun::process
