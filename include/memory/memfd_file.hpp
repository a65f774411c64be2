#pragma once
#include "memory/anonymous_file.hpp"
#include <string>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::memory {
//---------------------------------------------------------------------------
/// Linux memfd backed anonymous file
class MemfdFile : public AnonymousFile {
    /// The descriptor, -1 after release
    int _fd;
    /// The debug name shown in /proc/self/fd
    std::string _name;

    public:
    /// Creates the memfd without close-on-exec, throws AllocationError
    explicit MemfdFile(const std::string& name);
    /// Destructor
    ~MemfdFile() noexcept override;
    /// No copies
    MemfdFile(const MemfdFile&) = delete;
    /// No copy assignment
    MemfdFile& operator=(const MemfdFile&) = delete;

    /// Truncates to size
    void preallocate(uint64_t size) override;
    /// pwrite
    uint64_t writeAt(const uint8_t* data, uint64_t length, uint64_t offset) override;
    /// The descriptor
    [[nodiscard]] int rawDescriptor() const override { return _fd; }
    /// /proc/self/fd/<fd>
    [[nodiscard]] std::string resolvePath() const override;
    /// Clears FD_CLOEXEC and hands the descriptor out
    [[nodiscard]] int release() override;
    /// The name
    [[nodiscard]] const std::string& getName() const { return _name; }
};
//---------------------------------------------------------------------------
} // namespace memrun::memory
