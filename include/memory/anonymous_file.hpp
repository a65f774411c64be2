#pragma once
#include <cstdint>
#include <memory>
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
/// A memory backed file without a directory entry that a child process can open by path.
/// This is the only platform dependent piece of the launcher, the implementation
/// requires Linux (memfd_create and the /proc/self/fd namespace).
class AnonymousFile {
    public:
    /// Destructor closes a still owned descriptor
    virtual ~AnonymousFile() noexcept = default;

    /// Set the file length, the content stays zero until written
    virtual void preallocate(uint64_t size) = 0;
    /// Positioned write, returns the written bytes (may be short)
    virtual uint64_t writeAt(const uint8_t* data, uint64_t length, uint64_t offset) = 0;
    /// The raw descriptor
    [[nodiscard]] virtual int rawDescriptor() const = 0;
    /// The path under which the file is reachable from this process and its exec successors
    [[nodiscard]] virtual std::string resolvePath() const = 0;
    /// Give up ownership, the descriptor stays open across exec
    [[nodiscard]] virtual int release() = 0;

    /// Creates the platform's anonymous file, throws AllocationError
    [[nodiscard]] static std::unique_ptr<AnonymousFile> createAnonymousFile(const std::string& name);
};
//---------------------------------------------------------------------------
} // namespace memrun::memory
