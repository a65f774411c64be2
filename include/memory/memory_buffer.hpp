#pragma once
#include "memory/anonymous_file.hpp"
#include <cstdint>
#include <memory>
#include <span>
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
/// Path and descriptor of a memory file as seen by an exec successor.
/// An owning reference is produced by consuming a MemoryBuffer, it keeps the
/// descriptor open until it is destroyed. A successful exec never runs the
/// destructor, so the child inherits the descriptor.
class ExternalFileReference {
    /// The path, e.g. /proc/self/fd/3
    std::string _path;
    /// The descriptor
    int _descriptor;
    /// Is the descriptor closed on destruction
    bool _owning;

    public:
    /// Constructor
    ExternalFileReference(std::string path, int descriptor, bool owning);
    /// Destructor
    ~ExternalFileReference() noexcept;
    /// No copies
    ExternalFileReference(const ExternalFileReference&) = delete;
    /// No copy assignment
    ExternalFileReference& operator=(const ExternalFileReference&) = delete;
    /// Move constructor
    ExternalFileReference(ExternalFileReference&& rhs) noexcept;
    /// Move assignment
    ExternalFileReference& operator=(ExternalFileReference&& rhs) noexcept;

    /// The path
    [[nodiscard]] const std::string& getPath() const { return _path; }
    /// The descriptor
    [[nodiscard]] int getDescriptor() const { return _descriptor; }
    /// Does the reference own the descriptor
    [[nodiscard]] bool isOwning() const { return _owning; }
};
//---------------------------------------------------------------------------
/// Writable in-memory region of a fixed size that receives the object bytes.
/// Positioned writes of disjoint ranges may happen concurrently.
class MemoryBuffer {
    /// The backing file
    std::unique_ptr<AnonymousFile> _file;
    /// The logical size
    uint64_t _size;

    public:
    /// Constructor
    explicit MemoryBuffer(std::unique_ptr<AnonymousFile> file);
    /// Move constructor
    MemoryBuffer(MemoryBuffer&&) noexcept = default;
    /// Move assignment
    MemoryBuffer& operator=(MemoryBuffer&&) noexcept = default;

    /// Creates an empty buffer, throws AllocationError
    [[nodiscard]] static MemoryBuffer create(const std::string& name);

    /// Sets the size to exactly size bytes, throws AllocationError
    void preallocate(uint64_t size);
    /// Stores the bytes at the offset, throws WriteError
    void writeAt(std::span<const uint8_t> data, uint64_t offset);
    /// A non owning reference for inspection
    [[nodiscard]] ExternalFileReference resolveReference() const;
    /// Consumes the buffer, the returned reference owns the descriptor
    [[nodiscard]] ExternalFileReference consume() &&;

    /// The size
    [[nodiscard]] uint64_t size() const { return _size; }
    /// Is the buffer still usable
    [[nodiscard]] bool valid() const { return _file != nullptr; }
};
//---------------------------------------------------------------------------
} // namespace memrun::memory
