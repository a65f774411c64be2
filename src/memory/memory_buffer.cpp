#include "memory/memory_buffer.hpp"
#include "utils/error.hpp"
#include <unistd.h>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace memory {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
ExternalFileReference::ExternalFileReference(string path, int descriptor, bool owning) : _path(move(path)), _descriptor(descriptor), _owning(owning)
// Constructor
{
}
//---------------------------------------------------------------------------
ExternalFileReference::~ExternalFileReference() noexcept
// Destructor
{
    if (_owning && _descriptor >= 0)
        ::close(_descriptor);
}
//---------------------------------------------------------------------------
ExternalFileReference::ExternalFileReference(ExternalFileReference&& rhs) noexcept : _path(move(rhs._path)), _descriptor(rhs._descriptor), _owning(rhs._owning)
// Move constructor
{
    rhs._descriptor = -1;
    rhs._owning = false;
}
//---------------------------------------------------------------------------
ExternalFileReference& ExternalFileReference::operator=(ExternalFileReference&& rhs) noexcept
// Move assignment
{
    if (this != &rhs) {
        if (_owning && _descriptor >= 0)
            ::close(_descriptor);
        _path = move(rhs._path);
        _descriptor = rhs._descriptor;
        _owning = rhs._owning;
        rhs._descriptor = -1;
        rhs._owning = false;
    }
    return *this;
}
//---------------------------------------------------------------------------
MemoryBuffer::MemoryBuffer(unique_ptr<AnonymousFile> file) : _file(move(file)), _size(0)
// Constructor
{
}
//---------------------------------------------------------------------------
MemoryBuffer MemoryBuffer::create(const string& name)
// Creates the platform file
{
    return MemoryBuffer(AnonymousFile::createAnonymousFile(name));
}
//---------------------------------------------------------------------------
void MemoryBuffer::preallocate(uint64_t size)
// Sizes the file
{
    if (!_file)
        throw utils::AllocationError("buffer was already consumed");
    _file->preallocate(size);
    _size = size;
}
//---------------------------------------------------------------------------
void MemoryBuffer::writeAt(span<const uint8_t> data, uint64_t offset)
// Writes the range
{
    if (!_file)
        throw utils::WriteError(offset, data.size(), "buffer was already consumed");
    if (offset + data.size() > _size)
        throw utils::WriteError(offset, data.size(), "range exceeds the buffer size of " + to_string(_size));
    auto written = _file->writeAt(data.data(), data.size(), offset);
    if (written != data.size())
        throw utils::WriteError(offset, data.size(), "short write of " + to_string(written) + " bytes");
}
//---------------------------------------------------------------------------
ExternalFileReference MemoryBuffer::resolveReference() const
// Borrowed reference
{
    if (!_file)
        throw utils::AllocationError("buffer was already consumed");
    return ExternalFileReference(_file->resolvePath(), _file->rawDescriptor(), false);
}
//---------------------------------------------------------------------------
ExternalFileReference MemoryBuffer::consume() &&
// Moves the descriptor into the reference
{
    if (!_file)
        throw utils::AllocationError("buffer was already consumed");
    auto path = _file->resolvePath();
    auto fd = _file->release();
    _file.reset();
    return ExternalFileReference(move(path), fd, true);
}
//---------------------------------------------------------------------------
}; // namespace memory
}; // namespace memrun
