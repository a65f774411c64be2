#include "memory/memfd_file.hpp"
#include "utils/error.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/mman.h>
#endif
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
unique_ptr<AnonymousFile> AnonymousFile::createAnonymousFile(const string& name)
// Picks the platform implementation
{
#ifdef __linux__
    return make_unique<MemfdFile>(name);
#else
    (void) name;
    throw utils::AllocationError("anonymous memory files require Linux");
#endif
}
//---------------------------------------------------------------------------
MemfdFile::MemfdFile(const string& name) : _fd(-1), _name(name)
// Constructor
{
#ifdef __linux__
    // No MFD_CLOEXEC, the descriptor has to survive the exec into the child
    _fd = memfd_create(_name.c_str(), 0);
    if (_fd < 0)
        throw utils::AllocationError(string("memfd_create: ") + strerror(errno));
#else
    throw utils::AllocationError("memfd_create requires Linux");
#endif
}
//---------------------------------------------------------------------------
MemfdFile::~MemfdFile() noexcept
// Destructor
{
    if (_fd >= 0)
        ::close(_fd);
}
//---------------------------------------------------------------------------
void MemfdFile::preallocate(uint64_t size)
// Sets the size
{
    if (_fd < 0)
        throw utils::AllocationError("memory file was already released");
    if (::ftruncate(_fd, static_cast<off_t>(size)) != 0)
        throw utils::AllocationError("ftruncate to " + to_string(size) + " bytes: " + strerror(errno));
}
//---------------------------------------------------------------------------
uint64_t MemfdFile::writeAt(const uint8_t* data, uint64_t length, uint64_t offset)
// Writes at the offset, loops over short writes
{
    uint64_t written = 0;
    while (written < length) {
        auto result = ::pwrite(_fd, data + written, length - written, static_cast<off_t>(offset + written));
        if (result < 0) {
            if (errno == EINTR)
                continue;
            throw utils::WriteError(offset, length, strerror(errno));
        }
        if (result == 0)
            break;
        written += static_cast<uint64_t>(result);
    }
    return written;
}
//---------------------------------------------------------------------------
string MemfdFile::resolvePath() const
// The proc path
{
    return "/proc/self/fd/" + to_string(_fd);
}
//---------------------------------------------------------------------------
int MemfdFile::release()
// Releases ownership
{
    auto flags = ::fcntl(_fd, F_GETFD);
    if (flags < 0 || ::fcntl(_fd, F_SETFD, flags & ~FD_CLOEXEC) < 0)
        throw utils::AllocationError(string("fcntl: ") + strerror(errno));
    auto fd = _fd;
    _fd = -1;
    return fd;
}
//---------------------------------------------------------------------------
}; // namespace memory
}; // namespace memrun
