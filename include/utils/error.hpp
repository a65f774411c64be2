#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::utils {
//---------------------------------------------------------------------------
/// The run stage an error belongs to
enum class Stage : uint8_t {
    Configuration,
    Planning,
    Allocation,
    Downloading,
    Exec
};
//---------------------------------------------------------------------------
/// Base of all errors that abort a run
class Error : public std::runtime_error {
    /// The failing stage
    Stage _stage;

    public:
    /// Constructor
    Error(Stage stage, const std::string& message);
    /// Get the failing stage
    [[nodiscard]] Stage getStage() const { return _stage; }
    /// Get the name of a stage
    [[nodiscard]] static std::string_view getStageName(Stage stage);
};
//---------------------------------------------------------------------------
/// Invalid command line or environment configuration
class ConfigError : public Error {
    public:
    /// Constructor
    explicit ConfigError(const std::string& message);
};
//---------------------------------------------------------------------------
/// The object size could not be determined
class MetadataError : public Error {
    public:
    /// Constructor
    explicit MetadataError(const std::string& message);
};
//---------------------------------------------------------------------------
/// The anonymous memory file could not be created or sized
class AllocationError : public Error {
    public:
    /// Constructor
    explicit AllocationError(const std::string& message);
};
//---------------------------------------------------------------------------
/// A ranged fetch failed or returned the wrong number of bytes
class TransferError : public Error {
    /// First byte of the range
    uint64_t _start;
    /// Last byte of the range (inclusive)
    uint64_t _end;

    public:
    /// Constructor
    TransferError(uint64_t start, uint64_t end, const std::string& reason);
    /// First byte of the failing range
    [[nodiscard]] uint64_t getStart() const { return _start; }
    /// Last byte of the failing range
    [[nodiscard]] uint64_t getEnd() const { return _end; }
};
//---------------------------------------------------------------------------
/// A positioned write into the memory buffer failed
class WriteError : public Error {
    /// The write offset
    uint64_t _offset;

    public:
    /// Constructor
    WriteError(uint64_t offset, uint64_t length, const std::string& reason);
    /// The failing offset
    [[nodiscard]] uint64_t getOffset() const { return _offset; }
};
//---------------------------------------------------------------------------
/// The process image could not be replaced
class ExecError : public Error {
    /// The program
    std::string _program;

    public:
    /// Constructor
    ExecError(const std::string& program, const std::string& reason);
    /// The program that failed
    [[nodiscard]] const std::string& getProgram() const { return _program; }
};
//---------------------------------------------------------------------------
} // namespace memrun::utils
