#pragma once
#include "network/http_helper.hpp"
#include <atomic>
#include <memory>
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
namespace memrun {
namespace utils {
//---------------------------------------------------------------------------
template <typename T>
class DataVector;
//---------------------------------------------------------------------------
} // namespace utils
//---------------------------------------------------------------------------
namespace network {
//---------------------------------------------------------------------------
struct OriginalMessage;
struct HTTPMessage;
struct HTTPSMessage;
class TLSConnection;
//---------------------------------------------------------------------------
/// Current status of the message
enum class MessageState : uint8_t {
    Init,
    TLSHandshake,
    InitSending,
    Sending,
    InitReceiving,
    Receiving,
    Finished,
    Aborted
};
//---------------------------------------------------------------------------
/// The failure codes
enum class MessageFailureCode : uint16_t {
    /// Socket creation error
    Socket = 1,
    /// Empty request error
    Empty = 1 << 1,
    /// Timeout passed
    Timeout = 1 << 2,
    /// Send syscall error
    Send = 1 << 3,
    /// Recv syscall error
    Recv = 1 << 4,
    /// HTTP header error
    HTTP = 1 << 5,
    /// TLS error
    TLS = 1 << 6
};
//---------------------------------------------------------------------------
/// The result class
class MessageResult {
    protected:
    /// The data
    std::unique_ptr<utils::DataVector<uint8_t>> dataVector;
    /// The http response header info
    std::unique_ptr<HttpHelper::Info> response;
    /// The failure code
    uint16_t failureCode;
    /// The socket or connect error message
    std::string failureMessage;
    /// The state
    std::atomic<MessageState> state;

    public:
    /// The default constructor
    MessageResult();
    /// The destructor
    ~MessageResult();

    /// Get the body
    [[nodiscard]] std::string_view getResult() const;
    /// Get the const data
    [[nodiscard]] const uint8_t* getData() const;
    /// Get the body size
    [[nodiscard]] uint64_t getSize() const;
    /// Get the body offset, i.e., the header length
    [[nodiscard]] uint64_t getOffset() const;
    /// Get the state
    [[nodiscard]] MessageState getState() const;
    /// Get the failure code
    [[nodiscard]] uint16_t getFailureCode() const;
    /// Get the error response (incl. header)
    [[nodiscard]] std::string_view getErrorResponse() const;
    /// Get the response code number, 0 without response
    [[nodiscard]] uint16_t getResponseCodeNumber() const;
    /// Get the response header info, nullptr without response
    [[nodiscard]] const HttpHelper::Info* getResponse() const { return response.get(); }
    /// Was the request successful
    [[nodiscard]] bool success() const;
    /// A readable reason of a failed request
    [[nodiscard]] std::string describeFailure() const;

    /// Get the data vector reference
    [[nodiscard]] utils::DataVector<uint8_t>& getDataVector();
    /// Transfer ownership of data vector
    [[nodiscard]] std::unique_ptr<utils::DataVector<uint8_t>> moveDataVector();

    /// Define the friend message and message tasks
    friend HTTPMessage;
    friend HTTPSMessage;
    friend OriginalMessage;
    friend TLSConnection;
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace memrun
