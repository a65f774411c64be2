#include "network/message_result.hpp"
#include "network/http_response.hpp"
#include "utils/data_vector.hpp"
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
MessageResult::MessageResult() : dataVector(make_unique<utils::DataVector<uint8_t>>()), response(), failureCode(), failureMessage(), state(MessageState::Init)
// The default constructor
{
}
//---------------------------------------------------------------------------
MessageResult::~MessageResult() = default;
//---------------------------------------------------------------------------
string_view MessageResult::getResult() const
// Get the result
{
    if (!response || !dataVector || response->headResponse)
        return {};
    return string_view(reinterpret_cast<const char*>(dataVector->cdata()) + response->headerLength, response->length);
}
//---------------------------------------------------------------------------
const uint8_t* MessageResult::getData() const
// Get the const data
{
    return dataVector ? dataVector->cdata() : nullptr;
}
//---------------------------------------------------------------------------
uint64_t MessageResult::getSize() const
// Get the size
{
    return response ? response->length : 0;
}
//---------------------------------------------------------------------------
uint64_t MessageResult::getOffset() const
// Get the offset
{
    return response ? response->headerLength : 0;
}
//---------------------------------------------------------------------------
MessageState MessageResult::getState() const
// Get the state
{
    return state;
}
//---------------------------------------------------------------------------
uint16_t MessageResult::getFailureCode() const
// Get the failure code
{
    return failureCode;
}
//---------------------------------------------------------------------------
uint16_t MessageResult::getResponseCodeNumber() const
// Get the response code number
{
    return response ? response->response.status : 0;
}
//---------------------------------------------------------------------------
string_view MessageResult::getErrorResponse() const
// Get the error header
{
    if (response && dataVector)
        return string_view(reinterpret_cast<const char*>(dataVector->cdata()), dataVector->size());
    return ""sv;
}
//---------------------------------------------------------------------------
bool MessageResult::success() const
// Was the request successful
{
    return state == MessageState::Finished;
}
//---------------------------------------------------------------------------
string MessageResult::describeFailure() const
// A readable reason of a failed request
{
    if (success())
        return {};
    if (response && !response->response.success()) {
        auto code = HttpResponse::getCode(response->response.status);
        if (code != HttpResponse::Code::UNKNOWN)
            return "HTTP " + string(HttpResponse::getResponseCode(code));
        return "HTTP " + to_string(response->response.status);
    }

    string reason;
    auto append = [&](MessageFailureCode code, const char* text) {
        if (!(failureCode & static_cast<uint16_t>(code)))
            return;
        if (!reason.empty())
            reason += ", ";
        reason += text;
    };
    append(MessageFailureCode::Socket, "connection failed");
    append(MessageFailureCode::Empty, "connection closed by peer");
    append(MessageFailureCode::Timeout, "timeout");
    append(MessageFailureCode::Send, "send failed");
    append(MessageFailureCode::Recv, "receive failed");
    append(MessageFailureCode::HTTP, "malformed HTTP response");
    append(MessageFailureCode::TLS, "TLS failure");
    if (reason.empty())
        reason = "request aborted";
    if (!failureMessage.empty())
        reason += " (" + failureMessage + ")";
    return reason;
}
//---------------------------------------------------------------------------
utils::DataVector<uint8_t>& MessageResult::getDataVector()
// Returns the datavector as reference
{
    return *dataVector;
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> MessageResult::moveDataVector()
// Moves the data vector
{
    return move(dataVector);
}
//---------------------------------------------------------------------------
}; // namespace network
}; // namespace memrun
