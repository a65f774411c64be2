#include "cloud/aws_signer.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
string AWSSigner::encodeQueries(const network::HttpRequest& request)
// Canonical query string, the map keeps the keys sorted
{
    stringstream queryStream;
    for (auto it = request.queries.begin(); it != request.queries.end(); ++it) {
        if (it != request.queries.begin())
            queryStream << "&";
        queryStream << utils::encodeUrlParameters(it->first) << "=" << utils::encodeUrlParameters(it->second);
    }
    return queryStream.str();
}
//---------------------------------------------------------------------------
void AWSSigner::encodeCanonicalRequest(network::HttpRequest& request, StringToSign& stringToSign)
// Creates the canonical request (task 1)
// https://docs.aws.amazon.com/general/latest/gr/sigv4-create-canonical-request.html
{
    stringstream requestStream;
    // Step 1, canonicalize request method
    requestStream << network::HttpRequest::getRequestMethod(request.method) << "\n";

    // Step 2, canonicalize request path; assume that path is RFC 3986 conform
    if (request.path.empty())
        requestStream << "/\n";
    else
        requestStream << request.path << "\n";

    // Step 3, canonicalize query
    requestStream << encodeQueries(request) << "\n";

    // Step 6, create sha256 payload string, earlier because of https://docs.aws.amazon.com/AmazonS3/latest/API/sig-v4-header-based-auth.html
    // GET and HEAD requests have an empty payload
    stringToSign.payloadHash = utils::sha256Encode(nullptr, 0);
    request.headers.emplace("x-amz-content-sha256", stringToSign.payloadHash);

    // Step 4, canonicalize headers, assume no unnecessary whitespaces in header
    map<string, string> sorted;
    for (const auto& h : request.headers) {
        string val = h.first;
        transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return tolower(c); });
        sorted.emplace(val, h.second);
    }
    for (const auto& h : sorted)
        requestStream << h.first << ":" << h.second << "\n";
    requestStream << "\n";

    // Step 5, create signed headers
    stringstream signedRequests;
    for (auto it = sorted.begin(); it != sorted.end(); ++it) {
        if (it != sorted.begin())
            signedRequests << ";";
        signedRequests << it->first;
    }
    stringToSign.signedHeaders = signedRequests.str();
    requestStream << stringToSign.signedHeaders << "\n";

    // Step 6 continuing
    requestStream << stringToSign.payloadHash;

    // Step 7, create sha256 request string
    auto requestString = requestStream.str();
    stringToSign.requestSHA = utils::sha256Encode(reinterpret_cast<const uint8_t*>(requestString.data()), requestString.length());
}
//---------------------------------------------------------------------------
string AWSSigner::createStringToSign(const StringToSign& stringToSign)
// Creates the string to sign (task 2)
// https://docs.aws.amazon.com/general/latest/gr/sigv4-create-string-to-sign.html
{
    auto it = stringToSign.request.headers.find("x-amz-date");
    if (it == stringToSign.request.headers.end())
        throw runtime_error("missing x-amz-date");

    stringstream requestStream;
    requestStream << "AWS4-HMAC-SHA256\n";
    requestStream << it->second << "\n";
    requestStream << it->second.substr(0, 8) << "/" << stringToSign.region << "/" << stringToSign.service << "/aws4_request\n";
    requestStream << stringToSign.requestSHA;
    return requestStream.str();
}
//---------------------------------------------------------------------------
string AWSSigner::createSignedRequest(const string& keyId, const string& secret, const StringToSign& stringToSign)
// Calculates the signature for AWS signature version 4 (task 3)
// https://docs.aws.amazon.com/general/latest/gr/sigv4-calculate-signature.html
{
    // Step 1, build derivedSigningKey
    auto it = stringToSign.request.headers.find("x-amz-date");
    if (it == stringToSign.request.headers.end())
        throw runtime_error("missing x-amz-date");

    string kRequest = "aws4_request";
    auto kSecret = "AWS4" + secret;
    auto date = it->second.substr(0, 8);
    auto derivedSigningKey = utils::hmacSign(reinterpret_cast<const uint8_t*>(kSecret.data()), kSecret.length(), reinterpret_cast<const uint8_t*>(date.data()), date.length());
    derivedSigningKey = utils::hmacSign(derivedSigningKey.first.get(), derivedSigningKey.second, reinterpret_cast<const uint8_t*>(stringToSign.region.data()), stringToSign.region.length());
    derivedSigningKey = utils::hmacSign(derivedSigningKey.first.get(), derivedSigningKey.second, reinterpret_cast<const uint8_t*>(stringToSign.service.data()), stringToSign.service.length());
    derivedSigningKey = utils::hmacSign(derivedSigningKey.first.get(), derivedSigningKey.second, reinterpret_cast<const uint8_t*>(kRequest.data()), kRequest.length());

    // Step 2, finally sign the stringToSign with the derivedSigningKey
    auto stringToSignString = createStringToSign(stringToSign);
    derivedSigningKey = utils::hmacSign(derivedSigningKey.first.get(), derivedSigningKey.second, reinterpret_cast<const uint8_t*>(stringToSignString.data()), stringToSignString.length());
    const auto signature = utils::hexEncode(derivedSigningKey.first.get(), derivedSigningKey.second);

    // https://docs.aws.amazon.com/general/latest/gr/sigv4-add-signature-to-request.html (task 4)
    stringstream authorization;
    authorization << "AWS4-HMAC-SHA256"
                  << " Credential=" << keyId << "/" << date << "/" << stringToSign.region << "/" << stringToSign.service << "/" << kRequest << ", SignedHeaders=" << stringToSign.signedHeaders << ", Signature=" << signature;

    stringToSign.request.headers.emplace("Authorization", authorization.str());

    return (stringToSign.request.path.empty() ? "/" : stringToSign.request.path) + "?" + encodeQueries(stringToSign.request);
}
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace memrun
