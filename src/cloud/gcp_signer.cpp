#include "cloud/gcp_signer.hpp"
#include "utils/rsa_key.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobsign {
namespace cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static string normalizeHeaderValue(string_view value)
// Trims the value and collapses whitespace runs into a single space
{
    string result;
    result.reserve(value.size());
    auto space = false;
    for (auto c : value) {
        if (isspace(static_cast<unsigned char>(c))) {
            space = true;
            continue;
        }
        if (space && !result.empty())
            result += ' ';
        space = false;
        result += c;
    }
    return result;
}
//---------------------------------------------------------------------------
string GCPSigner::canonicalizeExtensionHeaders(const multimap<string, string>& headers)
// Canonicalize the x-goog headers
{
    // lower case names, same names get joined in order
    map<string, string> sorted;
    for (auto& h : headers) {
        string key = h.first;
        transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return tolower(c); });
        key = normalizeHeaderValue(key);
        if (!key.starts_with(extensionHeaderPrefix))
            continue;
        if (find(begin(unsignedExtensionHeaders), end(unsignedExtensionHeaders), key) != end(unsignedExtensionHeaders))
            continue;
        auto value = normalizeHeaderValue(h.second);
        auto [it, inserted] = sorted.emplace(key, value);
        if (!inserted)
            it->second += "," + value;
    }

    stringstream headerStream;
    for (auto& h : sorted)
        headerStream << h.first << ":" << h.second << "\n";
    return headerStream.str();
}
//---------------------------------------------------------------------------
string GCPSigner::createStringToSign(const network::HttpRequest& request, StringToSign& stringToSign)
// Creates the canonical string
{
    stringToSign.canonicalHeaders = canonicalizeExtensionHeaders(request.headers);

    // positional fields, absent ones stay as empty lines
    stringstream requestStream;
    requestStream << network::HttpRequest::getRequestMethod(request.method) << "\n";
    requestStream << stringToSign.contentMD5 << "\n";
    requestStream << stringToSign.contentType << "\n";
    requestStream << stringToSign.expires << "\n";
    requestStream << stringToSign.canonicalHeaders;

    // canonicalize resource path; assume that path is RFC 3986 conform
    if (request.path.empty())
        requestStream << "/";
    else
        requestStream << request.path;

    return requestStream.str();
}
//---------------------------------------------------------------------------
string GCPSigner::createSignature(const utils::RSAKey& privateRSA, string_view stringToSign)
// Signs with rsa sha256
{
    auto signatureData = privateRSA.sign(reinterpret_cast<const uint8_t*>(stringToSign.data()), stringToSign.size());
    return utils::base64Encode(signatureData.first.get(), signatureData.second);
}
//---------------------------------------------------------------------------
string GCPSigner::createSignedRequest(const string& serviceAccountEmail, const utils::RSAKey& privateRSA, const network::HttpRequest& request, StringToSign& stringToSign)
// Creates the signed path and query
{
    auto stringToSignString = createStringToSign(request, stringToSign);
    auto signature = createSignature(privateRSA, stringToSignString);

    stringstream query;
    query << "GoogleAccessId=" << utils::encodeUrlParameters(serviceAccountEmail);
    query << "&Expires=" << stringToSign.expires;
    query << "&Signature=" << utils::encodeUrlParameters(signature);

    // not covered by the signature
    for (auto& q : request.queries)
        query << "&" << utils::encodeUrlParameters(q.first) << "=" << utils::encodeUrlParameters(q.second);

    return (request.path.empty() ? "/" : request.path) + "?" + query.str();
}
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace blobsign
