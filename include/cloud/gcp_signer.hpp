#pragma once
#include "network/http_request.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobsign {
//---------------------------------------------------------------------------
namespace utils {
class RSAKey;
} // namespace utils
//---------------------------------------------------------------------------
namespace cloud {
//---------------------------------------------------------------------------
/// Implements the GCP Signing Logic for query parameter signed urls
/// It follows the v2 docu: https://cloud.google.com/storage/docs/access-control/signed-urls-v2
class GCPSigner {
    public:
    /// The prefix of the headers that take part in the signature
    static constexpr std::string_view extensionHeaderPrefix = "x-goog-";
    /// Extension headers that clients send but that are never signed
    static constexpr std::string_view unsignedExtensionHeaders[] = {"x-goog-encryption-key", "x-goog-encryption-key-sha256"};

    struct StringToSign {
        /// The content md5, empty if absent
        std::string contentMD5;
        /// The content type, empty if absent
        std::string contentType;
        /// The absolute expiration in seconds since epoch
        int64_t expires = 0;
        /// The canonical extension headers
        std::string canonicalHeaders;
    };

    /// Builds the canonical extension headers, every line is name:value\n
    [[nodiscard]] static std::string canonicalizeExtensionHeaders(const std::multimap<std::string, std::string>& headers);
    /// Builds the canonical string, sets the canonical headers of stringToSign from the request headers
    [[nodiscard]] static std::string createStringToSign(const network::HttpRequest& request, StringToSign& stringToSign);
    /// Signs the string and returns the base64 encoded signature
    [[nodiscard]] static std::string createSignature(const utils::RSAKey& privateRSA, std::string_view stringToSign);
    /// Builds the signed path and query, the request queries are appended unsigned
    [[nodiscard]] static std::string createSignedRequest(const std::string& serviceAccountEmail, const utils::RSAKey& privateRSA, const network::HttpRequest& request, StringToSign& stringToSign);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace blobsign
