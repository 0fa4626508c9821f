#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobsign {
//---------------------------------------------------------------------------
namespace network {
//---------------------------------------------------------------------------
/// The request that gets signed, or the request a signed url describes
struct HttpRequest {
    /// The method class
    enum class Method : uint8_t {
        GET,
        HEAD,
        PUT,
        POST,
        DELETE
    };
    /// The queries - decoded
    std::map<std::string, std::string> queries;
    /// The headers - a name may occur multiple times
    std::multimap<std::string, std::string> headers;
    /// The method
    Method method = Method::GET;
    /// The path - needs to be RFC 3986 conform
    std::string path;

    /// Get the request method
    static constexpr auto getRequestMethod(const Method& method) {
        switch (method) {
            case Method::GET: return "GET";
            case Method::HEAD: return "HEAD";
            case Method::PUT: return "PUT";
            case Method::POST: return "POST";
            case Method::DELETE: return "DELETE";
            default: return "";
        }
    }
    /// Parse the request method, case insensitive
    [[nodiscard]] static std::optional<Method> parseRequestMethod(std::string_view method);
    /// Parse an absolute url, the host is stored in the Host header and the queries get decoded
    [[nodiscard]] static HttpRequest fromUrl(std::string_view url);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace blobsign
