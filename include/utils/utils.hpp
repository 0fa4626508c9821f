#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobsign::utils {
//---------------------------------------------------------------------------
/// Encode url special characters in %HEX, keeps the RFC 3986 unreserved characters
std::string encodeUrlParameters(std::string_view encode);
/// Decode %HEX sequences
std::string decodeUrlParameters(std::string_view decode);
/// Encode every segment of a path, keeps the slashes
std::string encodeUrlPath(std::string_view path);
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Encode everything from binary representation to base64
std::string base64Encode(const uint8_t* input, uint64_t length);
/// Decodes from base64 to raw string
std::pair<std::unique_ptr<uint8_t[]>, uint64_t> base64Decode(const uint8_t* input, uint64_t length);
/// Build sha256 of the data encoded as hex
std::string sha256Encode(const uint8_t* data, uint64_t length);
/// Build md5 of the data encoded as base64, the Content-MD5 value of a payload
std::string md5Base64Encode(const uint8_t* data, uint64_t length);
//---------------------------------------------------------------------------
} // namespace blobsign::utils
