#include "utils/utils.hpp"
#include <cassert>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <openssl/evp.h>
#include <openssl/md5.h>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace blobsign {
namespace utils {
//---------------------------------------------------------------------------
static int hexValue(char c)
// The value of a single hex digit, -1 if it is none
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
//---------------------------------------------------------------------------
static string digest(const EVP_MD* md, const uint8_t* data, uint64_t length)
// Computes the raw digest
{
    unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestInit_ex(mdctx.get(), md, nullptr) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestUpdate(mdctx.get(), data, length) <= 0)
        throw runtime_error("OpenSSL Error!");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned digestLength = 0;
    if (EVP_DigestFinal_ex(mdctx.get(), hash, &digestLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    return string(reinterpret_cast<char*>(hash), digestLength);
}
//---------------------------------------------------------------------------
string base64Encode(const uint8_t* input, uint64_t length)
// Encodes a string as a base64 string
{
    assert(in_range<int>(length));
    auto baseLength = 4 * ((length + 2) / 3);
    auto buffer = make_unique<char[]>(baseLength + 1);
    auto encodeLength = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(buffer.get()), input, static_cast<int>(length));
    if (encodeLength < 0 || static_cast<unsigned>(encodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    return string(buffer.get(), static_cast<unsigned>(encodeLength));
}
//---------------------------------------------------------------------------
pair<unique_ptr<uint8_t[]>, uint64_t> base64Decode(const uint8_t* input, uint64_t length)
// Decodes from base64 to raw string
{
    assert(in_range<int>(length));
    auto baseLength = 3 * length / 4;
    auto buffer = make_unique<uint8_t[]>(baseLength + 1);
    if (!length) {
        return {move(buffer), 0};
    }
    if (length % 4)
        throw runtime_error("Invalid base64 length!");
    auto decodeLength = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(buffer.get()), input, static_cast<int>(length));
    if (decodeLength < 0 || static_cast<unsigned>(decodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    // at most two padding characters
    for (auto i = 0u; i < 2 && input[length - 1 - i] == '='; i++)
        --decodeLength;
    return {move(buffer), static_cast<uint64_t>(decodeLength)};
}
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char hex[] = "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] >> 4])) : hex[input[i] >> 4]);
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] & 15])) : hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
string encodeUrlParameters(string_view encode)
// Encodes a string for url
{
    string result;
    result.reserve(encode.size());
    for (auto c : encode) {
        auto u = static_cast<unsigned char>(c);
        if (isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~')
            result += c;
        else {
            result += "%";
            result += hexEncode(&u, 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string decodeUrlParameters(string_view decode)
// Decodes a url encoded string
{
    string result;
    result.reserve(decode.size());
    for (auto i = 0u; i < decode.size(); i++) {
        if (decode[i] != '%') {
            result += decode[i];
            continue;
        }
        if (i + 2 >= decode.size())
            throw runtime_error("Invalid url encoding: Incomplete escape sequence!");
        auto high = hexValue(decode[i + 1]);
        auto low = hexValue(decode[i + 2]);
        if (high < 0 || low < 0)
            throw runtime_error("Invalid url encoding: No hex digits!");
        result += static_cast<char>((high << 4) | low);
        i += 2;
    }
    return result;
}
//---------------------------------------------------------------------------
string encodeUrlPath(string_view path)
// Encodes every path segment on its own
{
    string result;
    result.reserve(path.size());
    while (true) {
        auto pos = path.find('/');
        result += encodeUrlParameters(path.substr(0, pos));
        if (pos == path.npos)
            break;
        result += '/';
        path = path.substr(pos + 1);
    }
    return result;
}
//---------------------------------------------------------------------------
string sha256Encode(const uint8_t* data, uint64_t length)
// Encodes the data as sha256 hex string
{
    auto hash = digest(EVP_sha256(), data, length);
    return hexEncode(reinterpret_cast<const uint8_t*>(hash.data()), hash.size());
}
//---------------------------------------------------------------------------
string md5Base64Encode(const uint8_t* data, uint64_t length)
// Encodes the data as md5 base64 string
{
    auto hash = digest(EVP_md5(), data, length);
    if (hash.size() != MD5_DIGEST_LENGTH)
        throw runtime_error("OpenSSL Error!");
    return base64Encode(reinterpret_cast<const uint8_t*>(hash.data()), hash.size());
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace blobsign
