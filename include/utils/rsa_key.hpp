#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <openssl/types.h>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobsign::utils {
//---------------------------------------------------------------------------
/// A parsed RSA private key
/// The key is immutable after parsing, every operation uses its own OpenSSL context and the key can be shared between threads
class RSAKey {
    /// The key
    std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY*)> _key;

    /// The constructor
    explicit RSAKey(EVP_PKEY* key);

    public:
    /// Parses a PEM encoded private key, either PKCS#1 (BEGIN RSA PRIVATE KEY) or PKCS#8 (BEGIN PRIVATE KEY)
    [[nodiscard]] static std::shared_ptr<const RSAKey> fromPEM(std::string_view pem);

    /// Sign with sha256 and PKCS#1 v1.5 padding
    [[nodiscard]] std::pair<std::unique_ptr<uint8_t[]>, uint64_t> sign(const uint8_t* msgData, uint64_t msgLength) const;
    /// Verify a sha256 PKCS#1 v1.5 signature with the public part of the key
    [[nodiscard]] bool verify(const uint8_t* msgData, uint64_t msgLength, const uint8_t* sigData, uint64_t sigLength) const;
    /// The modulus size in bits
    [[nodiscard]] unsigned bits() const;
};
//---------------------------------------------------------------------------
/// Caches parsed keys by the sha256 of their PEM text
/// The cache is thread safe and hands out immutable keys
class RSAKeyCache {
    /// The default number of cached keys
    static constexpr unsigned defaultEntries = 64;

    /// The cache, uses the hex sha256 of the pem as key
    std::unordered_map<std::string, std::shared_ptr<const RSAKey>> _cache;
    /// The fifo deletion of keys
    std::map<uint64_t, std::string> _fifo;
    /// The timestamp counter for deletion
    uint64_t _timestamp = 0;
    /// The maximum number of entries
    unsigned _entries;
    /// The mutex
    mutable std::mutex _mutex;

    public:
    /// The constructor
    explicit RSAKeyCache(unsigned entries = defaultEntries) : _entries(entries ? entries : 1) {}

    /// Get the parsed key, parses and caches it on a miss
    [[nodiscard]] std::shared_ptr<const RSAKey> get(std::string_view pem);
    /// The number of cached keys
    [[nodiscard]] uint64_t size() const;
    /// Drops all keys
    void clear();

    /// The process wide cache
    [[nodiscard]] static RSAKeyCache& global();
};
//---------------------------------------------------------------------------
} // namespace blobsign::utils
