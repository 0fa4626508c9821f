#include "utils/rsa_key.hpp"
#include "utils/utils.hpp"
#include <cassert>
#include <stdexcept>
#include <utility>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2024
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
RSAKey::RSAKey(EVP_PKEY* key) : _key(key, EVP_PKEY_free)
// The constructor
{
}
//---------------------------------------------------------------------------
shared_ptr<const RSAKey> RSAKey::fromPEM(string_view pem)
// Reads the private key
{
    if (pem.empty() || !in_range<int>(pem.size()))
        throw runtime_error("OpenSSL Error - Invalid Key Length!");

    unique_ptr<BIO, decltype(&BIO_free_all)> keybio(BIO_new_mem_buf(reinterpret_cast<const void*>(pem.data()), static_cast<int>(pem.size())), BIO_free_all);
    if (!keybio)
        throw runtime_error("OpenSSL Error - No Buffer Mem!");

    // handles both the traditional and the pkcs8 encoding
    EVP_PKEY* priKey = nullptr;
    if (!PEM_read_bio_PrivateKey(keybio.get(), &priKey, nullptr, nullptr))
        throw runtime_error("OpenSSL Error - Read Private Key!");

    shared_ptr<const RSAKey> key(new RSAKey(priKey));
    if (EVP_PKEY_get_base_id(priKey) != EVP_PKEY_RSA)
        throw runtime_error("OpenSSL Error - No RSA Key!");
    return key;
}
//---------------------------------------------------------------------------
pair<unique_ptr<uint8_t[]>, uint64_t> RSAKey::sign(const uint8_t* msgData, uint64_t msgLength) const
// Encodes the msg with the key with rsa
{
    unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> rsaSign(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!rsaSign)
        throw runtime_error("OpenSSL Error - Sign Context!");

    // rsa keys default to PKCS#1 v1.5 padding
    if (EVP_DigestSignInit(rsaSign.get(), nullptr, EVP_sha256(), nullptr, _key.get()) <= 0)
        throw runtime_error("OpenSSL Error - Sign Init!");

    if (EVP_DigestSignUpdate(rsaSign.get(), msgData, msgLength) <= 0)
        throw runtime_error("OpenSSL Error - Sign Update!");

    size_t msgLenghtEnc;
    if (EVP_DigestSignFinal(rsaSign.get(), nullptr, &msgLenghtEnc) <= 0)
        throw runtime_error("OpenSSL Error - Sign Final!");

    auto hash = make_unique<uint8_t[]>(msgLenghtEnc);
    if (EVP_DigestSignFinal(rsaSign.get(), hash.get(), &msgLenghtEnc) <= 0)
        throw runtime_error("OpenSSL Error - Sign Final!");

    return {move(hash), msgLenghtEnc};
}
//---------------------------------------------------------------------------
bool RSAKey::verify(const uint8_t* msgData, uint64_t msgLength, const uint8_t* sigData, uint64_t sigLength) const
// Verifies the signature of the msg
{
    unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> rsaVerify(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!rsaVerify)
        throw runtime_error("OpenSSL Error - Verify Context!");

    if (EVP_DigestVerifyInit(rsaVerify.get(), nullptr, EVP_sha256(), nullptr, _key.get()) <= 0)
        throw runtime_error("OpenSSL Error - Verify Init!");

    if (EVP_DigestVerifyUpdate(rsaVerify.get(), msgData, msgLength) <= 0)
        throw runtime_error("OpenSSL Error - Verify Update!");

    // 1 is a valid signature, 0 an invalid one, everything else an error
    auto result = EVP_DigestVerifyFinal(rsaVerify.get(), sigData, sigLength);
    if (result < 0)
        throw runtime_error("OpenSSL Error - Verify Final!");
    return result == 1;
}
//---------------------------------------------------------------------------
unsigned RSAKey::bits() const
// The modulus size
{
    auto bits = EVP_PKEY_get_bits(_key.get());
    assert(bits > 0);
    return static_cast<unsigned>(bits);
}
//---------------------------------------------------------------------------
shared_ptr<const RSAKey> RSAKeyCache::get(string_view pem)
// Looks up the key, parses it on a miss
{
    auto digest = sha256Encode(reinterpret_cast<const uint8_t*>(pem.data()), pem.size());
    {
        unique_lock lock(_mutex);
        if (auto it = _cache.find(digest); it != _cache.end())
            return it->second;
    }

    // parse outside of the lock, a concurrent miss parses the same key twice and the first insert wins
    auto key = RSAKey::fromPEM(pem);

    unique_lock lock(_mutex);
    auto [it, inserted] = _cache.emplace(digest, key);
    if (!inserted)
        return it->second;
    _fifo.emplace(_timestamp++, digest);
    while (_cache.size() > _entries) {
        auto oldest = _fifo.begin();
        _cache.erase(oldest->second);
        _fifo.erase(oldest);
    }
    return key;
}
//---------------------------------------------------------------------------
uint64_t RSAKeyCache::size() const
// The number of cached keys
{
    unique_lock lock(_mutex);
    return _cache.size();
}
//---------------------------------------------------------------------------
void RSAKeyCache::clear()
// Drops all keys
{
    unique_lock lock(_mutex);
    _cache.clear();
    _fifo.clear();
}
//---------------------------------------------------------------------------
RSAKeyCache& RSAKeyCache::global()
// The process wide cache
{
    static RSAKeyCache cache;
    return cache;
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace blobsign
