#pragma once
#include <memory>
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
namespace utils {
class RSAKey;
class RSAKeyCache;
} // namespace utils
//---------------------------------------------------------------------------
namespace cloud {
//---------------------------------------------------------------------------
/// The service account credentials used for signing
struct Credentials {
    /// The service account email, the issuer of signatures
    std::string clientEmail;
    /// The parsed private key
    std::shared_ptr<const utils::RSAKey> privateKey;
    /// The project of the service account, may be empty
    std::string projectId;

    /// Are the credentials usable for signing?
    [[nodiscard]] bool canSign() const { return !clientEmail.empty() && privateKey; }

    /// Parses a PEM private key through the key cache, throws SigningUnavailable if it does not parse
    [[nodiscard]] static std::shared_ptr<const utils::RSAKey> parsePrivateKey(std::string_view pem);
    /// Parses a PEM private key through the given key cache
    [[nodiscard]] static std::shared_ptr<const utils::RSAKey> parsePrivateKey(std::string_view pem, utils::RSAKeyCache& cache);
    /// Parses the content of a key file, throws SigningUnavailable if it is malformed
    /// Key files of other types than service_account (e.g. authorized_user) carry no private key and yield nullopt
    [[nodiscard]] static std::optional<Credentials> fromJson(std::string_view json);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace blobsign
