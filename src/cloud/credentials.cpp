#include "cloud/credentials.hpp"
#include "cloud/signing_error.hpp"
#include "utils/rsa_key.hpp"
#include <string>
#include <nlohmann/json.hpp>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobsign::cloud {
//---------------------------------------------------------------------------
using namespace std;
using json = nlohmann::json;
//---------------------------------------------------------------------------
shared_ptr<const utils::RSAKey> Credentials::parsePrivateKey(string_view pem)
// Parses the key with the process wide cache
{
    return parsePrivateKey(pem, utils::RSAKeyCache::global());
}
//---------------------------------------------------------------------------
shared_ptr<const utils::RSAKey> Credentials::parsePrivateKey(string_view pem, utils::RSAKeyCache& cache)
// Parses the key
{
    if (pem.empty())
        throw SigningUnavailable("Signing key is empty");
    try {
        return cache.get(pem);
    } catch (const runtime_error& e) {
        throw SigningUnavailable(string("Signing key could not be parsed: ") + e.what());
    }
}
//---------------------------------------------------------------------------
optional<Credentials> Credentials::fromJson(string_view content)
// Parses a key file
{
    json j;
    try {
        j = json::parse(content.begin(), content.end());
    } catch (const json::exception& e) {
        throw SigningUnavailable(string("Key file is no valid json: ") + e.what());
    }
    if (!j.is_object())
        throw SigningUnavailable("Key file is no json object");

    if (j.contains("type") && j.at("type") != "service_account")
        return nullopt;

    Credentials credentials;
    try {
        credentials.clientEmail = j.at("client_email").get<string>();
        auto privateKey = j.at("private_key").get<string>();
        credentials.privateKey = parsePrivateKey(privateKey);
        if (j.contains("project_id"))
            credentials.projectId = j.at("project_id").get<string>();
    } catch (const json::exception& e) {
        throw SigningUnavailable(string("Key file is missing a field: ") + e.what());
    }
    if (credentials.clientEmail.empty())
        throw SigningUnavailable("Key file has an empty client_email");
    return credentials;
}
//---------------------------------------------------------------------------
} // namespace blobsign::cloud
