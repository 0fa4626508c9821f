#pragma once
#include "cloud/credentials.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
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
/// Supplies the credentials of a project when a call does not bring its own
class CredentialsProvider {
    /// The name
    std::string _name;

    public:
    /// The constructor
    explicit CredentialsProvider(std::string name) : _name(std::move(name)) {}
    /// The destructor
    virtual ~CredentialsProvider() noexcept = default;

    /// The provider name
    [[nodiscard]] const std::string& name() const { return _name; }
    /// Looks up the credentials, nullopt if this provider has none
    /// Malformed key material raises SigningUnavailable instead of falling through
    [[nodiscard]] virtual std::optional<Credentials> loadCredentials() = 0;
};
//---------------------------------------------------------------------------
/// Returns fixed credentials
class StaticCredentialsProvider : public CredentialsProvider {
    /// The credentials
    Credentials _credentials;

    public:
    /// The constructor
    explicit StaticCredentialsProvider(Credentials credentials);
    /// The constructor from an issuer and a PEM private key
    StaticCredentialsProvider(const std::string& clientEmail, std::string_view privateKey, const std::string& projectId = "");

    [[nodiscard]] std::optional<Credentials> loadCredentials() override;
};
//---------------------------------------------------------------------------
/// Reads a service account key file, once
class KeyFileCredentialsProvider : public CredentialsProvider {
    /// The path
    std::string _path;
    /// The loaded credentials
    std::optional<Credentials> _credentials;
    /// Was the file already read?
    bool _loaded = false;
    /// The mutex
    std::mutex _mutex;

    public:
    /// The constructor
    explicit KeyFileCredentialsProvider(std::string path);

    [[nodiscard]] std::optional<Credentials> loadCredentials() override;

    /// Reads a file, nullopt if it can not be opened
    [[nodiscard]] static std::optional<std::string> readFile(const std::string& path);
};
//---------------------------------------------------------------------------
/// Reads the key file or key json named by the environment
/// Key file variables are checked before inline json variables, the first one that is set wins
class EnvironmentCredentialsProvider : public CredentialsProvider {
    public:
    /// The key file path variables
    static constexpr const char* pathVariables[] = {"STORAGE_CREDENTIALS", "STORAGE_KEYFILE", "GOOGLE_CLOUD_CREDENTIALS", "GOOGLE_CLOUD_KEYFILE", "GCLOUD_KEYFILE", "GOOGLE_APPLICATION_CREDENTIALS"};
    /// The key json variables
    static constexpr const char* jsonVariables[] = {"STORAGE_CREDENTIALS_JSON", "STORAGE_KEYFILE_JSON", "GOOGLE_CLOUD_CREDENTIALS_JSON", "GOOGLE_CLOUD_KEYFILE_JSON", "GCLOUD_KEYFILE_JSON"};

    /// The constructor
    EnvironmentCredentialsProvider();

    [[nodiscard]] std::optional<Credentials> loadCredentials() override;
};
//---------------------------------------------------------------------------
/// Asks the providers in order and returns the first credentials found
class CredentialsProviderChain : public CredentialsProvider {
    /// The providers
    std::vector<std::unique_ptr<CredentialsProvider>> _providers;

    public:
    /// The constructor
    CredentialsProviderChain();

    [[nodiscard]] std::optional<Credentials> loadCredentials() override;

    /// Append a provider
    void addProvider(std::unique_ptr<CredentialsProvider> provider);
    /// The number of providers
    [[nodiscard]] uint64_t size() const { return _providers.size(); }

    /// The well known gcloud credentials file, empty if HOME is not set
    [[nodiscard]] static std::string wellKnownFile();
    /// Environment followed by the well known gcloud file
    [[nodiscard]] static std::unique_ptr<CredentialsProviderChain> defaultChain();
};
//---------------------------------------------------------------------------
} // namespace blobsign::cloud
