#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2021
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
class CredentialsProvider;
struct Credentials;
//---------------------------------------------------------------------------
/// Implements the GCP project logic
class GCP {
    public:
    /// The settings for gcp requests
    struct Settings {
        /// The endpoint
        std::string host = "storage.googleapis.com";
        /// Use https?
        bool https = true;
        /// The port, 0 uses the scheme default
        uint32_t port = 0;
        /// The project, empty falls back to the credentials and the environment
        std::string projectId = "";
    };

    /// The remote object of a gs:// path
    struct RemoteInfo {
        /// The bucket name
        std::string bucket;
        /// The object path
        std::string path;
    };

    /// The options of a signed url
    struct SignedUrlOptions {
        /// The http verb, one of GET, HEAD, PUT, POST, DELETE
        std::string method = "GET";
        /// The seconds until the url expires, relative to the signing time
        int64_t expires = 300;
        /// The content type the client has to send, may be empty
        std::string contentType = "";
        /// The base64 md5 the client has to send, may be empty
        std::string contentMD5 = "";
        /// The headers, only x-goog-* headers are signed
        std::multimap<std::string, std::string> headers;
        /// Extra query parameters, appended unsigned; the signature does not protect them
        std::map<std::string, std::string> query;
        /// The service account email, empty uses the credentials provider
        std::string issuer = "";
        /// The parsed private key, null uses the credentials provider
        std::shared_ptr<const utils::RSAKey> signingKey;
    };

    /// The remote prefix
    static constexpr std::string_view remoteFile = "gs://";
    /// The longest object name
    static constexpr uint64_t maxObjectNameLength = 1024;
    /// The query parameters that carry the signature
    static constexpr std::string_view signatureQueries[] = {"GoogleAccessId", "Expires", "Signature"};

    private:
    /// The settings
    Settings _settings;
    /// The credentials provider, may be null
    std::shared_ptr<CredentialsProvider> _credentialsProvider;

    /// Resolves the issuer and the key, throws SigningUnavailable
    [[nodiscard]] Credentials resolveCredentials(const SignedUrlOptions& options) const;

    public:
    /// The constructor with default settings and without credentials
    GCP();
    /// The constructor
    explicit GCP(Settings settings, std::shared_ptr<CredentialsProvider> credentialsProvider = nullptr);

    /// Get the settings
    [[nodiscard]] inline const Settings& getSettings() const { return _settings; }
    /// Get the credentials provider
    [[nodiscard]] inline const std::shared_ptr<CredentialsProvider>& getCredentialsProvider() const { return _credentialsProvider; }
    /// Get the scheme, host and the port if it is not the scheme default
    [[nodiscard]] std::string getAddress() const;
    /// Get the port of the server
    [[nodiscard]] uint32_t getPort() const;

    /// The project: the settings, then the credentials, then the environment
    [[nodiscard]] std::string projectId() const;
    /// The project named by STORAGE_PROJECT, GOOGLE_CLOUD_PROJECT or GCLOUD_PROJECT
    [[nodiscard]] static std::string defaultProjectId();

    /// Builds a url that grants one http operation on one object until it expires
    /// Throws SigningUnavailable without issuer or key and InvalidArgument for malformed input
    [[nodiscard]] std::string signedUrl(const std::string& bucket, const std::string& path, const SignedUrlOptions& options, std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
    /// Builds a signed GET url that expires in 300 seconds
    [[nodiscard]] std::string signedUrl(const std::string& bucket, const std::string& path) const;

    /// Is it a gs:// path?
    [[nodiscard]] static bool isRemoteFile(std::string_view fileName) noexcept;
    /// Get the bucket and the object path of a gs:// path
    [[nodiscard]] static RemoteInfo getRemoteInfo(std::string_view fileName);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace blobsign
