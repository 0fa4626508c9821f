#include "cloud/gcp.hpp"
#include "cloud/credentials.hpp"
#include "cloud/credentials_provider.hpp"
#include "cloud/gcp_signer.hpp"
#include "cloud/signing_error.hpp"
#include "network/http_request.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <limits>
#include <string>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2021
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobsign {
namespace cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
GCP::GCP() : GCP(Settings())
// The constructor
{
}
//---------------------------------------------------------------------------
GCP::GCP(Settings settings, shared_ptr<CredentialsProvider> credentialsProvider) : _settings(move(settings)), _credentialsProvider(move(credentialsProvider))
// The constructor
{
    if (_settings.host.empty())
        throw InvalidArgument("The storage host must not be empty");
}
//---------------------------------------------------------------------------
uint32_t GCP::getPort() const
// Get the port
{
    if (_settings.port)
        return _settings.port;
    return _settings.https ? 443 : 80;
}
//---------------------------------------------------------------------------
string GCP::getAddress() const
// Get the address
{
    string address = _settings.https ? "https://" : "http://";
    address += _settings.host;
    if (getPort() != (_settings.https ? 443u : 80u))
        address += ":" + to_string(getPort());
    return address;
}
//---------------------------------------------------------------------------
string GCP::defaultProjectId()
// The project of the environment
{
    for (auto* variable : {"STORAGE_PROJECT", "GOOGLE_CLOUD_PROJECT", "GCLOUD_PROJECT"})
        if (auto* value = getenv(variable); value && *value)
            return value;
    return "";
}
//---------------------------------------------------------------------------
string GCP::projectId() const
// The project
{
    if (!_settings.projectId.empty())
        return _settings.projectId;
    if (_credentialsProvider) {
        auto credentials = _credentialsProvider->loadCredentials();
        if (credentials && !credentials->projectId.empty())
            return credentials->projectId;
    }
    return defaultProjectId();
}
//---------------------------------------------------------------------------
Credentials GCP::resolveCredentials(const SignedUrlOptions& options) const
// Explicit issuer and key win, the provider fills in what is missing
{
    Credentials credentials;
    credentials.clientEmail = options.issuer;
    credentials.privateKey = options.signingKey;

    if ((credentials.clientEmail.empty() || !credentials.privateKey) && _credentialsProvider) {
        auto provided = _credentialsProvider->loadCredentials();
        if (provided) {
            if (credentials.clientEmail.empty())
                credentials.clientEmail = provided->clientEmail;
            if (!credentials.privateKey)
                credentials.privateKey = provided->privateKey;
            credentials.projectId = provided->projectId;
        }
    }

    if (credentials.clientEmail.empty())
        throw SigningUnavailable("Signed urls require an issuer, the service account email");
    if (!credentials.privateKey)
        throw SigningUnavailable("Signed urls require a signing key, the service account private key");
    return credentials;
}
//---------------------------------------------------------------------------
string GCP::signedUrl(const string& bucket, const string& path, const SignedUrlOptions& options, chrono::system_clock::time_point now) const
// Builds the signed url
{
    auto credentials = resolveCredentials(options);

    if (bucket.empty() || bucket.find('/') != string::npos)
        throw InvalidArgument("Invalid bucket name: " + bucket);
    if (path.empty())
        throw InvalidArgument("The object path must not be empty");
    if (path.size() > maxObjectNameLength)
        throw InvalidArgument("The object path exceeds " + to_string(maxObjectNameLength) + " bytes");
    if (path.find_first_of(string("\r\n\0", 3)) != string::npos)
        throw InvalidArgument("The object path must not contain carriage returns, line feeds or null characters");

    network::HttpRequest request;
    auto method = network::HttpRequest::parseRequestMethod(options.method);
    if (!method)
        throw InvalidArgument("Unsupported http method for signed urls: " + options.method);
    request.method = *method;

    auto nowSeconds = chrono::duration_cast<chrono::seconds>(now.time_since_epoch()).count();
    if (options.expires <= 0)
        throw InvalidArgument("The expiration must be a positive number of seconds");
    if (options.expires > numeric_limits<int64_t>::max() - nowSeconds)
        throw InvalidArgument("The expiration is too far in the future");

    for (auto& q : options.query)
        if (find(begin(signatureQueries), end(signatureQueries), q.first) != end(signatureQueries))
            throw InvalidArgument("The query parameter " + q.first + " is reserved for the signature");

    request.path = "/" + utils::encodeUrlParameters(bucket) + "/" + utils::encodeUrlPath(path);
    request.headers = options.headers;
    request.queries = options.query;

    GCPSigner::StringToSign stringToSign = {.contentMD5 = options.contentMD5, .contentType = options.contentType, .expires = nowSeconds + options.expires, .canonicalHeaders = ""};
    return getAddress() + GCPSigner::createSignedRequest(credentials.clientEmail, *credentials.privateKey, request, stringToSign);
}
//---------------------------------------------------------------------------
string GCP::signedUrl(const string& bucket, const string& path) const
// Builds the signed url with the default options
{
    return signedUrl(bucket, path, SignedUrlOptions());
}
//---------------------------------------------------------------------------
bool GCP::isRemoteFile(string_view fileName) noexcept
// Is it a remote file?
{
    return fileName.starts_with(remoteFile);
}
//---------------------------------------------------------------------------
GCP::RemoteInfo GCP::getRemoteInfo(string_view fileName)
// Get the bucket and the object path
{
    if (!isRemoteFile(fileName))
        throw InvalidArgument("Not a gs:// path: " + string(fileName));
    auto sub = fileName.substr(remoteFile.size());
    auto pos = sub.find('/');
    RemoteInfo info;
    info.bucket = sub.substr(0, pos);
    if (pos != sub.npos)
        info.path = sub.substr(pos + 1);
    if (info.bucket.empty())
        throw InvalidArgument("Missing bucket in " + string(fileName));
    return info;
}
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace blobsign
