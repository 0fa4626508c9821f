#include "cloud/credentials_provider.hpp"
#include "cloud/signing_error.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
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
//---------------------------------------------------------------------------
static string getEnv(const char* name)
// Get the variable, empty if unset
{
    auto* value = getenv(name);
    return value ? string(value) : "";
}
//---------------------------------------------------------------------------
StaticCredentialsProvider::StaticCredentialsProvider(Credentials credentials) : CredentialsProvider("static"), _credentials(move(credentials))
// The constructor
{
}
//---------------------------------------------------------------------------
StaticCredentialsProvider::StaticCredentialsProvider(const string& clientEmail, string_view privateKey, const string& projectId) : CredentialsProvider("static")
// The constructor, parses the key once
{
    _credentials.clientEmail = clientEmail;
    _credentials.privateKey = Credentials::parsePrivateKey(privateKey);
    _credentials.projectId = projectId;
}
//---------------------------------------------------------------------------
optional<Credentials> StaticCredentialsProvider::loadCredentials()
// Returns the credentials
{
    return _credentials;
}
//---------------------------------------------------------------------------
KeyFileCredentialsProvider::KeyFileCredentialsProvider(string path) : CredentialsProvider("keyfile"), _path(move(path))
// The constructor
{
}
//---------------------------------------------------------------------------
optional<string> KeyFileCredentialsProvider::readFile(const string& path)
// Gets the content of the file
{
    ifstream ifs(path);
    if (!ifs)
        return nullopt;
    return string((istreambuf_iterator<char>(ifs)), (istreambuf_iterator<char>()));
}
//---------------------------------------------------------------------------
optional<Credentials> KeyFileCredentialsProvider::loadCredentials()
// Reads the key file on first use
{
    unique_lock lock(_mutex);
    if (_loaded)
        return _credentials;

    auto content = readFile(_path);
    if (!content) {
        cerr << "Key file " << _path << " could not be read!" << endl;
        _loaded = true;
        return nullopt;
    }
    // malformed files throw and are not cached
    _credentials = Credentials::fromJson(*content);
    _loaded = true;
    return _credentials;
}
//---------------------------------------------------------------------------
EnvironmentCredentialsProvider::EnvironmentCredentialsProvider() : CredentialsProvider("environment")
// The constructor
{
}
//---------------------------------------------------------------------------
optional<Credentials> EnvironmentCredentialsProvider::loadCredentials()
// Looks up the variables
{
    for (auto* variable : pathVariables) {
        auto path = getEnv(variable);
        if (path.empty())
            continue;
        auto content = KeyFileCredentialsProvider::readFile(path);
        if (!content)
            throw SigningUnavailable(string(variable) + " names the key file " + path + ", which could not be read");
        return Credentials::fromJson(*content);
    }
    for (auto* variable : jsonVariables) {
        auto content = getEnv(variable);
        if (content.empty())
            continue;
        return Credentials::fromJson(content);
    }
    return nullopt;
}
//---------------------------------------------------------------------------
CredentialsProviderChain::CredentialsProviderChain() : CredentialsProvider("chain")
// The constructor
{
}
//---------------------------------------------------------------------------
optional<Credentials> CredentialsProviderChain::loadCredentials()
// Asks every provider in order
{
    for (auto& provider : _providers) {
        auto credentials = provider->loadCredentials();
        if (credentials)
            return credentials;
    }
    return nullopt;
}
//---------------------------------------------------------------------------
void CredentialsProviderChain::addProvider(unique_ptr<CredentialsProvider> provider)
// Append a provider
{
    _providers.push_back(move(provider));
}
//---------------------------------------------------------------------------
string CredentialsProviderChain::wellKnownFile()
// The gcloud application default credentials
{
    auto home = getEnv("HOME");
    if (home.empty())
        return "";
    return home + "/.config/gcloud/application_default_credentials.json";
}
//---------------------------------------------------------------------------
unique_ptr<CredentialsProviderChain> CredentialsProviderChain::defaultChain()
// Environment, then the well known file
{
    auto chain = make_unique<CredentialsProviderChain>();
    chain->addProvider(make_unique<EnvironmentCredentialsProvider>());
    if (auto file = wellKnownFile(); !file.empty())
        chain->addProvider(make_unique<KeyFileCredentialsProvider>(file));
    return chain;
}
//---------------------------------------------------------------------------
} // namespace blobsign::cloud
