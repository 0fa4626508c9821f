#include "cloud/credentials_provider.hpp"
#include "cloud/gcp.hpp"
#include "cloud/signing_error.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
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
static void usage(const char* name) {
    cerr << "Usage: " << name << " [-m METHOD] [-e SECONDS] [-t CONTENT_TYPE] [-c CONTENT_MD5] [-k KEYFILE] [-H NAME:VALUE]... [-q NAME=VALUE]... gs://bucket/path" << endl;
}
//---------------------------------------------------------------------------
int main(int argc, char** argv) {
    blobsign::cloud::GCP::SignedUrlOptions options;
    string keyFile;
    string remotePath;

    for (auto i = 1; i < argc; i++) {
        auto hasValue = i + 1 < argc;
        if (!strcmp(argv[i], "-m") && hasValue) {
            options.method = argv[++i];
        } else if (!strcmp(argv[i], "-e") && hasValue) {
            try {
                options.expires = stoll(argv[++i]);
            } catch (const exception&) {
                cerr << "Expiration is no number: " << argv[i] << endl;
                return 1;
            }
        } else if (!strcmp(argv[i], "-t") && hasValue) {
            options.contentType = argv[++i];
        } else if (!strcmp(argv[i], "-c") && hasValue) {
            options.contentMD5 = argv[++i];
        } else if (!strcmp(argv[i], "-k") && hasValue) {
            keyFile = argv[++i];
        } else if (!strcmp(argv[i], "-H") && hasValue) {
            string header = argv[++i];
            auto pos = header.find(':');
            if (pos == string::npos) {
                usage(argv[0]);
                return 1;
            }
            options.headers.emplace(header.substr(0, pos), header.substr(pos + 1));
        } else if (!strcmp(argv[i], "-q") && hasValue) {
            string query = argv[++i];
            auto pos = query.find('=');
            if (pos == string::npos)
                options.query.emplace(query, "");
            else
                options.query.emplace(query.substr(0, pos), query.substr(pos + 1));
        } else if (argv[i][0] != '-' && remotePath.empty()) {
            remotePath = argv[i];
        } else {
            usage(argv[0]);
            return 1;
        }
    }
    if (remotePath.empty()) {
        usage(argv[0]);
        return 1;
    }

    try {
        // Either the given key file or the environment and the gcloud default file
        shared_ptr<blobsign::cloud::CredentialsProvider> provider;
        if (!keyFile.empty())
            provider = make_shared<blobsign::cloud::KeyFileCredentialsProvider>(keyFile);
        else
            provider = blobsign::cloud::CredentialsProviderChain::defaultChain();

        blobsign::cloud::GCP gcp(blobsign::cloud::GCP::Settings(), provider);
        auto info = blobsign::cloud::GCP::getRemoteInfo(remotePath);
        cout << gcp.signedUrl(info.bucket, info.path, options) << endl;
    } catch (const blobsign::cloud::SigningUnavailable& e) {
        cerr << "Signing unavailable: " << e.what() << endl;
        return 1;
    } catch (const blobsign::cloud::InvalidArgument& e) {
        cerr << "Invalid argument: " << e.what() << endl;
        return 1;
    } catch (const runtime_error& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
//---------------------------------------------------------------------------
