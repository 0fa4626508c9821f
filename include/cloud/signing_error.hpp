#pragma once
#include <stdexcept>
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
/// No usable signing credential: missing issuer, missing key, or key material that does not parse
/// Retrying with the same configuration cannot succeed
class SigningUnavailable : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// Malformed input to the signing routine
class InvalidArgument : public std::invalid_argument {
    public:
    using std::invalid_argument::invalid_argument;
};
//---------------------------------------------------------------------------
} // namespace blobsign::cloud
