#include "network/http_request.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// BlobSign - Signed URLs for Cloud Object Storage
// Dominik Durner, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobsign {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
optional<HttpRequest::Method> HttpRequest::parseRequestMethod(string_view method)
// Parse the method name
{
    string upper(method);
    transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return toupper(c); });
    for (auto m : {Method::GET, Method::HEAD, Method::PUT, Method::POST, Method::DELETE})
        if (upper == getRequestMethod(m))
            return m;
    return nullopt;
}
//---------------------------------------------------------------------------
HttpRequest HttpRequest::fromUrl(string_view url)
// Parse the url
{
    static constexpr string_view strSchemeSeperator = "://";
    static constexpr string_view strQuerySeperator = "=";
    static constexpr string_view strQueryStart = "?";
    static constexpr string_view strQueryAnd = "&";
    static constexpr string_view strFragment = "#";

    HttpRequest request;

    auto pos = url.find(strSchemeSeperator);
    if (pos == url.npos)
        throw runtime_error("Invalid Url: Missing scheme!");
    url = url.substr(pos + strSchemeSeperator.size());

    if (auto fragmentPos = url.find(strFragment); fragmentPos != url.npos)
        url = url.substr(0, fragmentPos);

    // the host ends with the path or the query
    pos = url.find_first_of("/?");
    auto host = url.substr(0, pos);
    if (host.empty())
        throw runtime_error("Invalid Url: Missing host!");
    request.headers.emplace("Host", host);
    url = pos == url.npos ? string_view() : url.substr(pos);

    // split path and query
    auto queriesPos = url.find(strQueryStart);
    request.path = url.substr(0, queriesPos);
    if (request.path.empty())
        request.path = "/";
    if (queriesPos == url.npos)
        return request;

    auto queries = url.substr(queriesPos + 1);
    while (true) {
        auto queryPos = queries.find(strQueryAnd);
        string_view query;
        if (queryPos == queries.npos)
            query = queries;
        else
            query = queries.substr(0, queryPos);

        // split between key and value (value might be unnecassary)
        auto keyPos = query.find(strQuerySeperator);
        string_view key, value = "";
        if (keyPos == query.npos) {
            key = query;
        } else {
            key = query.substr(0, keyPos);
            value = query.substr(keyPos + 1);
        }
        if (key.size() > 0)
            request.queries.emplace(utils::decodeUrlParameters(key), utils::decodeUrlParameters(value));
        if (queryPos == queries.npos)
            break;
        queries = queries.substr(queryPos + 1);
    }

    return request;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace blobsign
