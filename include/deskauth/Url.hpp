//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.hpp
// Purpose: URL splitting, percent-encoding and query-string parsing helpers
//==========================================================================================================

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace deskauth {

//==========================================================================================================
// UrlParts
// Purpose: Components of an absolute http(s) URL.
// Fields:
//   scheme: Lower-cased scheme ("http" when the URL has none).
//   host: Lower-cased host without IPv6 brackets.
//   port: Explicit port, or the scheme default ("443"/"80").
//   path: Path plus query (target for the request line); "/" when empty.
//   query: Raw query without '?', possibly empty.
//   hasExplicitPort: True when the URL carried ":port".
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    bool hasExplicitPort{false};
};

// Split a URL into parts. Userinfo ("user@") is kept in the host and therefore never matches an
// allow-list entry.
UrlParts parseUrl(const std::string& url);

// RFC 3986 percent-encoding; only unreserved characters are left as-is.
std::string percentEncode(const std::string& s);

// application/x-www-form-urlencoded encoding (space becomes '+').
std::string formEncode(const std::string& s);

// Percent-decoding. When plusAsSpace is true, '+' decodes to a space. Invalid escapes are kept verbatim.
std::string percentDecode(const std::string& s, bool plusAsSpace = true);

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Parse "a=1&b=2" into ordered pairs, percent-decoding keys and values.
QueryParams parseQuery(const std::string& query);

// First value for key, or nullptr.
const std::string* findParam(const QueryParams& params, const std::string& key);

// Build "k1=v1&k2=v2" with form encoding.
std::string buildFormBody(const QueryParams& params);

} // namespace deskauth
