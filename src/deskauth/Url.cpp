//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.cpp
// Purpose: URL splitting, percent-encoding and query-string parsing helpers
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <sstream>

#include "deskauth/Url.hpp"

namespace deskauth {

namespace {
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

int hexValue(char h) {
    if (h >= '0' && h <= '9') return h - '0';
    if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
    if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
    return -1;
}

std::string encodeImpl(const std::string& s, bool spaceAsPlus) {
    static const char* hex = "0123456789ABCDEF";
    std::ostringstream oss;
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (isUnreserved(c)) {
            oss << static_cast<char>(c);
        } else if (c == ' ' && spaceAsPlus) {
            oss << '+';
        } else {
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}
} // namespace

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = toLower(url.substr(0, schemeEnd));
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
        pos = 0;
    }
    std::size_t authorityEnd = url.find_first_of("/?#", pos);
    std::string hostPort;
    if (authorityEnd == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = std::string("/");
    } else {
        hostPort = url.substr(pos, authorityEnd - pos);
        std::string rest = url.substr(authorityEnd);
        std::size_t hash = rest.find('#');
        if (hash != std::string::npos) {
            rest = rest.substr(0, hash);
        }
        if (rest.empty() || rest.front() != '/') {
            rest = std::string("/") + rest;
        }
        parts.path = rest;
        std::size_t q = rest.find('?');
        if (q != std::string::npos) {
            parts.query = rest.substr(q + 1);
        }
    }

    if (!hostPort.empty() && hostPort.front() == '[') {
        std::size_t rb = hostPort.find(']');
        parts.host = (rb == std::string::npos) ? hostPort.substr(1) : hostPort.substr(1, rb - 1);
        if (rb != std::string::npos && rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
            parts.port = hostPort.substr(rb + 2);
            parts.hasExplicitPort = true;
        }
    } else {
        std::size_t colon = hostPort.rfind(':');
        if (colon == std::string::npos) {
            parts.host = hostPort;
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
            parts.hasExplicitPort = true;
        }
    }
    parts.host = toLower(parts.host);
    if (parts.port.empty()) {
        parts.port = (parts.scheme == std::string("https")) ? std::string("443") : std::string("80");
    }
    return parts;
}

std::string percentEncode(const std::string& s) {
    return encodeImpl(s, false);
}

std::string formEncode(const std::string& s) {
    return encodeImpl(s, true);
}

std::string percentDecode(const std::string& s, bool plusAsSpace) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

QueryParams parseQuery(const std::string& query) {
    QueryParams params;
    std::string q = query;
    if (!q.empty() && q.front() == '?') {
        q.erase(0, 1);
    }
    std::size_t start = 0;
    while (start <= q.size()) {
        std::size_t amp = q.find('&', start);
        if (amp == std::string::npos) {
            amp = q.size();
        }
        std::string kv = q.substr(start, amp - start);
        if (!kv.empty()) {
            std::size_t eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            params.emplace_back(percentDecode(key), percentDecode(val));
        }
        start = amp + 1;
    }
    return params;
}

const std::string* findParam(const QueryParams& params, const std::string& key) {
    for (const auto& kv : params) {
        if (kv.first == key) {
            return &kv.second;
        }
    }
    return nullptr;
}

std::string buildFormBody(const QueryParams& params) {
    std::ostringstream form;
    bool first = true;
    for (const auto& kv : params) {
        if (!first) {
            form << '&';
        }
        first = false;
        form << formEncode(kv.first) << '=' << formEncode(kv.second);
    }
    return form.str();
}

} // namespace deskauth
