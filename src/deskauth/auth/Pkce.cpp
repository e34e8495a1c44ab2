//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Pkce.cpp
// Purpose: PKCE verifier/challenge (RFC 7636) and CSRF state generation backed by OpenSSL
//==========================================================================================================

#include <array>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include "deskauth/auth/Pkce.hpp"
#include "deskauth/errors/Errors.h"
#include "logging/Logger.h"

namespace deskauth::auth {

namespace {
constexpr char kUnreserved[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-._~";
constexpr std::size_t kUnreservedCount = sizeof(kUnreserved) - 1; // 66

void randomBytes(unsigned char* out, std::size_t len) {
    if (::RAND_bytes(out, static_cast<int>(len)) != 1) {
        LOG_ERROR("PKCE: RAND_bytes failed");
        throw errors::SecurityError("Secure random number generator unavailable");
    }
}
} // namespace

std::string generateCodeVerifier() {
    std::string out;
    out.reserve(kCodeVerifierLength);
    // Rejection sampling keeps the distribution uniform over the 66 characters
    constexpr unsigned int limit = 256 - (256 % kUnreservedCount);
    std::array<unsigned char, 64> buf{};
    while (out.size() < kCodeVerifierLength) {
        randomBytes(buf.data(), buf.size());
        for (unsigned char b : buf) {
            if (b >= limit) {
                continue;
            }
            out.push_back(kUnreserved[b % kUnreservedCount]);
            if (out.size() == kCodeVerifierLength) {
                break;
            }
        }
    }
    ::OPENSSL_cleanse(buf.data(), buf.size());
    return out;
}

std::string generateCodeChallenge(const std::string& verifier) {
    std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
    unsigned int digestLen = 0;
    if (::EVP_Digest(verifier.data(), verifier.size(), digest.data(), &digestLen, ::EVP_sha256(), nullptr) != 1) {
        throw errors::SecurityError("SHA-256 digest failed");
    }
    return base64UrlEncode(digest.data(), digestLen);
}

std::string generateState() {
    std::array<unsigned char, 32> raw{};
    randomBytes(raw.data(), raw.size());
    std::string s = base64UrlEncode(raw.data(), raw.size());
    ::OPENSSL_cleanse(raw.data(), raw.size());
    return s;
}

std::string base64UrlEncode(const unsigned char* data, std::size_t len) {
    if (len == 0) {
        return std::string();
    }
    std::vector<unsigned char> out(4 * ((len + 2) / 3) + 1);
    int n = ::EVP_EncodeBlock(out.data(), data, static_cast<int>(len));
    std::string s(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n));
    for (char& c : s) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!s.empty() && s.back() == '=') {
        s.pop_back();
    }
    return s;
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return ::CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void wipeSecret(std::string& secret) {
    if (!secret.empty()) {
        ::OPENSSL_cleanse(&secret[0], secret.size());
    }
    secret.clear();
    secret.shrink_to_fit();
}

} // namespace deskauth::auth
