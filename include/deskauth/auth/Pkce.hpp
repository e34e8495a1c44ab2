//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Pkce.hpp
// Purpose: PKCE verifier/challenge (RFC 7636) and CSRF state generation backed by OpenSSL
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>

namespace deskauth::auth {

// Length of generated code verifiers (RFC 7636 allows 43..128).
inline constexpr std::size_t kCodeVerifierLength = 128;

//==========================================================================================================
// generateCodeVerifier
// Purpose: Random verifier drawn uniformly from [A-Za-z0-9-._~] using RAND_bytes.
// Returns:
//   kCodeVerifierLength characters.
// Throws:
//   errors::AuthError(Security) if the CSPRNG fails.
//==========================================================================================================
std::string generateCodeVerifier();

//==========================================================================================================
// generateCodeChallenge
// Purpose: S256 challenge, BASE64URL(SHA256(ASCII(verifier))) without padding.
//==========================================================================================================
std::string generateCodeChallenge(const std::string& verifier);

// Opaque CSRF state: base64url of 32 random bytes (43 chars).
std::string generateState();

// Base64url without padding.
std::string base64UrlEncode(const unsigned char* data, std::size_t len);

// Compares contents without a per-character early exit (length is not secret).
bool constantTimeEquals(const std::string& a, const std::string& b);

// Overwrite then clear a secret held in a std::string.
void wipeSecret(std::string& secret);

} // namespace deskauth::auth
