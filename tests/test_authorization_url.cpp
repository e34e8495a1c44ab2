//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_authorization_url.cpp
// Purpose: GoogleTests for authorization URL construction and credential checks
//==========================================================================================================

#include <gtest/gtest.h>
#include "deskauth/Url.hpp"
#include "deskauth/auth/AuthorizationUrl.hpp"
#include "deskauth/auth/UriSafety.hpp"
#include "deskauth/errors/Errors.h"
#include <functional>

using namespace deskauth;
using namespace deskauth::auth;

namespace {
AuthorizationRequest sampleRequest() {
    AuthorizationRequest r;
    r.authorizationEndpoint = "https://accounts.google.com/o/oauth2/v2/auth";
    r.clientId = "abc.apps.googleusercontent.com";
    r.scopes = {"openid", "email", "profile"};
    r.redirectUri = "http://localhost:49152";
    r.codeChallenge = "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM";
    r.state = "st_1";
    r.extraParams = {{"access_type", "offline"}, {"prompt", "consent"}};
    return r;
}

errors::ErrorCategory categoryOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const errors::AuthError& e) {
        return e.category;
    }
    ADD_FAILURE() << "no AuthError thrown";
    return errors::ErrorCategory::Network;
}
}

TEST(AuthorizationUrl, ExactParameterOrderAndEncoding) {
    std::string url = buildAuthorizationUrl(sampleRequest());
    EXPECT_EQ(url,
              "https://accounts.google.com/o/oauth2/v2/auth"
              "?client_id=abc.apps.googleusercontent.com"
              "&redirect_uri=http%3A%2F%2Flocalhost%3A49152"
              "&response_type=code"
              "&scope=openid%20email%20profile"
              "&code_challenge=E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM"
              "&code_challenge_method=S256"
              "&state=st_1"
              "&access_type=offline&prompt=consent");
}

TEST(AuthorizationUrl, ParsesBackToTheSameValues) {
    std::string url = buildAuthorizationUrl(sampleRequest());
    QueryParams q = parseQuery(parseUrl(url).query);
    ASSERT_NE(findParam(q, "redirect_uri"), nullptr);
    EXPECT_EQ(*findParam(q, "redirect_uri"), "http://localhost:49152");
    EXPECT_EQ(*findParam(q, "scope"), "openid email profile");
    EXPECT_TRUE(isSafeLaunchUri(url, defaultAllowedHosts()));
}

TEST(AuthorizationUrl, EmptyClientIdMessageDependsOnSource) {
    AuthorizationRequest r = sampleRequest();
    r.clientId.clear();
    try {
        buildAuthorizationUrl(r, CredentialSource::Unset);
        FAIL();
    } catch (const errors::AuthError& e) {
        EXPECT_EQ(e.category, errors::ErrorCategory::Configuration);
        EXPECT_EQ(e.remedy, errors::Remedy::AlternateSignIn);
        EXPECT_NE(std::string(e.what()).find("build"), std::string::npos);
    }
    try {
        buildAuthorizationUrl(r, CredentialSource::OtherPlatformOnly);
        FAIL();
    } catch (const errors::AuthError& e) {
        EXPECT_EQ(e.category, errors::ErrorCategory::Configuration);
        EXPECT_NE(std::string(e.what()).find("platform"), std::string::npos);
    }
}

TEST(AuthorizationUrl, RejectsNonLoopbackRedirect) {
    for (const char* bad : {"https://localhost:1234", "http://example.com:1234", "http://localhost",
                            "http://localhost:abc"}) {
        AuthorizationRequest r = sampleRequest();
        r.redirectUri = bad;
        EXPECT_EQ(categoryOf([&]() { buildAuthorizationUrl(r); }), errors::ErrorCategory::Configuration) << bad;
    }
    AuthorizationRequest ok = sampleRequest();
    ok.redirectUri = "http://127.0.0.1:8080";
    EXPECT_NO_THROW(buildAuthorizationUrl(ok));
}

TEST(AuthorizationUrl, RejectsBadEndpointOrMissingPkce) {
    AuthorizationRequest r = sampleRequest();
    r.authorizationEndpoint = "ftp://accounts.google.com/auth";
    EXPECT_EQ(categoryOf([&]() { buildAuthorizationUrl(r); }), errors::ErrorCategory::Configuration);
    r = sampleRequest();
    r.authorizationEndpoint.clear();
    EXPECT_EQ(categoryOf([&]() { buildAuthorizationUrl(r); }), errors::ErrorCategory::Configuration);
    r = sampleRequest();
    r.codeChallenge.clear();
    EXPECT_EQ(categoryOf([&]() { buildAuthorizationUrl(r); }), errors::ErrorCategory::Configuration);
}
