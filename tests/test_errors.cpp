//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the sign-in error taxonomy, remedies and user messages
//==========================================================================================================

#include <gtest/gtest.h>
#include "deskauth/errors/Errors.h"

using namespace deskauth::errors;

TEST(Errors, CategoryNames) {
    EXPECT_STREQ(categoryName(ErrorCategory::Configuration), "ConfigurationError");
    EXPECT_STREQ(categoryName(ErrorCategory::Bind), "BindError");
    EXPECT_STREQ(categoryName(ErrorCategory::TokenExchange), "TokenExchangeError");
    EXPECT_STREQ(categoryName(ErrorCategory::Cancelled), "CancelledError");
}

TEST(Errors, RemedyForProviderError) {
    EXPECT_EQ(remedyForProviderError("invalid_grant"), Remedy::Retry);
    EXPECT_EQ(remedyForProviderError("invalid_client"), Remedy::ContactSupport);
    EXPECT_EQ(remedyForProviderError("redirect_uri_mismatch"), Remedy::ContactSupport);
    EXPECT_EQ(remedyForProviderError("access_denied"), Remedy::UserCancelled);
    EXPECT_EQ(remedyForProviderError("something_else"), Remedy::None);
}

TEST(Errors, TokenExchangeErrorCarriesProviderDetail) {
    AuthError e = TokenExchangeError("Token exchange failed", 400, "invalid_grant", "{\"error\":\"invalid_grant\"}");
    EXPECT_EQ(e.category, ErrorCategory::TokenExchange);
    EXPECT_EQ(e.httpStatus, 400);
    EXPECT_EQ(e.providerError, "invalid_grant");
    EXPECT_EQ(e.remedy, Remedy::Retry);
    EXPECT_STREQ(e.what(), "Token exchange failed");
}

TEST(Errors, ServerErrorsAreRetryable) {
    EXPECT_EQ(TokenExchangeError("x", 503, "", "").remedy, Remedy::Retry);
    EXPECT_EQ(TokenExchangeError("x", 418, "", "").remedy, Remedy::None);
}

TEST(Errors, FactoriesSetCategoryAndRemedy) {
    EXPECT_EQ(BindError("b").category, ErrorCategory::Bind);
    EXPECT_EQ(NetworkError("n").remedy, Remedy::Retry);
    EXPECT_EQ(TimeoutError("t").remedy, Remedy::Retry);
    EXPECT_EQ(CancelledError("c").remedy, Remedy::UserCancelled);
    EXPECT_EQ(ConfigurationError("c").remedy, Remedy::ContactSupport);
    AuthError launch = LaunchError("l", "https://accounts.google.com/x");
    EXPECT_EQ(launch.category, ErrorCategory::Launch);
    EXPECT_EQ(launch.detail, "https://accounts.google.com/x");
    AuthError denied = AuthorizationDeniedError("d", "access_denied");
    EXPECT_EQ(denied.providerError, "access_denied");
    EXPECT_EQ(denied.remedy, Remedy::UserCancelled);
}

TEST(Errors, CatchableAsRuntimeError) {
    try {
        throw SecurityError("state mismatch");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "state mismatch");
        return;
    }
    FAIL() << "SecurityError not caught as std::runtime_error";
}

TEST(Errors, UserMessagesAreActionable) {
    EXPECT_EQ(userMessageFor(CancelledError("x")), "Sign-in was cancelled.");
    EXPECT_NE(userMessageFor(TimeoutError("x")).find("try again"), std::string::npos);
    EXPECT_NE(userMessageFor(ConfigurationError("x", Remedy::AlternateSignIn)).find("another sign-in method"),
              std::string::npos);
    EXPECT_NE(userMessageFor(TokenExchangeError("x", 401, "invalid_client", "")).find("contact support"),
              std::string::npos);
    // Diagnostics never reach the user message
    AuthError e = TokenExchangeError("x", 400, "invalid_grant", "secret-body");
    EXPECT_EQ(userMessageFor(e).find("secret-body"), std::string::npos);
}
