//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_loopback_listener.cpp
// Purpose: GoogleTests for the single-use loopback redirect listener
//==========================================================================================================

#include <gtest/gtest.h>
#include "deskauth/LoopbackRedirectListener.hpp"
#include "deskauth/errors/Errors.h"
#include "support/LoopbackClient.h"

#include <future>
#include <thread>

using namespace deskauth;
using deskauth::testing::browserGet;
using namespace std::chrono_literals;

namespace {

bool canBind(unsigned short port) {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor a{io};
    boost::system::error_code ec;
    boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), port};
    a.open(ep.protocol(), ec);
    if (!ec) { a.bind(ep, ec); }
    a.close();
    return !ec;
}

errors::ErrorCategory awaitCategory(LoopbackRedirectListener& l, std::chrono::milliseconds timeout) {
    try {
        (void)l.AwaitRequest(timeout);
    } catch (const errors::AuthError& e) {
        return e.category;
    }
    ADD_FAILURE() << "AwaitRequest returned instead of throwing";
    return errors::ErrorCategory::Network;
}

} // namespace

TEST(LoopbackListener, StartReturnsEphemeralPortAndRedirectUri) {
    LoopbackRedirectListener l;
    ListenerEndpoint ep = l.Start();
    EXPECT_NE(ep.port, 0);
    EXPECT_EQ(ep.redirectUri, "http://localhost:" + std::to_string(ep.port));
    EXPECT_TRUE(l.IsListening());
    EXPECT_EQ(l.Port(), ep.port);
    l.Stop().get();
    EXPECT_FALSE(l.IsListening());
}

TEST(LoopbackListener, CapturesRedirectAndAnswersBrowser) {
    LoopbackRedirectListener l;
    ListenerEndpoint ep = l.Start();

    auto hit = std::async(std::launch::async, [&]() { return browserGet(ep.port, "/?code=abc&state=xyz"); });
    RawRedirect raw = l.AwaitRequest(5s);
    EXPECT_EQ(raw.target, "/?code=abc&state=xyz");
    EXPECT_EQ(raw.path, "/");
    EXPECT_EQ(raw.query, "code=abc&state=xyz");

    auto res = hit.get();
    EXPECT_EQ(res.status, 200);
    EXPECT_NE(res.contentType.find("text/html"), std::string::npos);
    EXPECT_EQ(res.cacheControl, "no-store");
    EXPECT_NE(res.body.find("Authentication successful"), std::string::npos);
    EXPECT_FALSE(l.IsListening());
}

TEST(LoopbackListener, CustomConfirmationPage) {
    LoopbackRedirectListener::Options opts;
    opts.responseHtml = "<html><body>done</body></html>";
    LoopbackRedirectListener l(opts);
    ListenerEndpoint ep = l.Start();
    auto hit = std::async(std::launch::async, [&]() { return browserGet(ep.port, "/?code=c&state=s"); });
    (void)l.AwaitRequest(5s);
    EXPECT_EQ(hit.get().body, "<html><body>done</body></html>");
}

TEST(LoopbackListener, StrayPathsDoNotConsumeCapture) {
    LoopbackRedirectListener l;
    ListenerEndpoint ep = l.Start();

    auto favicon = browserGet(ep.port, "/favicon.ico");
    EXPECT_EQ(favicon.status, 404);
    EXPECT_TRUE(l.IsListening());

    auto hit = std::async(std::launch::async, [&]() { return browserGet(ep.port, "/?code=abc&state=xyz"); });
    RawRedirect raw = l.AwaitRequest(5s);
    EXPECT_EQ(raw.query, "code=abc&state=xyz");
    EXPECT_EQ(hit.get().status, 200);
}

TEST(LoopbackListener, SilentPreconnectIsIgnored) {
    LoopbackRedirectListener l;
    ListenerEndpoint ep = l.Start();

    // Browsers open speculative connections that never carry a request
    boost::asio::io_context io;
    boost::asio::ip::tcp::socket idle{io};
    idle.connect({boost::asio::ip::make_address("127.0.0.1"), ep.port});

    auto hit = std::async(std::launch::async, [&]() { return browserGet(ep.port, "/?code=abc&state=xyz"); });
    RawRedirect raw = l.AwaitRequest(5s);
    EXPECT_EQ(raw.query, "code=abc&state=xyz");
    EXPECT_EQ(hit.get().status, 200);
    boost::system::error_code ec;
    idle.close(ec);
}

TEST(LoopbackListener, AwaitTimesOut) {
    LoopbackRedirectListener l;
    l.Start();
    EXPECT_EQ(awaitCategory(l, 100ms), errors::ErrorCategory::Timeout);
}

TEST(LoopbackListener, StopWhileWaitingCancels) {
    LoopbackRedirectListener l;
    l.Start();
    auto waiter = std::async(std::launch::async, [&]() { return awaitCategory(l, 0ms); });
    std::this_thread::sleep_for(50ms);
    l.Stop().get();
    EXPECT_EQ(waiter.get(), errors::ErrorCategory::Cancelled);
}

TEST(LoopbackListener, StopIsIdempotentAndReleasesPort) {
    LoopbackRedirectListener l;
    ListenerEndpoint ep = l.Start();
    l.Stop().get();
    l.Stop().get();
    EXPECT_TRUE(canBind(ep.port));
}

TEST(LoopbackListener, StartTwiceIsConfigurationError) {
    LoopbackRedirectListener l;
    l.Start();
    try {
        l.Start();
        FAIL() << "expected ConfigurationError";
    } catch (const errors::AuthError& e) {
        EXPECT_EQ(e.category, errors::ErrorCategory::Configuration);
    }
}

TEST(LoopbackListener, NonLoopbackBindAddressIsBindError) {
    LoopbackRedirectListener::Options opts;
    opts.bindAddress = "0.0.0.0";
    LoopbackRedirectListener l(opts);
    try {
        l.Start();
        FAIL() << "expected BindError";
    } catch (const errors::AuthError& e) {
        EXPECT_EQ(e.category, errors::ErrorCategory::Bind);
    }
}
