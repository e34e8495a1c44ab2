//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LoopbackRedirectListener.hpp
// Purpose: Single-use loopback HTTP acceptor that captures one OAuth redirect (Boost.Beast coroutines)
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace deskauth {

//==========================================================================================================
// RawRedirect
// Purpose: The captured callback request.
// Fields:
//   target: Full request target, e.g. "/?code=..&state=..".
//   path: Target without the query.
//   query: Raw query without '?'.
//==========================================================================================================
struct RawRedirect {
    std::string target;
    std::string path;
    std::string query;
};

struct ListenerEndpoint {
    unsigned short port{0};
    std::string redirectUri;
};

class LoopbackRedirectListener {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind and response settings.
    // Fields:
    //   bindAddress: Loopback address to bind (default: 127.0.0.1); the port is always OS-assigned.
    //   redirectHost: Host used in the redirect URI (default: localhost).
    //   callbackPath: Only requests to this path can complete the capture (default: "/").
    //   requestReadTimeoutMs: Per-connection deadline for receiving a complete request (default: 10000).
    //   responseHtml: Confirmation page; a built-in page is served when empty.
    //==========================================================================================================
    struct Options {
        std::string bindAddress{"127.0.0.1"};
        std::string redirectHost{"localhost"};
        std::string callbackPath{"/"};
        unsigned int requestReadTimeoutMs{10000};
        std::string responseHtml;
    };

    LoopbackRedirectListener();
    explicit LoopbackRedirectListener(const Options& opts);
    ~LoopbackRedirectListener();

    LoopbackRedirectListener(const LoopbackRedirectListener&) = delete;
    LoopbackRedirectListener& operator=(const LoopbackRedirectListener&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Binds an ephemeral loopback port synchronously and starts the accept loop on an I/O thread.
    // Returns:
    //   Bound port and the redirect URI "http://<redirectHost>:<port>".
    // Throws:
    //   errors::AuthError(Bind) when the socket cannot be opened/bound; errors::AuthError(Configuration)
    //   when called twice or after Stop().
    //==========================================================================================================
    ListenerEndpoint Start();

    //==========================================================================================================
    // AwaitRequest
    // Purpose: Blocks until the redirect is captured. Capturing closes the acceptor; no further connection
    //          is accepted. The browser receives HTTP 200 with the confirmation page before delivery.
    // Args:
    //   timeout: Maximum wait; zero waits without limit.
    // Throws:
    //   errors::AuthError Timeout when the wait expires, Cancelled when Stop() runs first, Network when the
    //   accept loop fails.
    //==========================================================================================================
    RawRedirect AwaitRequest(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    //==========================================================================================================
    // Stop
    // Purpose: Closes the acceptor, stops the I/O thread and fails a pending AwaitRequest. Idempotent.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    // True while the acceptor is open.
    bool IsListening() const;

    unsigned short Port() const;

    // Receives accept/session diagnostics.
    void SetErrorHandler(std::function<void(const std::string&)> handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace deskauth
