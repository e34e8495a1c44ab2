//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FlowOrchestrator.hpp
// Purpose: Single-flight OAuth authorization-code (PKCE) flow over a loopback redirect
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include "deskauth/BrowserLauncher.hpp"
#include "deskauth/Config.hpp"
#include "deskauth/LoopbackRedirectListener.hpp"
#include "deskauth/auth/TokenExchange.hpp"

namespace deskauth {

enum class FlowState {
    Idle,
    ListenerStarted,
    AwaitingRedirect,
    RedirectCaptured,
    Exchanging,
    Succeeded,
    Failed,
    Disposed
};

const char* flowStateName(FlowState s);

// Succeeded, Failed or Disposed.
bool isTerminal(FlowState s);

//==========================================================================================================
// OAuthFlowOrchestrator
// Purpose: Drives one sign-in at a time:
//   Idle -> ListenerStarted -> AwaitingRedirect -> RedirectCaptured -> Exchanging -> Succeeded
//   with Failed reachable from every non-terminal state and Disposed from any state.
// Notes:
//   - Start() binds the loopback listener on the calling thread; the rest runs on a flow thread.
//   - The listener is stopped and session secrets are wiped before the returned future becomes ready.
//   - A new Start() disposes the previous session first, so its port is released before the new bind.
//==========================================================================================================
class OAuthFlowOrchestrator {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   config: Resolved flow configuration (timeouts, allow-list, strategy settings).
    //   strategy: Token exchange strategy; built from config by makeStrategy() when null.
    //   launcher: Browser launcher; SystemBrowserLauncher with config.allowedHosts when null.
    //   listener: Loopback listener settings.
    //==========================================================================================================
    struct Options {
        FlowConfig config;
        std::shared_ptr<auth::ITokenExchangeStrategy> strategy;
        std::shared_ptr<IBrowserLauncher> launcher;
        LoopbackRedirectListener::Options listener;
    };

    explicit OAuthFlowOrchestrator(Options opts);
    ~OAuthFlowOrchestrator();

    OAuthFlowOrchestrator(const OAuthFlowOrchestrator&) = delete;
    OAuthFlowOrchestrator& operator=(const OAuthFlowOrchestrator&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Begins a new flow session.
    // Returns:
    //   Future holding the Credential, or an errors::AuthError: Bind when no loopback port could be bound,
    //   Configuration/Security/Launch/AuthorizationDenied/MalformedRedirect/Timeout/Network/TokenExchange
    //   from the pipeline, Cancelled when the session is disposed.
    //==========================================================================================================
    std::future<auth::Credential> Start();

    // Cancels the current session (if any) and waits for its cleanup. Idempotent; safe from any thread.
    void Dispose();

    FlowState State() const;

    // Redirect URI of the current session; empty before a listener is bound.
    std::string RedirectUri() const;

    // Invoked on every transition, from the thread performing it.
    void SetStateChangedHandler(std::function<void(FlowState)> handler);

    // Best-effort hook run after the redirect is captured (e.g. raise the application window).
    void SetForegroundHook(std::function<void()> hook);

    // Exchanges a refresh token through the strategy.
    std::future<auth::TokenSet> Refresh(const std::string& refreshToken);

    //==========================================================================================================
    // SignOut
    // Purpose: Revokes the access token retained from the last successful flow, then forgets it.
    // Notes:
    //   Revocation is best effort; the future never holds an exception.
    //==========================================================================================================
    std::future<void> SignOut();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace deskauth
