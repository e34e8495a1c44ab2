//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FlowOrchestrator.cpp
// Purpose: Single-flight OAuth authorization-code (PKCE) flow over a loopback redirect
//==========================================================================================================

#include <chrono>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include "deskauth/FlowOrchestrator.hpp"
#include "deskauth/async/RunBlocking.h"
#include "deskauth/auth/Pkce.hpp"
#include "deskauth/auth/RedirectValidator.hpp"
#include "deskauth/auth/UriSafety.hpp"
#include "deskauth/errors/Errors.h"
#include "logging/Logger.h"

namespace deskauth {

const char* flowStateName(FlowState s) {
    switch (s) {
        case FlowState::Idle: return "Idle";
        case FlowState::ListenerStarted: return "ListenerStarted";
        case FlowState::AwaitingRedirect: return "AwaitingRedirect";
        case FlowState::RedirectCaptured: return "RedirectCaptured";
        case FlowState::Exchanging: return "Exchanging";
        case FlowState::Succeeded: return "Succeeded";
        case FlowState::Failed: return "Failed";
        case FlowState::Disposed: return "Disposed";
    }
    return "Unknown";
}

bool isTerminal(FlowState s) {
    return s == FlowState::Succeeded || s == FlowState::Failed || s == FlowState::Disposed;
}

namespace {

//==========================================================================================================
// FlowSession
// Purpose: Per-Start() state. Shared between the caller thread, the flow thread and Dispose().
//==========================================================================================================
struct FlowSession {
    unsigned long sessionId{0};
    std::chrono::steady_clock::time_point startedAt{std::chrono::steady_clock::now()};
    std::stop_source stop;
    std::unique_ptr<LoopbackRedirectListener> listener;
    std::thread worker;
    std::string redirectUri;

    std::mutex mtx;
    FlowState state{FlowState::Idle};
    bool settled{false};
    std::promise<auth::Credential> promise;

    // Owned by the flow thread
    auth::PreparedAuthorization prepared;
};

} // namespace

class OAuthFlowOrchestrator::Impl {
public:
    explicit Impl(Options o) : opts(std::move(o)) {}

    Options opts;
    unsigned long nextSessionId{1};

    // Serializes Start() and Dispose(); recursive for Dispose() from a state handler inside Start()
    std::recursive_mutex lifecycleMtx;

    mutable std::mutex mtx;
    std::shared_ptr<FlowSession> current;
    std::function<void(FlowState)> stateHandler;
    std::function<void()> foregroundHook;
    std::string retainedAccessToken;

    std::stop_source auxStop;
    std::mutex auxMtx;
    std::vector<std::thread> auxThreads;

    // Moves the session to `to` unless it already reached a terminal state. Disposed overrides
    // Succeeded/Failed.
    bool transition(const std::shared_ptr<FlowSession>& s, FlowState to) {
        FlowState from;
        {
            std::lock_guard<std::mutex> lk(s->mtx);
            from = s->state;
            if (from == FlowState::Disposed) {
                return false;
            }
            if (isTerminal(from) && to != FlowState::Disposed) {
                return false;
            }
            s->state = to;
        }
        LOG_DEBUG("Flow: {} -> {}", flowStateName(from), flowStateName(to));
        std::function<void(FlowState)> handler;
        {
            std::lock_guard<std::mutex> lk(mtx);
            handler = stateHandler;
        }
        if (handler) {
            try {
                handler(to);
            } catch (const std::exception& e) {
                LOG_WARN("Flow: state handler threw: {}", e.what());
            }
        }
        return true;
    }

    void settleValue(const std::shared_ptr<FlowSession>& s, auth::Credential cred) {
        std::lock_guard<std::mutex> lk(s->mtx);
        if (s->settled) {
            return;
        }
        s->settled = true;
        s->promise.set_value(std::move(cred));
    }

    void settleError(const std::shared_ptr<FlowSession>& s, std::exception_ptr eptr) {
        std::lock_guard<std::mutex> lk(s->mtx);
        if (s->settled) {
            return;
        }
        s->settled = true;
        s->promise.set_exception(eptr);
    }

    static void cleanup(const std::shared_ptr<FlowSession>& s) {
        if (s->listener) {
            s->listener->Stop().get();
        }
        auth::wipeSecret(s->prepared.codeVerifier);
        auth::wipeSecret(s->prepared.csrfState);
    }

    std::shared_ptr<auth::ITokenExchangeStrategy> strategy() {
        std::lock_guard<std::mutex> lk(mtx);
        if (!opts.strategy) {
            opts.strategy = makeStrategy(opts.config);
        }
        return opts.strategy;
    }

    std::shared_ptr<IBrowserLauncher> launcher() {
        std::lock_guard<std::mutex> lk(mtx);
        if (!opts.launcher) {
            SystemBrowserLauncher::Options lo;
            lo.allowedHosts = opts.config.allowedHosts;
            opts.launcher = std::make_shared<SystemBrowserLauncher>(lo);
        }
        return opts.launcher;
    }

    void runFlow(std::shared_ptr<FlowSession> s, std::shared_ptr<auth::ITokenExchangeStrategy> strat) {
        std::stop_token token = s->stop.get_token();
        try {
            if (token.stop_requested()) {
                throw errors::CancelledError("Sign-in cancelled");
            }
            s->prepared = async::runBlocking(strat->coPrepare(s->redirectUri, token));
            if (token.stop_requested()) {
                throw errors::CancelledError("Sign-in cancelled");
            }

            // Vetted before any launcher is involved
            auth::checkLaunchUri(s->prepared.authorizationUrl, opts.config.allowedHosts);
            launcher()->Open(s->prepared.authorizationUrl);
            transition(s, FlowState::AwaitingRedirect);

            const auto timeout = std::chrono::seconds(opts.config.redirectTimeoutSeconds);
            RawRedirect raw = s->listener->AwaitRequest(std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
            transition(s, FlowState::RedirectCaptured);
            s->listener->Stop().get();

            std::function<void()> hook;
            {
                std::lock_guard<std::mutex> lk(mtx);
                hook = foregroundHook;
            }
            if (hook) {
                try {
                    hook();
                } catch (const std::exception& e) {
                    LOG_WARN("Flow: foreground hook failed: {}", e.what());
                }
            }

            auth::AuthorizationGranted granted =
                auth::requireGranted(auth::validateRedirect(raw.query, s->prepared.csrfState));

            if (token.stop_requested()) {
                throw errors::CancelledError("Sign-in cancelled");
            }
            transition(s, FlowState::Exchanging);
            auth::AuthorizationGrant grant;
            grant.code = std::move(granted.code);
            grant.state = std::move(granted.state);
            grant.codeVerifier = s->prepared.codeVerifier;
            grant.redirectUri = s->redirectUri;
            auth::Credential cred;
            try {
                cred = async::runBlocking(strat->coExchange(grant, token));
            } catch (...) {
                auth::wipeSecret(grant.code);
                auth::wipeSecret(grant.codeVerifier);
                throw;
            }
            auth::wipeSecret(grant.code);
            auth::wipeSecret(grant.codeVerifier);

            cleanup(s);
            if (transition(s, FlowState::Succeeded)) {
                if (cred.tokens) {
                    std::lock_guard<std::mutex> lk(mtx);
                    retainedAccessToken = cred.tokens->accessToken;
                }
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - s->startedAt);
                LOG_INFO("Flow #{}: sign-in succeeded ({}) after {} ms", s->sessionId, strat->name(), elapsed.count());
                settleValue(s, std::move(cred));
            } else {
                settleError(s, std::make_exception_ptr(errors::CancelledError("Sign-in was cancelled")));
            }
        } catch (const errors::AuthError& e) {
            cleanup(s);
            if (token.stop_requested()) {
                transition(s, FlowState::Disposed);
                settleError(s, std::make_exception_ptr(errors::CancelledError("Sign-in was cancelled")));
                return;
            }
            LOG_WARN("Flow #{}: sign-in failed: {}: {}", s->sessionId, errors::categoryName(e.category), e.what());
            transition(s, FlowState::Failed);
            settleError(s, std::current_exception());
        } catch (const std::exception& e) {
            cleanup(s);
            LOG_ERROR("Flow: unexpected failure: {}", e.what());
            transition(s, FlowState::Failed);
            settleError(s, std::current_exception());
        }
    }

    void disposeSession(const std::shared_ptr<FlowSession>& s) {
        if (!s) {
            return;
        }
        s->stop.request_stop();
        if (s->listener) {
            s->listener->Stop().get();
        }
        if (s->worker.joinable()) {
            if (s->worker.get_id() == std::this_thread::get_id()) {
                // Called from a state handler: runFlow unwinds on the stop request and settles the future
                retire(std::move(s->worker));
                transition(s, FlowState::Disposed);
                return;
            }
            s->worker.join();
        }
        transition(s, FlowState::Disposed);
        settleError(s, std::make_exception_ptr(errors::CancelledError("Sign-in was cancelled")));
    }

    // Joined by the destructor
    void retire(std::thread t) {
        std::lock_guard<std::mutex> lk(auxMtx);
        auxThreads.push_back(std::move(t));
    }

    template <typename Fn>
    void runAux(Fn&& fn) {
        std::lock_guard<std::mutex> lk(auxMtx);
        auxThreads.emplace_back(std::forward<Fn>(fn));
    }
};

OAuthFlowOrchestrator::OAuthFlowOrchestrator(Options opts)
    : pImpl(std::make_unique<Impl>(std::move(opts))) {}

OAuthFlowOrchestrator::~OAuthFlowOrchestrator() {
    Dispose();
    pImpl->auxStop.request_stop();
    std::vector<std::thread> aux;
    {
        std::lock_guard<std::mutex> lk(pImpl->auxMtx);
        aux.swap(pImpl->auxThreads);
    }
    for (auto& t : aux) {
        if (!t.joinable()) {
            continue;
        }
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
        } else {
            t.join();
        }
    }
}

std::future<auth::Credential> OAuthFlowOrchestrator::Start() {
    std::lock_guard<std::recursive_mutex> lifecycle(pImpl->lifecycleMtx);

    std::shared_ptr<FlowSession> previous;
    {
        std::lock_guard<std::mutex> lk(pImpl->mtx);
        previous = std::move(pImpl->current);
    }
    if (previous) {
        LOG_INFO("Flow: disposing previous session");
        pImpl->disposeSession(previous);
    }

    auto s = std::make_shared<FlowSession>();
    s->sessionId = pImpl->nextSessionId++;
    auto fut = s->promise.get_future();

    std::shared_ptr<auth::ITokenExchangeStrategy> strat;
    std::exception_ptr startError;
    try {
        strat = pImpl->strategy();
        // Missing credentials fail here, before any socket is bound
        strat->validateConfiguration();
        s->listener = std::make_unique<LoopbackRedirectListener>(pImpl->opts.listener);
        ListenerEndpoint ep = s->listener->Start();
        s->redirectUri = ep.redirectUri;
    } catch (const errors::AuthError& e) {
        LOG_ERROR("Flow: could not start: {}", e.what());
        if (s->listener) {
            s->listener->Stop().get();
        }
        startError = std::current_exception();
    }

    // Published only once the listener is in place
    {
        std::lock_guard<std::mutex> lk(pImpl->mtx);
        pImpl->current = s;
    }
    if (startError) {
        pImpl->transition(s, FlowState::Failed);
        pImpl->settleError(s, startError);
        return fut;
    }
    pImpl->transition(s, FlowState::ListenerStarted);
    LOG_INFO("Flow #{}: started ({}), redirect {}", s->sessionId, strat->name(), s->redirectUri);

    s->worker = std::thread([impl = pImpl.get(), s, strat]() {
        impl->runFlow(s, strat);
    });
    return fut;
}

void OAuthFlowOrchestrator::Dispose() {
    std::unique_lock<std::recursive_mutex> lifecycle(pImpl->lifecycleMtx, std::defer_lock);
    // Another thread inside Start()/Dispose() may be joining the flow thread we are called from
    const bool locked = lifecycle.try_lock();
    std::shared_ptr<FlowSession> s;
    {
        std::lock_guard<std::mutex> lk(pImpl->mtx);
        s = pImpl->current;
    }
    if (!s) {
        return;
    }
    if (locked) {
        pImpl->disposeSession(s);
        return;
    }
    s->stop.request_stop();
    if (s->listener) {
        s->listener->Stop().get();
    }
    pImpl->transition(s, FlowState::Disposed);
    if (s->worker.get_id() != std::this_thread::get_id()) {
        pImpl->settleError(s, std::make_exception_ptr(errors::CancelledError("Sign-in was cancelled")));
    }
}

FlowState OAuthFlowOrchestrator::State() const {
    std::shared_ptr<FlowSession> s;
    {
        std::lock_guard<std::mutex> lk(pImpl->mtx);
        s = pImpl->current;
    }
    if (!s) {
        return FlowState::Idle;
    }
    std::lock_guard<std::mutex> lk(s->mtx);
    return s->state;
}

std::string OAuthFlowOrchestrator::RedirectUri() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->current ? pImpl->current->redirectUri : std::string();
}

void OAuthFlowOrchestrator::SetStateChangedHandler(std::function<void(FlowState)> handler) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->stateHandler = std::move(handler);
}

void OAuthFlowOrchestrator::SetForegroundHook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->foregroundHook = std::move(hook);
}

std::future<auth::TokenSet> OAuthFlowOrchestrator::Refresh(const std::string& refreshToken) {
    auto pr = std::make_shared<std::promise<auth::TokenSet>>();
    auto fut = pr->get_future();
    std::shared_ptr<auth::ITokenExchangeStrategy> strat;
    try {
        strat = pImpl->strategy();
    } catch (const errors::AuthError&) {
        pr->set_exception(std::current_exception());
        return fut;
    }
    std::stop_token token = pImpl->auxStop.get_token();
    pImpl->runAux([pr, strat, refreshToken, token]() {
        try {
            pr->set_value(async::runBlocking(strat->coRefresh(refreshToken, token)));
        } catch (const std::exception& e) {
            LOG_WARN("Flow: refresh failed: {}", e.what());
            pr->set_exception(std::current_exception());
        }
    });
    return fut;
}

std::future<void> OAuthFlowOrchestrator::SignOut() {
    auto pr = std::make_shared<std::promise<void>>();
    auto fut = pr->get_future();
    std::string token;
    {
        std::lock_guard<std::mutex> lk(pImpl->mtx);
        token.swap(pImpl->retainedAccessToken);
    }
    if (token.empty()) {
        LOG_DEBUG("Flow: sign-out with no retained token");
        pr->set_value();
        return fut;
    }
    http::HttpRequestParams transport = transportFor(pImpl->opts.config);
    std::string endpoint = pImpl->opts.config.revocationEndpoint;
    std::stop_token stop = pImpl->auxStop.get_token();
    pImpl->runAux([pr, transport, endpoint, token, stop]() mutable {
        try {
            bool revoked = async::runBlocking(auth::coRevokeToken(endpoint, token, transport, stop));
            LOG_INFO("Flow: signed out (token {})", revoked ? "revoked" : "not revoked");
        } catch (const std::exception& e) {
            LOG_WARN("Flow: revoke failed: {}", e.what());
        }
        auth::wipeSecret(token);
        pr->set_value();
    });
    return fut;
}

} // namespace deskauth
