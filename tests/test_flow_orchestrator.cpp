//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_flow_orchestrator.cpp
// Purpose: End-to-end GoogleTests for the flow orchestrator with a scripted browser and stub token endpoint
//==========================================================================================================

#include <gtest/gtest.h>
#include "deskauth/FlowOrchestrator.hpp"
#include "deskauth/Url.hpp"
#include "deskauth/auth/ProxiedTokenExchange.hpp"
#include "deskauth/errors/Errors.h"
#include "support/LoopbackClient.h"
#include "support/StubHttpServer.h"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

using namespace deskauth;
using deskauth::testing::StubHttpServer;
using deskauth::testing::StubReply;
using deskauth::testing::StubRequest;
using namespace std::chrono_literals;

namespace {

// Plays the user's browser: follows the authorization URL straight back to the loopback redirect.
class ScriptedBrowser : public IBrowserLauncher {
public:
    enum class Mode { Approve, WrongState, Deny, Ignore, Throw };

    explicit ScriptedBrowser(Mode m = Mode::Approve) : mode(m) {}

    void Open(const std::string& uri) override {
        opened.push_back(uri);
        if (mode == Mode::Throw) {
            throw errors::LaunchError("no browser available", uri);
        }
        if (mode == Mode::Ignore) {
            return;
        }
        const std::string redirect = percentDecode(deskauth::testing::rawQueryParam(uri, "redirect_uri"));
        const std::string state = deskauth::testing::rawQueryParam(uri, "state");
        const UrlParts r = parseUrl(redirect);
        const auto port = static_cast<unsigned short>(std::stoi(r.port));
        std::string target;
        if (mode == Mode::Approve) {
            target = "/?code=validcode&state=" + state + "&scope=openid%20email";
        } else if (mode == Mode::WrongState) {
            target = "/?code=validcode&state=forged";
        } else {
            target = "/?error=access_denied&state=" + state;
        }
        lastHit = deskauth::testing::browserGet(port, target);
    }

    Mode mode;
    std::vector<std::string> opened;
    deskauth::testing::BrowserHit lastHit;
};

StubReply tokenEndpoint(const StubRequest& r) {
    if (r.target == "/revoke") {
        return StubReply{200, ""};
    }
    if (r.body.find("grant_type=refresh_token") != std::string::npos) {
        return StubReply{200, "{\"access_token\":\"AT2\",\"expires_in\":3600}"};
    }
    if (r.body.find("code=validcode") == std::string::npos) {
        return StubReply{400, "{\"error\":\"invalid_request\"}"};
    }
    return StubReply{200, "{\"access_token\":\"AT1\",\"id_token\":\"IT1\",\"refresh_token\":\"RT1\",\"expires_in\":3599}"};
}

FlowConfig configFor(const StubHttpServer& srv) {
    FlowConfig cfg = ConfigLoader::FromString("clientId=abc; clientSecret=xyz; readTimeoutMs=3000; redirectTimeoutSeconds=10");
    cfg.tokenEndpoint = srv.baseUrl() + "/token";
    cfg.revocationEndpoint = srv.baseUrl() + "/revoke";
    return cfg;
}

errors::AuthError failureOf(std::future<auth::Credential>& fut) {
    if (fut.wait_for(15s) != std::future_status::ready) {
        ADD_FAILURE() << "flow did not settle";
        return errors::NetworkError("not settled");
    }
    try {
        (void)fut.get();
    } catch (const errors::AuthError& e) {
        return e;
    }
    ADD_FAILURE() << "flow succeeded unexpectedly";
    return errors::NetworkError("succeeded");
}

bool waitForState(const OAuthFlowOrchestrator& flow, FlowState want) {
    for (int i = 0; i < 200; ++i) {
        if (flow.State() == want) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

unsigned short portOf(const std::string& redirectUri) {
    return static_cast<unsigned short>(std::stoi(parseUrl(redirectUri).port));
}

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

} // namespace

TEST(FlowOrchestrator, CompletesDirectFlowEndToEnd) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    auto browser = std::make_shared<ScriptedBrowser>();
    OAuthFlowOrchestrator flow({configFor(srv), nullptr, browser, {}});

    std::mutex mtx;
    std::vector<FlowState> seen;
    flow.SetStateChangedHandler([&](FlowState s) {
        std::lock_guard<std::mutex> lk(mtx);
        seen.push_back(s);
    });
    std::atomic<int> foreground{0};
    flow.SetForegroundHook([&]() { ++foreground; });

    EXPECT_EQ(flow.State(), FlowState::Idle);
    auto fut = flow.Start();
    ASSERT_EQ(fut.wait_for(15s), std::future_status::ready);
    auth::Credential cred = fut.get();

    ASSERT_TRUE(cred.tokens.has_value());
    EXPECT_EQ(cred.tokens->accessToken, "AT1");
    EXPECT_EQ(cred.tokens->idToken.value_or(""), "IT1");
    EXPECT_EQ(flow.State(), FlowState::Succeeded);
    EXPECT_EQ(foreground.load(), 1);

    {
        std::lock_guard<std::mutex> lk(mtx);
        EXPECT_EQ(seen, (std::vector<FlowState>{FlowState::ListenerStarted, FlowState::AwaitingRedirect,
                                                FlowState::RedirectCaptured, FlowState::Exchanging,
                                                FlowState::Succeeded}));
    }

    ASSERT_EQ(browser->opened.size(), 1u);
    EXPECT_EQ(browser->lastHit.status, 200);
    EXPECT_NE(browser->lastHit.body.find("Authentication successful"), std::string::npos);
    QueryParams q = parseQuery(parseUrl(browser->opened[0]).query);
    EXPECT_EQ(*findParam(q, "redirect_uri"), flow.RedirectUri());
    EXPECT_EQ(*findParam(q, "code_challenge_method"), "S256");

    auto requests = srv.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_NE(requests[0].body.find("code_verifier="), std::string::npos);
    EXPECT_NE(requests[0].body.find("redirect_uri=" + formEncode(flow.RedirectUri())), std::string::npos);

    // The listener is gone once the future is ready
    EXPECT_TRUE(canBind(portOf(flow.RedirectUri())));
}

TEST(FlowOrchestrator, CompletesProxiedFlowEndToEnd) {
    StubHttpServer srv([](const StubRequest& r) {
        const std::string prefix = "/getOAuthUrl?redirect_uri=";
        if (r.target.rfind(prefix, 0) == 0) {
            const std::string redirect = r.target.substr(prefix.size());
            return StubReply{200, "{\"authUrl\":\"http://localhost/authorize?client_id=abc&redirect_uri=" + redirect +
                                      "&response_type=code&state=S1\",\"state\":\"S1\",\"codeVerifier\":\"V1\"}"};
        }
        if (r.target == "/exchangeOAuthCode") {
            if (r.body.find("\"validcode\"") == std::string::npos || r.body.find("\"V1\"") == std::string::npos) {
                return StubReply{400, "{\"error\":\"invalid_request\"}"};
            }
            return StubReply{200, "{\"firebaseToken\":\"CT1\",\"googleTokens\":{\"accessToken\":\"AT1\"},"
                                  "\"user\":{\"uid\":\"u1\",\"email\":\"a@b.c\"}}"};
        }
        return StubReply{404, "{\"error\":\"not_found\"}"};
    });
    srv.start();
    FlowConfig cfg = ConfigLoader::FromString("mode=proxied; readTimeoutMs=3000; redirectTimeoutSeconds=10");
    cfg.backendBaseUrl = srv.baseUrl();
    cfg.allowedHosts = {"localhost"};
    auto browser = std::make_shared<ScriptedBrowser>();
    OAuthFlowOrchestrator flow({cfg, nullptr, browser, {}});

    auto fut = flow.Start();
    ASSERT_EQ(fut.wait_for(15s), std::future_status::ready);
    auth::Credential cred = fut.get();
    EXPECT_EQ(cred.customToken.value_or(""), "CT1");
    ASSERT_TRUE(cred.tokens.has_value());
    EXPECT_EQ(cred.tokens->accessToken, "AT1");
    ASSERT_TRUE(cred.user.has_value());
    EXPECT_EQ(cred.user->email, "a@b.c");
    EXPECT_EQ(flow.State(), FlowState::Succeeded);
    EXPECT_EQ(browser->lastHit.status, 200);

    auto requests = srv.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].target, "/getOAuthUrl?redirect_uri=" + percentEncode(flow.RedirectUri()));
    EXPECT_EQ(requests[1].target, "/exchangeOAuthCode");
    EXPECT_NE(requests[1].body.find(flow.RedirectUri()), std::string::npos);
    EXPECT_TRUE(canBind(portOf(flow.RedirectUri())));
}

TEST(FlowOrchestrator, RejectedCodeFailsAndReleasesPort) {
    StubHttpServer srv([](const StubRequest&) { return StubReply{400, "{\"error\":\"invalid_grant\"}"}; });
    srv.start();
    OAuthFlowOrchestrator flow({configFor(srv), nullptr, std::make_shared<ScriptedBrowser>(), {}});
    auto fut = flow.Start();
    errors::AuthError e = failureOf(fut);
    EXPECT_EQ(e.category, errors::ErrorCategory::TokenExchange);
    EXPECT_EQ(e.providerError, "invalid_grant");
    EXPECT_EQ(e.remedy, errors::Remedy::Retry);
    EXPECT_EQ(flow.State(), FlowState::Failed);
    EXPECT_TRUE(canBind(portOf(flow.RedirectUri())));
}

TEST(FlowOrchestrator, ForgedStateIsSecurityErrorWithoutExchange) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    OAuthFlowOrchestrator flow(
        {configFor(srv), nullptr, std::make_shared<ScriptedBrowser>(ScriptedBrowser::Mode::WrongState), {}});
    auto fut = flow.Start();
    EXPECT_EQ(failureOf(fut).category, errors::ErrorCategory::Security);
    EXPECT_EQ(flow.State(), FlowState::Failed);
    EXPECT_TRUE(srv.requests().empty());
}

TEST(FlowOrchestrator, UserDenialIsAuthorizationDenied) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    OAuthFlowOrchestrator flow(
        {configFor(srv), nullptr, std::make_shared<ScriptedBrowser>(ScriptedBrowser::Mode::Deny), {}});
    auto fut = flow.Start();
    errors::AuthError e = failureOf(fut);
    EXPECT_EQ(e.category, errors::ErrorCategory::AuthorizationDenied);
    EXPECT_EQ(e.providerError, "access_denied");
    EXPECT_TRUE(srv.requests().empty());
}

TEST(FlowOrchestrator, LaunchFailureFailsFlow) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    OAuthFlowOrchestrator flow(
        {configFor(srv), nullptr, std::make_shared<ScriptedBrowser>(ScriptedBrowser::Mode::Throw), {}});
    auto fut = flow.Start();
    errors::AuthError e = failureOf(fut);
    EXPECT_EQ(e.category, errors::ErrorCategory::Launch);
    EXPECT_EQ(flow.State(), FlowState::Failed);
    EXPECT_TRUE(canBind(portOf(flow.RedirectUri())));
}

TEST(FlowOrchestrator, UnsafeAuthorizationUrlNeverReachesLauncher) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    FlowConfig cfg = configFor(srv);
    cfg.authorizationEndpoint = "https://evil.example.com/auth";
    auto browser = std::make_shared<ScriptedBrowser>();
    OAuthFlowOrchestrator flow({cfg, nullptr, browser, {}});
    auto fut = flow.Start();
    EXPECT_EQ(failureOf(fut).category, errors::ErrorCategory::Security);
    EXPECT_TRUE(browser->opened.empty());
}

TEST(FlowOrchestrator, RedirectTimeout) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    FlowConfig cfg = configFor(srv);
    cfg.redirectTimeoutSeconds = 1;
    OAuthFlowOrchestrator flow({cfg, nullptr, std::make_shared<ScriptedBrowser>(ScriptedBrowser::Mode::Ignore), {}});
    auto fut = flow.Start();
    EXPECT_EQ(failureOf(fut).category, errors::ErrorCategory::Timeout);
    EXPECT_EQ(flow.State(), FlowState::Failed);
}

TEST(FlowOrchestrator, MissingClientIdFailsBeforeLaunch) {
    StubHttpServer srv(tokenEndpoint);
    FlowConfig cfg;
    cfg.credentialSource = auth::CredentialSource::Unset;
    auto browser = std::make_shared<ScriptedBrowser>();
    OAuthFlowOrchestrator flow({cfg, nullptr, browser, {}});
    std::vector<FlowState> seen;
    flow.SetStateChangedHandler([&](FlowState st) { seen.push_back(st); });

    auto fut = flow.Start();
    // Settled synchronously and no port was ever bound
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    EXPECT_TRUE(flow.RedirectUri().empty());
    errors::AuthError e = failureOf(fut);
    EXPECT_EQ(e.category, errors::ErrorCategory::Configuration);
    EXPECT_EQ(e.remedy, errors::Remedy::AlternateSignIn);
    EXPECT_TRUE(browser->opened.empty());
    EXPECT_EQ(seen, (std::vector<FlowState>{FlowState::Failed}));
    EXPECT_EQ(flow.State(), FlowState::Failed);
}

TEST(FlowOrchestrator, MissingBackendFailsBeforeBind) {
    auto browser = std::make_shared<ScriptedBrowser>();
    auth::ProxiedTokenExchange::Options o;
    OAuthFlowOrchestrator flow({FlowConfig{}, std::make_shared<auth::ProxiedTokenExchange>(o), browser, {}});
    auto fut = flow.Start();
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    EXPECT_TRUE(flow.RedirectUri().empty());
    EXPECT_EQ(failureOf(fut).category, errors::ErrorCategory::Configuration);
    EXPECT_TRUE(browser->opened.empty());
}

TEST(FlowOrchestrator, BindFailureSettlesImmediately) {
    StubHttpServer srv(tokenEndpoint);
    OAuthFlowOrchestrator::Options opts{configFor(srv), nullptr, std::make_shared<ScriptedBrowser>(), {}};
    opts.listener.bindAddress = "192.0.2.1";
    OAuthFlowOrchestrator flow(opts);
    auto fut = flow.Start();
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(failureOf(fut).category, errors::ErrorCategory::Bind);
    EXPECT_EQ(flow.State(), FlowState::Failed);
}

TEST(FlowOrchestrator, SecondStartDisposesFirst) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    FlowConfig cfg = configFor(srv);
    cfg.redirectTimeoutSeconds = 0;
    OAuthFlowOrchestrator flow({cfg, nullptr, std::make_shared<ScriptedBrowser>(ScriptedBrowser::Mode::Ignore), {}});

    auto first = flow.Start();
    ASSERT_TRUE(waitForState(flow, FlowState::AwaitingRedirect));
    const std::string firstRedirect = flow.RedirectUri();

    auto second = flow.Start();
    EXPECT_EQ(failureOf(first).category, errors::ErrorCategory::Cancelled);
    EXPECT_NE(flow.RedirectUri(), firstRedirect);
    EXPECT_TRUE(canBind(portOf(firstRedirect)));
    ASSERT_TRUE(waitForState(flow, FlowState::AwaitingRedirect));

    flow.Dispose();
    EXPECT_EQ(failureOf(second).category, errors::ErrorCategory::Cancelled);
    EXPECT_EQ(flow.State(), FlowState::Disposed);
    flow.Dispose();
    EXPECT_EQ(flow.State(), FlowState::Disposed);
}

TEST(FlowOrchestrator, DisposeFromStateHandlerThenDestroy) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    auto flow = std::make_unique<OAuthFlowOrchestrator>(OAuthFlowOrchestrator::Options{
        configFor(srv), nullptr, std::make_shared<ScriptedBrowser>(ScriptedBrowser::Mode::Ignore), {}});
    OAuthFlowOrchestrator* raw = flow.get();
    std::atomic<bool> handlerReturned{false};
    flow->SetStateChangedHandler([raw, &handlerReturned](FlowState st) {
        if (st == FlowState::AwaitingRedirect) {
            raw->Dispose();
            handlerReturned.store(true);
        }
    });

    auto fut = flow->Start();
    const std::string redirect = flow->RedirectUri();
    EXPECT_EQ(failureOf(fut).category, errors::ErrorCategory::Cancelled);

    // Destroying right after the future settles must wait for the flow thread
    flow.reset();
    EXPECT_TRUE(handlerReturned.load());
    EXPECT_TRUE(canBind(portOf(redirect)));
    EXPECT_TRUE(srv.requests().empty());
}

TEST(FlowOrchestrator, StartFromStateHandlerReplacesSession) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    auto browser = std::make_shared<ScriptedBrowser>(ScriptedBrowser::Mode::Ignore);
    auto flow = std::make_unique<OAuthFlowOrchestrator>(
        OAuthFlowOrchestrator::Options{configFor(srv), nullptr, browser, {}});
    OAuthFlowOrchestrator* raw = flow.get();
    std::atomic<bool> fired{false};
    std::promise<std::future<auth::Credential>> restarted;
    auto restartedFut = restarted.get_future();
    flow->SetStateChangedHandler([&, raw](FlowState st) {
        if (st == FlowState::AwaitingRedirect && !fired.exchange(true)) {
            restarted.set_value(raw->Start());
        }
    });

    auto first = flow->Start();
    EXPECT_EQ(failureOf(first).category, errors::ErrorCategory::Cancelled);
    ASSERT_EQ(restartedFut.wait_for(15s), std::future_status::ready);
    auto second = restartedFut.get();
    ASSERT_TRUE(waitForState(*flow, FlowState::AwaitingRedirect));
    flow.reset();

    EXPECT_EQ(failureOf(second).category, errors::ErrorCategory::Cancelled);
    EXPECT_EQ(browser->opened.size(), 2u);
}

TEST(FlowOrchestrator, DisposeWithoutSessionIsNoop) {
    StubHttpServer srv(tokenEndpoint);
    OAuthFlowOrchestrator flow({configFor(srv), nullptr, std::make_shared<ScriptedBrowser>(), {}});
    flow.Dispose();
    flow.Dispose();
    EXPECT_EQ(flow.State(), FlowState::Idle);
}

TEST(FlowOrchestrator, DisposeAfterSuccessKeepsResult) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    OAuthFlowOrchestrator flow({configFor(srv), nullptr, std::make_shared<ScriptedBrowser>(), {}});
    auto fut = flow.Start();
    ASSERT_EQ(fut.wait_for(15s), std::future_status::ready);
    flow.Dispose();
    EXPECT_EQ(flow.State(), FlowState::Disposed);
    EXPECT_EQ(fut.get().tokens->accessToken, "AT1");
}

TEST(FlowOrchestrator, RefreshAndSignOut) {
    StubHttpServer srv(tokenEndpoint);
    srv.start();
    OAuthFlowOrchestrator flow({configFor(srv), nullptr, std::make_shared<ScriptedBrowser>(), {}});

    // Nothing to revoke yet
    auto early = flow.SignOut();
    EXPECT_EQ(early.wait_for(0s), std::future_status::ready);

    auto fut = flow.Start();
    ASSERT_EQ(fut.wait_for(15s), std::future_status::ready);
    auth::Credential cred = fut.get();

    auth::TokenSet refreshed = flow.Refresh(cred.tokens->refreshToken.value()).get();
    EXPECT_EQ(refreshed.accessToken, "AT2");
    EXPECT_EQ(refreshed.refreshToken.value_or(""), "RT1");

    auto out = flow.SignOut();
    ASSERT_EQ(out.wait_for(10s), std::future_status::ready);
    EXPECT_NO_THROW(out.get());

    bool revoked = false;
    for (const auto& r : srv.requests()) {
        if (r.target == "/revoke") {
            revoked = true;
            EXPECT_EQ(r.body, "token=AT1");
        }
    }
    EXPECT_TRUE(revoked);

    // The token was forgotten; a second sign-out has nothing to send
    EXPECT_EQ(flow.SignOut().wait_for(0s), std::future_status::ready);
}

TEST(FlowOrchestrator, StateNames) {
    EXPECT_STREQ(flowStateName(FlowState::AwaitingRedirect), "AwaitingRedirect");
    EXPECT_TRUE(isTerminal(FlowState::Disposed));
    EXPECT_FALSE(isTerminal(FlowState::Exchanging));
}
