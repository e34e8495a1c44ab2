//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.cpp
// Purpose: One-shot coroutine HTTP/HTTPS requests (Boost.Beast) with timeouts and stop-token cancellation
//==========================================================================================================

#include <string>
#include <utility>
#include <memory>
#include <chrono>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <openssl/ssl.h>

#include "deskauth/Url.hpp"
#include "deskauth/errors/Errors.h"
#include "deskauth/http/HttpClient.hpp"
#include "deskauth/version.h"
#include "logging/Logger.h"

namespace deskauth::http {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

// Everything an out-of-band cancel must reach. Only touched from the owning io_context.
struct Connection {
    explicit Connection(const net::any_io_executor& ex) : resolver(ex) {}

    tcp::resolver resolver;
    std::unique_ptr<beast::tcp_stream> plain;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
    bool timedOut{false};

    void cancel() {
        resolver.cancel();
        if (plain) {
            plain->cancel();
        }
        if (tls) {
            beast::get_lowest_layer(*tls).cancel();
        }
    }
};

void setDeadline(beast::tcp_stream& s, unsigned int ms) {
    if (ms > 0) {
        s.expires_after(std::chrono::milliseconds(ms));
    } else {
        s.expires_never();
    }
}

void throwIfStopped(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw errors::CancelledError("HTTP request cancelled");
    }
}

std::string describeTarget(const UrlParts& u) {
    std::string path = u.path;
    std::size_t q = path.find('?');
    if (q != std::string::npos) {
        path.erase(q);
    }
    return u.scheme + "://" + u.host + ":" + u.port + path;
}

std::unique_ptr<ssl::context> makeClientContext(const HttpRequestParams& params) {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ::SSL_CTX_set_max_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    try {
        ctx->set_default_verify_paths();
    } catch (const std::exception& e) {
        LOG_WARN("HttpClient: set_default_verify_paths failed: {}", e.what());
    }
    if (!params.caFile.empty()) {
        ctx->load_verify_file(params.caFile);
    }
    if (!params.caPath.empty()) {
        ctx->add_verify_path(params.caPath);
    }
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

} // namespace

net::awaitable<HttpResponse> coSendRequest(
    HttpRequestParams params,
    ssl::context* sslCtxOpt,
    std::stop_token stop) {
    throwIfStopped(stop);
    const UrlParts u = parseUrl(params.url);
    if (u.scheme != "http" && u.scheme != "https") {
        throw errors::NetworkError("Unsupported URL scheme: " + u.scheme);
    }
    if (u.host.empty()) {
        throw errors::NetworkError("URL has no host");
    }
    const bool isHttps = (u.scheme == "https");
    const bool isGet = (params.method == "GET");
    const std::string target = describeTarget(u);

    auto ex = co_await net::this_coro::executor;
    auto conn = std::make_shared<Connection>(ex);

    // Stop requests arrive on arbitrary threads; hop onto the executor before touching sockets
    std::stop_callback onStop(stop, [weak = std::weak_ptr<Connection>(conn), ex]() {
        net::post(ex, [weak]() {
            if (auto c = weak.lock()) {
                c->cancel();
            }
        });
    });

    // Bounds name resolution (and the whole request when totalTimeoutMs is set)
    net::steady_timer watchdog(ex);
    const unsigned int guardMs = params.totalTimeoutMs > 0 ? params.totalTimeoutMs : params.connectTimeoutMs;
    if (guardMs > 0) {
        watchdog.expires_after(std::chrono::milliseconds(guardMs));
        watchdog.async_wait([weak = std::weak_ptr<Connection>(conn)](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (auto c = weak.lock()) {
                c->timedOut = true;
                c->cancel();
            }
        });
    }

    try {
        auto results = co_await conn->resolver.async_resolve(u.host, u.port, net::use_awaitable);
        throwIfStopped(stop);
        if (params.totalTimeoutMs == 0) {
            watchdog.cancel();
        }
        LOG_DEBUG("HttpClient: resolved {}", target);

        std::string hostHeader = (u.host.find(':') != std::string::npos) ? "[" + u.host + "]" : u.host;
        if (u.hasExplicitPort) {
            hostHeader += ":" + u.port;
        }

        http::request<http::string_body> req{isGet ? http::verb::get : http::verb::post, u.path, 11};
        req.set(http::field::host, hostHeader);
        req.set(http::field::user_agent, userAgent());
        req.set(http::field::accept, params.accept);
        req.set(http::field::connection, "close");
        if (!isGet) {
            req.set(http::field::content_type, params.contentType);
            req.body() = params.body;
        }
        req.prepare_payload();

        beast::flat_buffer buffer;
        http::response<http::string_body> res;

        if (isHttps) {
            ssl::context* ctxPtr = sslCtxOpt;
            std::unique_ptr<ssl::context> localCtx;
            if (!ctxPtr) {
                localCtx = makeClientContext(params);
                ctxPtr = localCtx.get();
            }
            conn->tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ex, *ctxPtr);
            const std::string sni = params.serverName.empty() ? u.host : params.serverName;
            if (!::SSL_set_tlsext_host_name(conn->tls->native_handle(), sni.c_str())) {
                LOG_WARN("HttpClient: SNI set failed for {}", sni);
            }
            if (::SSL_set1_host(conn->tls->native_handle(), sni.c_str()) != 1) {
                throw errors::NetworkError("TLS hostname verification could not be configured for " + sni);
            }
            auto& lowest = beast::get_lowest_layer(*conn->tls);
            setDeadline(lowest, params.connectTimeoutMs);
            co_await lowest.async_connect(results, net::use_awaitable);
            throwIfStopped(stop);
            co_await conn->tls->async_handshake(ssl::stream_base::client, net::use_awaitable);
            throwIfStopped(stop);
            LOG_DEBUG("HttpClient: TLS handshake complete with {}", sni);

            setDeadline(lowest, params.readTimeoutMs);
            co_await http::async_write(*conn->tls, req, net::use_awaitable);
            co_await http::async_read(*conn->tls, buffer, res, net::use_awaitable);

            boost::system::error_code ec;
            lowest.expires_after(std::chrono::milliseconds(1000));
            co_await conn->tls->async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } else {
            conn->plain = std::make_unique<beast::tcp_stream>(ex);
            setDeadline(*conn->plain, params.connectTimeoutMs);
            co_await conn->plain->async_connect(results, net::use_awaitable);
            throwIfStopped(stop);
            LOG_DEBUG("HttpClient: connected {}", target);

            setDeadline(*conn->plain, params.readTimeoutMs);
            co_await http::async_write(*conn->plain, req, net::use_awaitable);
            co_await http::async_read(*conn->plain, buffer, res, net::use_awaitable);

            boost::system::error_code ec;
            conn->plain->socket().shutdown(tcp::socket::shutdown_both, ec);
        }

        HttpResponse out;
        out.status = static_cast<int>(res.result_int());
        out.contentType = std::string(res[http::field::content_type]);
        out.body = std::move(res.body());
        LOG_DEBUG("HttpClient: {} {} -> {} ({} bytes)", params.method, target, out.status, out.body.size());
        co_return out;
    } catch (const boost::system::system_error& e) {
        if (stop.stop_requested()) {
            throw errors::CancelledError("HTTP request to " + target + " was cancelled");
        }
        if (conn->timedOut || e.code() == beast::error::timeout) {
            LOG_WARN("HttpClient: {} {} timed out", params.method, target);
            throw errors::TimeoutError("Request to " + target + " timed out");
        }
        LOG_WARN("HttpClient: {} {} failed: {}", params.method, target, e.what());
        throw errors::NetworkError("Request to " + target + " failed: " + e.code().message());
    }
}

net::awaitable<HttpResponse> coPostFormUrlencoded(
    HttpRequestParams params,
    std::string body,
    ssl::context* sslCtxOpt,
    std::stop_token stop) {
    params.method = "POST";
    params.contentType = "application/x-www-form-urlencoded";
    params.body = std::move(body);
    co_return co_await coSendRequest(std::move(params), sslCtxOpt, std::move(stop));
}

net::awaitable<HttpResponse> coPostJson(
    HttpRequestParams params,
    std::string json,
    ssl::context* sslCtxOpt,
    std::stop_token stop) {
    params.method = "POST";
    params.contentType = "application/json";
    params.body = std::move(json);
    co_return co_await coSendRequest(std::move(params), sslCtxOpt, std::move(stop));
}

net::awaitable<HttpResponse> coGet(
    HttpRequestParams params,
    ssl::context* sslCtxOpt,
    std::stop_token stop) {
    params.method = "GET";
    params.body.clear();
    co_return co_await coSendRequest(std::move(params), sslCtxOpt, std::move(stop));
}

} // namespace deskauth::http
