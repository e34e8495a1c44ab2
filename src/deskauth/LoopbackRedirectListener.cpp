//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/deskauth/LoopbackRedirectListener.cpp
// Purpose: Single-use loopback HTTP acceptor that captures one OAuth redirect (Boost.Beast coroutines)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <mutex>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "deskauth/LoopbackRedirectListener.hpp"
#include "deskauth/errors/Errors.h"
#include "logging/Logger.h"

namespace deskauth {
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
constexpr const char* kDefaultPage =
    "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>Sign-in</title></head>"
    "<body style=\"font-family:sans-serif;text-align:center;padding-top:4em\">"
    "<h2>Authentication successful.</h2>"
    "<p>You can close this tab and return to the application.</p>"
    "</body></html>";
}

class LoopbackRedirectListener::Impl {
public:
    LoopbackRedirectListener::Options opts;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    unsigned short port{0};

    std::atomic<bool> captured{false};

    std::mutex mtx;
    bool started{false};
    bool stopped{false};
    bool fulfilled{false};
    std::promise<RawRedirect> redirectPromise;
    std::shared_future<RawRedirect> redirectFuture{redirectPromise.get_future().share()};

    std::function<void(const std::string&)> errorHandler;

    explicit Impl(const LoopbackRedirectListener::Options& o) : opts(o) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            if (ioThread.get_id() == std::this_thread::get_id()) {
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
    }

    void setError(const std::string& msg) {
        LOG_DEBUG("LoopbackRedirectListener: {}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void deliver(RawRedirect raw) {
        std::lock_guard<std::mutex> lk(mtx);
        if (fulfilled) {
            return;
        }
        fulfilled = true;
        redirectPromise.set_value(std::move(raw));
    }

    void fail(const errors::AuthError& err) {
        std::lock_guard<std::mutex> lk(mtx);
        if (fulfilled) {
            return;
        }
        fulfilled = true;
        redirectPromise.set_exception(std::make_exception_ptr(err));
    }

    void closeAcceptor() {
        if (acceptor && acceptor->is_open()) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
    }

    static void splitTarget(const std::string& target, std::string& path, std::string& query) {
        std::size_t q = target.find('?');
        if (q == std::string::npos) {
            path = target;
            query.clear();
        } else {
            path = target.substr(0, q);
            query = target.substr(q + 1);
        }
        if (path.empty()) {
            path = "/";
        }
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req,
                                                   http::status status,
                                                   const std::string& body) {
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::content_type, "text/html; charset=utf-8");
        res.set(http::field::cache_control, "no-store");
        res.keep_alive(false);
        res.body() = body;
        res.prepare_payload();
        return res;
    }

    net::awaitable<void> session(tcp::socket socket) {
        RawRedirect raw;
        bool mine = false;
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            stream.expires_after(std::chrono::milliseconds(opts.requestReadTimeoutMs));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);

            raw.target = std::string(req.target());
            splitTarget(raw.target, raw.path, raw.query);

            if (captured.load() || req.method() != http::verb::get || raw.path != opts.callbackPath) {
                // Stray requests (favicon, connection checks) neither complete nor consume the capture
                LOG_DEBUG("LoopbackRedirectListener: ignoring {} {}", std::string(req.method_string()), raw.path);
                auto res = makeResponse(req, http::status::not_found, "<!DOCTYPE html><html><body>Not found</body></html>");
                co_await http::async_write(stream, res, net::use_awaitable);
            } else {
                captured.store(true);
                mine = true;
                // No further connections once the redirect is in hand
                closeAcceptor();
                const std::string page = opts.responseHtml.empty() ? std::string(kDefaultPage) : opts.responseHtml;
                auto res = makeResponse(req, http::status::ok, page);
                co_await http::async_write(stream, res, net::use_awaitable);
                LOG_INFO("LoopbackRedirectListener: redirect captured on port {}", port);
            }
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            // Pre-connected sockets that never send a request end up here
            if (running.load()) {
                setError(std::string("session discarded: ") + e.what());
            }
        }
        if (mine) {
            deliver(std::move(raw));
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load() && !captured) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (captured) {
                    break;
                }
                net::co_spawn(ioc, session(std::move(socket)), net::detached);
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load() || captured) {
                // Acceptor closed after capture or during Stop()
                LOG_DEBUG("LoopbackRedirectListener accept finished: {}", e.what());
            } else {
                setError(std::string("accept error: ") + e.what());
                fail(errors::NetworkError(std::string("Loopback listener failed: ") + e.what()));
            }
        }
        co_return;
    }
};

LoopbackRedirectListener::LoopbackRedirectListener()
    : pImpl(std::make_unique<Impl>(Options{})) {}

LoopbackRedirectListener::LoopbackRedirectListener(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

LoopbackRedirectListener::~LoopbackRedirectListener() {
    (void)Stop();
}

ListenerEndpoint LoopbackRedirectListener::Start() {
    {
        std::lock_guard<std::mutex> lk(pImpl->mtx);
        if (pImpl->started || pImpl->stopped) {
            throw errors::ConfigurationError("Loopback listener can only be started once");
        }
        pImpl->started = true;
    }

    boost::system::error_code ec;
    auto addr = net::ip::make_address(pImpl->opts.bindAddress, ec);
    if (ec || !addr.is_loopback()) {
        throw errors::BindError("Invalid loopback bind address: " + pImpl->opts.bindAddress);
    }
    tcp::endpoint ep(addr, 0);
    pImpl->acceptor = std::make_unique<tcp::acceptor>(pImpl->ioc);
    // No SO_REUSEADDR: on Windows it would allow another process to bind the same port
    pImpl->acceptor->open(ep.protocol(), ec);
    if (!ec) { pImpl->acceptor->bind(ep, ec); }
    if (!ec) { pImpl->acceptor->listen(net::socket_base::max_listen_connections, ec); }
    if (ec) {
        pImpl->closeAcceptor();
        LOG_ERROR("LoopbackRedirectListener: bind failed: {}", ec.message());
        throw errors::BindError("Could not bind a loopback port: " + ec.message());
    }
    pImpl->port = pImpl->acceptor->local_endpoint().port();
    pImpl->running.store(true);

    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(e.what());
            pImpl->fail(errors::NetworkError(std::string("Loopback listener stopped unexpectedly: ") + e.what()));
        }
    });

    ListenerEndpoint out;
    out.port = pImpl->port;
    out.redirectUri = "http://" + pImpl->opts.redirectHost + ":" + std::to_string(pImpl->port);
    LOG_INFO("LoopbackRedirectListener: listening on {}:{}", pImpl->opts.bindAddress, pImpl->port);
    return out;
}

RawRedirect LoopbackRedirectListener::AwaitRequest(std::chrono::milliseconds timeout) {
    std::shared_future<RawRedirect> fut;
    {
        std::lock_guard<std::mutex> lk(pImpl->mtx);
        if (!pImpl->started) {
            throw errors::ConfigurationError("Loopback listener is not started");
        }
        fut = pImpl->redirectFuture;
    }
    if (timeout.count() > 0 && fut.wait_for(timeout) != std::future_status::ready) {
        LOG_WARN("LoopbackRedirectListener: no redirect within {} ms", timeout.count());
        throw errors::TimeoutError("Sign-in was not completed in the browser in time");
    }
    return fut.get();
}

std::future<void> LoopbackRedirectListener::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    bool firstStop = false;
    {
        std::lock_guard<std::mutex> lk(pImpl->mtx);
        if (!pImpl->stopped) {
            pImpl->stopped = true;
            firstStop = true;
        }
    }
    if (firstStop) {
        pImpl->running.store(false);
        pImpl->fail(errors::CancelledError("Sign-in was cancelled"));
        pImpl->ioc.stop();
        if (pImpl->ioThread.joinable()) {
            if (pImpl->ioThread.get_id() == std::this_thread::get_id()) {
                pImpl->ioThread.detach();
            } else {
                pImpl->ioThread.join();
            }
        }
        // The I/O thread is gone; closing here cannot race an in-flight accept
        pImpl->closeAcceptor();
        if (pImpl->port != 0) {
            LOG_DEBUG("LoopbackRedirectListener: port {} released", pImpl->port);
        }
    }
    done.set_value();
    return fut;
}

bool LoopbackRedirectListener::IsListening() const {
    return pImpl->running.load() && !pImpl->captured.load();
}

unsigned short LoopbackRedirectListener::Port() const {
    return pImpl->port;
}

void LoopbackRedirectListener::SetErrorHandler(std::function<void(const std::string&)> handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace deskauth
