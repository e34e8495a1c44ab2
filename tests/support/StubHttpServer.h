//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/support/StubHttpServer.h
// Purpose: In-process blocking Boost.Beast HTTP server on 127.0.0.1:0 for token endpoint tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace deskauth::testing {

struct StubRequest {
    std::string method;
    std::string target;
    std::string body;
    std::string contentType;
    std::string userAgent;
};

struct StubReply {
    int status{200};
    std::string body;
    std::string contentType{"application/json"};
    // Sleep before answering (timeout/cancellation tests)
    unsigned int delayMs{0};
};

class StubHttpServer {
public:
    using Handler = std::function<StubReply(const StubRequest&)>;

    explicit StubHttpServer(Handler h) : handler(std::move(h)) {}
    ~StubHttpServer() { stop(); }

    void start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                runOnce();
            }
        });
    }

    void stop() {
        if (!running.exchange(false)) {
            if (thr.joinable()) {
                thr.join();
            }
            return;
        }
        boost::system::error_code ec;
        // Poke the blocking accept so the loop observes running == false
        {
            boost::asio::ip::tcp::socket poke{io};
            poke.connect({boost::asio::ip::make_address("127.0.0.1"), port}, ec);
            poke.close(ec);
        }
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }

    std::string baseUrl() const {
        return "http://127.0.0.1:" + std::to_string(port);
    }

    std::vector<StubRequest> requests() {
        std::lock_guard<std::mutex> lk(mtx);
        return seen;
    }

    unsigned short port{0};

private:
    void runOnce() {
        using boost::asio::ip::tcp;
        namespace http = boost::beast::http;
        try {
            tcp::socket socket{io};
            acceptor.accept(socket);
            if (!running.load()) {
                return;
            }
            boost::beast::tcp_stream stream{std::move(socket)};
            stream.expires_after(std::chrono::seconds(5));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(stream, buffer, req);

            StubRequest r;
            r.method = std::string(req.method_string());
            r.target = std::string(req.target());
            r.body = req.body();
            r.contentType = std::string(req[http::field::content_type]);
            r.userAgent = std::string(req[http::field::user_agent]);
            {
                std::lock_guard<std::mutex> lk(mtx);
                seen.push_back(r);
            }

            StubReply reply = handler(r);
            if (reply.delayMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(reply.delayMs));
            }
            http::response<http::string_body> res{static_cast<http::status>(reply.status), req.version()};
            res.set(http::field::server, "stub-server");
            res.set(http::field::content_type, reply.contentType);
            res.keep_alive(false);
            res.body() = reply.body;
            res.prepare_payload();
            http::write(stream, res);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        } catch (const std::exception& e) {
            // Clients that hang up early (timeouts, cancellation) end up here
            std::cerr << "[stub] " << e.what() << std::endl;
        }
    }

    Handler handler;
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    std::mutex mtx;
    std::vector<StubRequest> seen;
};

} // namespace deskauth::testing
