//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.hpp
// Purpose: One-shot coroutine HTTP/HTTPS requests (Boost.Beast) with timeouts and stop-token cancellation
//==========================================================================================================

#pragma once

#include <stop_token>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>

namespace deskauth::http {

//==========================================================================================================
// HttpRequestParams
// Purpose: Target and transport settings for one request.
// Fields:
//   method: "GET" or "POST".
//   url: Absolute http(s) URL including any query.
//   body/contentType: Request payload (POST only).
//   accept: Accept header value.
//   serverName: TLS SNI / hostname verification override (defaults to the URL host).
//   caFile/caPath: Optional trust store additions for https.
//   connectTimeoutMs: Deadline for TCP connect and TLS handshake (0 disables).
//   readTimeoutMs: Deadline for writing the request and reading the response (0 disables).
//   totalTimeoutMs: Overall deadline including name resolution (0 disables).
//==========================================================================================================
struct HttpRequestParams {
    std::string method{"POST"};
    std::string url;
    std::string body;
    std::string contentType;
    std::string accept{"application/json"};
    std::string serverName;
    std::string caFile;
    std::string caPath;
    unsigned int connectTimeoutMs{10000};
    unsigned int readTimeoutMs{30000};
    unsigned int totalTimeoutMs{0};
};

struct HttpResponse {
    int status{0};
    std::string body;
    std::string contentType;
};

//==========================================================================================================
// coSendRequest
// Purpose: Performs one request with "Connection: close" and returns status and body for any HTTP status.
// Args:
//   params: Request description (copied into the coroutine frame).
//   sslCtxOpt: TLS context to use for https; when null a TLS 1.3 client context verifying peers against
//              the default paths (plus caFile/caPath) is created.
//   stop: Cancellation token; a stop request aborts the in-flight operation.
// Throws:
//   errors::AuthError Timeout when a deadline expires, Cancelled after a stop request, Network for
//   resolution/connection/TLS/protocol failures.
//==========================================================================================================
boost::asio::awaitable<HttpResponse> coSendRequest(
    HttpRequestParams params,
    boost::asio::ssl::context* sslCtxOpt,
    std::stop_token stop);

// POST an application/x-www-form-urlencoded body.
boost::asio::awaitable<HttpResponse> coPostFormUrlencoded(
    HttpRequestParams params,
    std::string body,
    boost::asio::ssl::context* sslCtxOpt,
    std::stop_token stop);

// POST an application/json body.
boost::asio::awaitable<HttpResponse> coPostJson(
    HttpRequestParams params,
    std::string json,
    boost::asio::ssl::context* sslCtxOpt,
    std::stop_token stop);

// GET params.url.
boost::asio::awaitable<HttpResponse> coGet(
    HttpRequestParams params,
    boost::asio::ssl::context* sslCtxOpt,
    std::stop_token stop);

} // namespace deskauth::http
