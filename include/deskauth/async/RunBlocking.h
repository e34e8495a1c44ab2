//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RunBlocking.h
// Purpose: Drives a Boost.Asio awaitable to completion on a private io_context owned by the caller's thread
//==========================================================================================================

#pragma once

#include <exception>
#include <future>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace deskauth {
namespace async {

//==========================================================================================================
// runBlocking
// Purpose: Spawns the coroutine on a fresh io_context, runs it on the calling thread and returns the
//          result (or rethrows the coroutine's exception).
// Notes:
//   - The io_context lives for the duration of the call; work the coroutine leaves behind (cancelled
//     timers, posted cancellations) is destroyed with it.
//==========================================================================================================
template <typename T>
T runBlocking(boost::asio::awaitable<T> aw) {
    boost::asio::io_context ioc;
    std::promise<T> pr;
    auto fut = pr.get_future();
    boost::asio::co_spawn(ioc, std::move(aw), [&pr](std::exception_ptr eptr, T value) {
        if (eptr) {
            pr.set_exception(eptr);
        } else {
            pr.set_value(std::move(value));
        }
    });
    ioc.run();
    return fut.get();
}

inline void runBlocking(boost::asio::awaitable<void> aw) {
    boost::asio::io_context ioc;
    std::promise<void> pr;
    auto fut = pr.get_future();
    boost::asio::co_spawn(ioc, std::move(aw), [&pr](std::exception_ptr eptr) {
        if (eptr) {
            pr.set_exception(eptr);
        } else {
            pr.set_value();
        }
    });
    ioc.run();
    fut.get();
}

} // namespace async
} // namespace deskauth
