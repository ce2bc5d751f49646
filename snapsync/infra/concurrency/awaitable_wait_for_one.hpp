// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// Racing operators derived from boost/asio/experimental/awaitable_operators.hpp
// Copyright (c) 2003-2021 Christopher M. Kohlhoff (chris at kohlhoff dot com)
// Distributed under the Boost Software License, Version 1.0.

#pragma once

#include <cstddef>
#include <exception>
#include <utility>
#include <variant>

#include <snapsync/infra/concurrency/task.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

//! Unlike boost::asio::experimental::awaitable_operators, operator|| here completes with the first
//! operation to finish, successfully or not: a failure of the winner is rethrown, the loser is cancelled.
namespace snapsync::concurrency::awaitable_wait_for_one {

namespace detail {
    using boost::asio::experimental::awaitable_operators::detail::awaitable_unwrap;
    using boost::asio::experimental::awaitable_operators::detail::awaitable_wrap;

    inline void rethrow_if_winner_failed(std::size_t winner, const std::exception_ptr& first,
                                         const std::exception_ptr& second) {
        const std::exception_ptr& failure = (winner == 0) ? first : second;
        if (failure) std::rethrow_exception(failure);
    }
}  // namespace detail

template <typename Executor>
boost::asio::awaitable<std::variant<std::monostate, std::monostate>, Executor> operator||(
    boost::asio::awaitable<void, Executor> first, boost::asio::awaitable<void, Executor> second) {
    const auto executor = co_await boost::asio::this_coro::executor;
    auto [order, ex0, ex1] = co_await boost::asio::experimental::make_parallel_group(
                                 boost::asio::co_spawn(executor, std::move(first), boost::asio::deferred),
                                 boost::asio::co_spawn(executor, std::move(second), boost::asio::deferred))
                                 .async_wait(boost::asio::experimental::wait_for_one(),
                                             boost::asio::use_awaitable_t<Executor>{});

    detail::rethrow_if_winner_failed(order[0], ex0, ex1);
    if (order[0] == 0) co_return std::variant<std::monostate, std::monostate>{std::in_place_index<0>};
    co_return std::variant<std::monostate, std::monostate>{std::in_place_index<1>};
}

//! The variant holds the value when the first operation wins
template <typename T, typename Executor>
boost::asio::awaitable<std::variant<T, std::monostate>, Executor> operator||(
    boost::asio::awaitable<T, Executor> first, boost::asio::awaitable<void, Executor> second) {
    const auto executor = co_await boost::asio::this_coro::executor;
    auto [order, ex0, r0, ex1] = co_await boost::asio::experimental::make_parallel_group(
                                     boost::asio::co_spawn(executor, detail::awaitable_wrap(std::move(first)),
                                                           boost::asio::deferred),
                                     boost::asio::co_spawn(executor, std::move(second), boost::asio::deferred))
                                     .async_wait(boost::asio::experimental::wait_for_one(),
                                                 boost::asio::use_awaitable_t<Executor>{});

    detail::rethrow_if_winner_failed(order[0], ex0, ex1);
    if (order[0] == 0) {
        co_return std::variant<T, std::monostate>{std::in_place_index<0>,
                                                  std::move(detail::awaitable_unwrap<T>(r0))};
    }
    co_return std::variant<T, std::monostate>{std::in_place_index<1>};
}

}  // namespace snapsync::concurrency::awaitable_wait_for_one
