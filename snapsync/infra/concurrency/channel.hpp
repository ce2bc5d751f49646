// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <utility>

#include <snapsync/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace snapsync::concurrency {

//! Thread-safe FIFO between coroutines
//! \note a closed or cancelled channel makes send and receive throw operation_canceled
template <typename T>
class Channel {
  public:
    explicit Channel(const boost::asio::any_io_executor& executor, std::size_t capacity = 0)
        : channel_{executor, capacity} {}

    Task<void> send(T value) {
        auto [ec] = co_await channel_.async_send(boost::system::error_code{}, std::move(value), kUseTuple);
        throw_on_error(ec);
    }

    //! Returns false instead of waiting when the buffer is full
    bool try_send(T value) { return channel_.try_send(boost::system::error_code{}, std::move(value)); }

    Task<T> receive() {
        auto [ec, value] = co_await channel_.async_receive(kUseTuple);
        throw_on_error(ec);
        co_return std::move(value);
    }

    void close() { channel_.close(); }

  private:
    static constexpr auto kUseTuple = boost::asio::as_tuple(boost::asio::use_awaitable);

    static void throw_on_error(const boost::system::error_code& ec) {
        if (!ec) return;
        namespace channel_error = boost::asio::experimental::error;
        if (ec == channel_error::channel_closed || ec == channel_error::channel_cancelled ||
            ec == boost::asio::error::operation_aborted) {
            throw boost::system::system_error{make_error_code(boost::system::errc::operation_canceled)};
        }
        throw boost::system::system_error{ec};
    }

    boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
};

}  // namespace snapsync::concurrency
