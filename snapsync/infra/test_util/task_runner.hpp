// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <snapsync/infra/concurrency/task.hpp>

namespace snapsync::test_util {

//! \brief Drives Task-s to completion on a private io_context from the test thread
//! \details Handlers run in real time: timers inside tasks expire after their actual duration.
class TaskRunner {
  public:
    //! Spawns the task and polls the context until it completes, rethrowing its exception if any
    template <typename TResult>
    TResult run(Task<TResult> task) {
        auto future{boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future)};
        ioc_.restart();
        while (future.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
            ioc_.poll_one();
        }
        return future.get();
    }

    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  private:
    boost::asio::io_context ioc_;
};

}  // namespace snapsync::test_util
