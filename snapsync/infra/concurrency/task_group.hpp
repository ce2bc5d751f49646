// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>

#include <snapsync/infra/concurrency/channel.hpp>
#include <snapsync/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/cancellation_signal.hpp>

namespace snapsync::concurrency {

/**
 * Owner of a dynamic set of detached tasks, e.g. the in-flight chunk requests of a download.
 *
 * wait() runs until it is cancelled or one of the tasks fails. Then the group gets closed,
 * every task still running is cancelled and wait() returns only after all of them completed,
 * rethrowing the first task failure (or the cancellation of wait() itself).
 *
 * \code
 * TaskGroup workers{executor, kMaxInFlight};
 * co_await (schedule_requests(workers) || workers.wait());
 * \endcode
 */
class TaskGroup {
  public:
    //! \param max_tasks upper bound of the tasks running at the same time
    TaskGroup(const boost::asio::any_io_executor& executor, std::size_t max_tasks)
        : notifications_{executor, max_tasks + 1} {}

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    class SpawnAfterCloseError : public std::runtime_error {
      public:
        SpawnAfterCloseError() : std::runtime_error{"TaskGroup closed, cannot spawn"} {}
    };

    //! \throws SpawnAfterCloseError once wait() has started shutting the group down
    void spawn(const boost::asio::any_io_executor& executor, Task<void> task);

    //! Never returns normally: see the class description
    Task<void> wait();

    std::size_t size();

  private:
    void on_complete(std::size_t task_id, std::exception_ptr ex_ptr);
    bool close_and_cancel_all();
    bool is_drained();

    std::mutex mutex_;
    bool closed_{false};
    std::size_t next_task_id_{0};
    std::map<std::size_t, boost::asio::cancellation_signal> running_;
    std::exception_ptr first_failure_;

    //! Carries the first failure while open, then every completion while draining
    Channel<std::exception_ptr> notifications_;
};

}  // namespace snapsync::concurrency
