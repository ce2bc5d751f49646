// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "task_group.hpp"

#include <utility>

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>

#include <snapsync/core/common/assert.hpp>
#include <snapsync/infra/common/log.hpp>
#include <snapsync/infra/concurrency/parallel_group_utils.hpp>

namespace snapsync::concurrency {

void TaskGroup::spawn(const boost::asio::any_io_executor& executor, Task<void> task) {
    std::scoped_lock lock{mutex_};
    if (closed_) throw SpawnAfterCloseError{};

    const std::size_t task_id = next_task_id_++;
    auto& cancellation = running_[task_id];
    boost::asio::co_spawn(
        executor,
        std::move(task),
        boost::asio::bind_cancellation_slot(cancellation.slot(), [this, task_id](std::exception_ptr ex_ptr) {
            on_complete(task_id, std::move(ex_ptr));
        }));
}

Task<void> TaskGroup::wait() {
    std::exception_ptr result;
    try {
        result = co_await notifications_.receive();
    } catch (const boost::system::system_error&) {
        result = std::current_exception();
    }

    co_await boost::asio::this_coro::reset_cancellation_state();

    if (!close_and_cancel_all()) {
        do {
            std::exception_ptr ex_ptr = co_await notifications_.receive();
            if (ex_ptr && ex_ptr != result) {
                SNAP_TRACE << "TaskGroup: task failed while draining";
                result = ex_ptr;
            }
        } while (!is_drained());
    }

    std::rethrow_exception(result);
}

std::size_t TaskGroup::size() {
    std::scoped_lock lock{mutex_};
    return running_.size();
}

void TaskGroup::on_complete(std::size_t task_id, std::exception_ptr ex_ptr) {
    if (ex_ptr && is_operation_cancelled(ex_ptr)) {
        ex_ptr = nullptr;
    }

    std::scoped_lock lock{mutex_};
    running_.erase(task_id);
    if (closed_) {
        // capacity covers one pending failure plus every running task
        const bool sent = notifications_.try_send(ex_ptr);
        SNAPSYNC_ASSERT(sent);
        return;
    }
    if (ex_ptr && !first_failure_) {
        first_failure_ = ex_ptr;
        const bool sent = notifications_.try_send(ex_ptr);
        SNAPSYNC_ASSERT(sent);
    }
}

bool TaskGroup::close_and_cancel_all() {
    std::scoped_lock lock{mutex_};
    closed_ = true;
    for (auto& [_, cancellation] : running_) {
        cancellation.emit(boost::asio::cancellation_type::all);
    }
    return running_.empty();
}

bool TaskGroup::is_drained() {
    std::scoped_lock lock{mutex_};
    return running_.empty();
}

}  // namespace snapsync::concurrency
