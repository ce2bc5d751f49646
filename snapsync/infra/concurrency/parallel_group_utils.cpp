// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "parallel_group_utils.hpp"

#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/cancellation_condition.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

namespace snapsync::concurrency {

using namespace boost::asio;

bool is_operation_cancelled(const std::exception_ptr& ex_ptr) {
    try {
        std::rethrow_exception(ex_ptr);
    } catch (const boost::system::system_error& ex) {
        return ex.code() == boost::system::errc::operation_canceled;
    } catch (const std::exception&) {
        return false;
    }
}

// Visits exceptions in completion order
static void rethrow_first_failure(const std::vector<std::exception_ptr>& exceptions, const std::vector<size_t>& order) {
    std::exception_ptr cancelled;
    for (const size_t index : order) {
        const auto& ex_ptr{exceptions[index]};
        if (!ex_ptr) continue;
        if (!is_operation_cancelled(ex_ptr)) {
            std::rethrow_exception(ex_ptr);
        }
        if (!cancelled) {
            cancelled = ex_ptr;
        }
    }
    if (cancelled) {
        std::rethrow_exception(cancelled);
    }
}

Task<void> generate_parallel_group_task(size_t count, absl::FunctionRef<Task<void>(size_t)> task_factory) {
    if (count == 0) {
        co_return;
    }

    auto executor = co_await this_coro::executor;
    using Operation = decltype(co_spawn(executor, task_factory(0), deferred));
    std::vector<Operation> operations;
    operations.reserve(count);
    for (size_t i{0}; i < count; ++i) {
        operations.push_back(co_spawn(executor, task_factory(i), deferred));
    }

    auto [order, exceptions] =
        co_await experimental::make_parallel_group(std::move(operations))
            .async_wait(experimental::wait_for_one_error(), use_awaitable);
    rethrow_first_failure(exceptions, order);
}

}  // namespace snapsync::concurrency
