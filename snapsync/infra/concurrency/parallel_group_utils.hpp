// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>

#include <absl/functional/function_ref.h>

#include <snapsync/infra/concurrency/task.hpp>

namespace snapsync::concurrency {

//! \brief Whether the exception is a boost::system::system_error with operation_canceled
bool is_operation_cancelled(const std::exception_ptr& ex_ptr);

//! \brief Runs task_factory(0) ... task_factory(count - 1) concurrently and waits for all of them
//! \details The first failure cancels the remaining subtasks and is rethrown. Cancellation errors are
//! rethrown only when no subtask failed for another reason.
Task<void> generate_parallel_group_task(size_t count, absl::FunctionRef<Task<void>(size_t)> task_factory);

}  // namespace snapsync::concurrency
