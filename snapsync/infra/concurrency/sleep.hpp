// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <snapsync/infra/concurrency/task.hpp>

namespace snapsync {

//! \brief Suspends the calling coroutine for the given duration
//! \throws boost::system::system_error with operation_canceled if cancelled while waiting
Task<void> sleep(std::chrono::milliseconds duration);

}  // namespace snapsync
