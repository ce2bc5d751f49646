// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <stdexcept>

#include <snapsync/infra/concurrency/task.hpp>

namespace snapsync::concurrency {

class TimeoutExpiredError : public std::runtime_error {
  public:
    TimeoutExpiredError() : std::runtime_error{"timeout expired"} {}
};

//! \brief Deadline to race against another task with awaitable_wait_for_one::operator||
//! \details Completes normally when cancelled before expiration, throws TimeoutExpiredError on expiration.
Task<void> timeout(std::chrono::milliseconds duration, const char* source_file_path = nullptr, int source_file_line = 0);

}  // namespace snapsync::concurrency

//! Timeout tagged with the call site, traced on expiration
#define SNAP_CONCURRENCY_TIMEOUT(duration) ::snapsync::concurrency::timeout(duration, __FILE__, __LINE__)
