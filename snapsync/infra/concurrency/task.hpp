// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <coroutine>

#include <boost/asio/awaitable.hpp>

// Declared in the top-level namespace: every layer writes Task<T> unqualified
namespace snapsync {

//! Asynchronous operation implemented as a C++20 coroutine running on an asio executor
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace snapsync
