// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace snapsync {

//! \brief Throws std::logic_error with the given literal message unless condition holds
template <unsigned int N>
inline void ensure(bool condition, const char (&message)[N]) {
    if (!condition) [[unlikely]] {
        throw std::logic_error(message);
    }
}

//! \brief Throws std::logic_error with a lazily built message unless condition holds
//! \code ensure(index < count, [&]() { return "index out of range: " + std::to_string(index); }); \endcode
inline void ensure(bool condition, const std::function<std::string()>& message_builder) {
    if (!condition) [[unlikely]] {
        throw std::logic_error(message_builder());
    }
}

//! \brief Broken internal invariant: std::logic_error prefixed by "Invariant violation: "
inline void ensure_invariant(bool condition, const std::function<std::string()>& message_builder) {
    ensure(condition, [&]() { return "Invariant violation: " + message_builder(); });
}

//! \brief Caller supplied invalid input: std::invalid_argument prefixed by "Pre-condition violation: "
inline void ensure_pre_condition(bool condition, const std::function<std::string()>& message_builder) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument("Pre-condition violation: " + message_builder());
    }
}

}  // namespace snapsync
