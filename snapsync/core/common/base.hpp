// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Basic types and constants shared by every snapsync layer

#include <concepts>
#include <cstddef>
#include <cstdint>

#include <intx/intx.hpp>

namespace snapsync {

using namespace std::string_view_literals;

//! Unsigned integers accepted by the RLP and big-endian compact codecs
template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint128> ||
                           std::same_as<T, intx::uint256>;

//! Height of a block in the ledger
using BlockNum = uint64_t;

inline constexpr size_t kAddressLength{20};
inline constexpr size_t kHashLength{32};

// Binary prefixes used for chunk sizes and bandwidth rates
inline constexpr uint64_t kKibi{1024};
inline constexpr uint64_t kMebi{1024 * kKibi};
inline constexpr uint64_t kGibi{1024 * kMebi};
inline constexpr uint64_t kTebi{1024 * kGibi};

}  // namespace snapsync
