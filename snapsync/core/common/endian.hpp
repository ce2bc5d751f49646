// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Big-endian helpers for RLP integers and fixed-width record fields

#include <cstdint>
#include <cstring>

#include <intx/intx.hpp>

#include <snapsync/core/common/base.hpp>
#include <snapsync/core/common/bytes.hpp>
#include <snapsync/core/common/decoding_result.hpp>

namespace snapsync::endian {

const auto store_big_u64 = intx::be::unsafe::store<uint64_t>;

//! \brief Minimal big-endian representation of value (empty for zero)
//! \remarks The returned view points to thread-local storage valid until the next call on the same thread
ByteView to_big_compact(uint64_t value);
ByteView to_big_compact(const intx::uint256& value);

//! \brief Decodes an unsigned integer from its minimal big-endian representation
template <UnsignedIntegral T>
DecodingResult from_big_compact(ByteView data, T& out) {
    if (data.size() > sizeof(T)) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    out = 0;
    if (data.empty()) {
        return {};
    }
    if (data[0] == 0) {
        return tl::unexpected{DecodingError::kLeadingZero};
    }
    uint8_t padded[sizeof(T)]{};
    std::memcpy(padded + sizeof(T) - data.size(), data.data(), data.size());
    out = intx::be::unsafe::load<T>(padded);
    return {};
}

}  // namespace snapsync::endian
