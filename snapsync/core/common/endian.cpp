// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "endian.hpp"

#include <snapsync/core/common/util.hpp>

namespace snapsync::endian {

ByteView to_big_compact(uint64_t value) {
    thread_local uint8_t buffer[sizeof(uint64_t)];
    store_big_u64(buffer, value);
    return zeroless_view(buffer);
}

ByteView to_big_compact(const intx::uint256& value) {
    thread_local uint8_t buffer[sizeof(intx::uint256)];
    intx::be::store(buffer, value);
    return zeroless_view(buffer);
}

}  // namespace snapsync::endian
