// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

#include <algorithm>

#include <snapsync/core/common/util.hpp>
#include <snapsync/core/rlp/encode.hpp>

namespace snapsync {

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    const size_t n{std::min(bytes.size(), kHashLength)};
    std::copy_n(bytes.begin(), n, out.bytes + kHashLength - n);
    return out;
}

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return to_hex(ByteView{value.bytes}, with_prefix);
}

}  // namespace snapsync

namespace snapsync::rlp {

void encode(Bytes& to, const evmc::bytes32& value) {
    encode(to, ByteView{value.bytes});
}

size_t length(const evmc::bytes32& value) noexcept {
    return length(ByteView{value.bytes});
}

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode) noexcept {
    return decode(from, to.bytes, mode);
}

}  // namespace snapsync::rlp
