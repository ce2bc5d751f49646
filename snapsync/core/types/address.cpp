// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <snapsync/core/common/util.hpp>
#include <snapsync/core/rlp/encode.hpp>

namespace snapsync::rlp {

void encode(Bytes& to, const evmc::address& address) {
    encode(to, ByteView{address.bytes});
}

size_t length(const evmc::address& address) noexcept {
    return length(ByteView{address.bytes});
}

DecodingResult decode(ByteView& from, evmc::address& address, Leftover mode) noexcept {
    return decode(from, address.bytes, mode);
}

}  // namespace snapsync::rlp

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    return out << snapsync::to_hex(snapsync::ByteView{address.bytes}, /*with_prefix=*/true);
}

}  // namespace evmc
