// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

#include <evmc/evmc.hpp>

#include <snapsync/core/common/bytes.hpp>
#include <snapsync/core/common/decoding_result.hpp>
#include <snapsync/core/rlp/decode.hpp>

namespace snapsync::rlp {

void encode(Bytes& to, const evmc::address& address);
size_t length(const evmc::address& address) noexcept;
DecodingResult decode(ByteView& from, evmc::address& address, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace snapsync::rlp

namespace evmc {

//! Prints the 0x-prefixed hex address
std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
