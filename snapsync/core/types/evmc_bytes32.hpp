// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <evmc/evmc.hpp>

#include <snapsync/core/common/bytes.hpp>
#include <snapsync/core/rlp/decode.hpp>

namespace snapsync {

//! \brief Left-pads short inputs with zeros and keeps the first 32 bytes of longer ones
evmc::bytes32 to_bytes32(ByteView bytes);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

}  // namespace snapsync

namespace snapsync::rlp {

void encode(Bytes& to, const evmc::bytes32& value);
size_t length(const evmc::bytes32& value) noexcept;
DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace snapsync::rlp

namespace evmc {
using snapsync::rlp::encode;
using snapsync::rlp::length;
}  // namespace evmc
