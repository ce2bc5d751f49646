// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "account.hpp"

#include <sstream>

#include <snapsync/core/rlp/encode.hpp>

namespace snapsync {

Bytes Account::rlp(const evmc::bytes32& storage_root) const {
    const size_t payload_length{rlp::length(nonce) + rlp::length(balance) + rlp::length(storage_root) +
                                rlp::length(code_hash)};
    Bytes out;
    out.reserve(rlp::length_of_length(payload_length) + payload_length);
    rlp::encode_header(out, {.list = true, .payload_length = payload_length});
    rlp::encode(out, nonce);
    rlp::encode(out, balance);
    rlp::encode(out, storage_root);
    rlp::encode(out, code_hash);
    return out;
}

std::string Account::to_string() const {
    std::ostringstream out;
    out << "nonce=" << nonce << " balance=0x" << intx::hex(balance) << " code_hash=" << to_hex(code_hash, true);
    return out.str();
}

}  // namespace snapsync
