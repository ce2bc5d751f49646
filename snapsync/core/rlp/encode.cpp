// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

namespace snapsync::rlp {

// Payloads shorter than this fit their length into the prefix byte
static constexpr size_t kShortPayloadLimit{56};

static bool is_single_byte(ByteView s) noexcept { return s.size() == 1 && s[0] < kEmptyStringCode; }

void encode_header(Bytes& to, Header header) {
    const uint8_t base{header.list ? kEmptyListCode : kEmptyStringCode};
    if (header.payload_length < kShortPayloadLimit) {
        to.push_back(static_cast<uint8_t>(base + header.payload_length));
        return;
    }
    const ByteView length_be{endian::to_big_compact(header.payload_length)};
    to.push_back(static_cast<uint8_t>(base + kShortPayloadLimit - 1 + length_be.size()));
    to.append(length_be);
}

size_t length_of_length(uint64_t payload_length) noexcept {
    return payload_length < kShortPayloadLimit ? 1 : 1 + intx::count_significant_bytes(payload_length);
}

void encode(Bytes& to, ByteView s) {
    if (!is_single_byte(s)) {
        encode_header(to, {.list = false, .payload_length = s.size()});
    }
    to.append(s);
}

size_t length(ByteView s) noexcept {
    return is_single_byte(s) ? 1 : length_of_length(s.size()) + s.size();
}

}  // namespace snapsync::rlp
