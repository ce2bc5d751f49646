// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

#include <snapsync/core/common/endian.hpp>

namespace snapsync::rlp {

// Long form: the prefix byte is followed by the big-endian payload length
static tl::expected<size_t, DecodingError> decode_long_length(ByteView& from, size_t len_of_len) noexcept {
    if (from.size() < len_of_len) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    uint64_t length{0};
    if (DecodingResult res{endian::from_big_compact(from.substr(0, len_of_len), length)}; !res) {
        return tl::unexpected{res.error()};
    }
    from.remove_prefix(len_of_len);
    if (length < 56) {
        return tl::unexpected{DecodingError::kNonCanonicalSize};
    }
    return static_cast<size_t>(length);
}

tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    const uint8_t prefix{from[0]};
    Header header{.list = prefix >= kEmptyListCode, .payload_length = 1};
    if (prefix < kEmptyStringCode) {
        return header;
    }

    from.remove_prefix(1);
    if (prefix < 0xB8) {
        header.payload_length = prefix - kEmptyStringCode;
        if (header.payload_length == 1) {
            if (from.empty()) {
                return tl::unexpected{DecodingError::kInputTooShort};
            }
            if (from[0] < kEmptyStringCode) {
                return tl::unexpected{DecodingError::kNonCanonicalSize};
            }
        }
    } else if (prefix < kEmptyListCode) {
        const auto length{decode_long_length(from, prefix - 0xB7u)};
        if (!length) return tl::unexpected{length.error()};
        header.payload_length = *length;
    } else if (prefix < 0xF8) {
        header.payload_length = prefix - kEmptyListCode;
    } else {
        const auto length{decode_long_length(from, prefix - 0xF7u)};
        if (!length) return tl::unexpected{length.error()};
        header.payload_length = *length;
    }

    if (from.size() < header.payload_length) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    return header;
}

tl::expected<size_t, DecodingError> decode_string_header(ByteView& from) noexcept {
    const auto header{decode_header(from)};
    if (!header) {
        return tl::unexpected{header.error()};
    }
    if (header->list) {
        return tl::unexpected{DecodingError::kUnexpectedList};
    }
    return header->payload_length;
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode) noexcept {
    const auto payload_length{decode_string_header(from)};
    if (!payload_length) {
        return tl::unexpected{payload_length.error()};
    }
    to = from.substr(0, *payload_length);
    from.remove_prefix(*payload_length);
    return check_leftover(from, mode);
}

}  // namespace snapsync::rlp
