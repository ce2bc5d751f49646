// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// RLP decoding functions as per
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/

#pragma once

#include <cstring>
#include <span>

#include <intx/intx.hpp>

#include <snapsync/core/common/base.hpp>
#include <snapsync/core/common/bytes.hpp>
#include <snapsync/core/common/decoding_result.hpp>
#include <snapsync/core/rlp/encode.hpp>

namespace snapsync::rlp {

//! Whether trailing bytes after the decoded item are an error (kInputTooLong) or left in the input
enum class Leftover {
    kProhibit,
    kAllow,
};

//! \brief Consumes an RLP header, a single byte below 0x80 is its own payload and is left in place
//! \remarks On success the input is guaranteed to hold at least payload_length bytes
tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept;

//! \brief Consumes the header of a string item, failing on lists
tl::expected<size_t, DecodingError> decode_string_header(ByteView& from) noexcept;

//! \brief Checks the leftover policy once an item has been consumed
inline DecodingResult check_leftover(ByteView from, Leftover mode) noexcept {
    if (mode == Leftover::kProhibit && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode = Leftover::kProhibit) noexcept;

template <UnsignedIntegral T>
DecodingResult decode(ByteView& from, T& to, Leftover mode = Leftover::kProhibit) noexcept {
    const auto payload_length{decode_string_header(from)};
    if (!payload_length) {
        return tl::unexpected{payload_length.error()};
    }
    if (DecodingResult res{endian::from_big_compact(from.substr(0, *payload_length), to)}; !res) {
        return res;
    }
    from.remove_prefix(*payload_length);
    return check_leftover(from, mode);
}

template <size_t N>
DecodingResult decode(ByteView& from, std::span<uint8_t, N> to, Leftover mode = Leftover::kProhibit) noexcept {
    static_assert(N != std::dynamic_extent);
    const auto payload_length{decode_string_header(from)};
    if (!payload_length) {
        return tl::unexpected{payload_length.error()};
    }
    if (*payload_length != N) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    std::memcpy(to.data(), from.data(), N);
    from.remove_prefix(N);
    return check_leftover(from, mode);
}

template <size_t N>
DecodingResult decode(ByteView& from, uint8_t (&to)[N], Leftover mode = Leftover::kProhibit) noexcept {
    return decode<N>(from, std::span<uint8_t, N>{to}, mode);
}

}  // namespace snapsync::rlp
