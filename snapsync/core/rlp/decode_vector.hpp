// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <snapsync/core/rlp/decode.hpp>

namespace snapsync::rlp {

//! \brief Decodes an RLP list holding exactly the given fields, in order
//! \details Every field is decoded with its own decode() overload. Fewer or more list elements than
//! fields fail with kUnexpectedListElements (or with the field decoder error when the list runs short).
template <typename... Fields>
DecodingResult decode(ByteView& from, Leftover mode, Fields&... fields) noexcept {
    static_assert(sizeof...(Fields) > 1);
    const auto header{decode_header(from)};
    if (!header) {
        return tl::unexpected{header.error()};
    }
    if (!header->list) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }

    ByteView payload{from.substr(0, header->payload_length)};
    from.remove_prefix(header->payload_length);
    if (DecodingResult res{check_leftover(from, mode)}; !res) {
        return res;
    }

    DecodingResult result;
    // left-to-right, stops at the first failing field
    static_cast<void>(((result = decode(payload, fields, Leftover::kAllow)) && ...));
    if (!result) {
        return result;
    }
    if (!payload.empty()) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }
    return {};
}

}  // namespace snapsync::rlp
