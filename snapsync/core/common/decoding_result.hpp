// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace snapsync {

//! Why an RLP item, a state record or a chunk payload could not be decoded
enum class [[nodiscard]] DecodingError {
    kOverflow,                 // integer wider than its target type
    kLeadingZero,              // integer or length with leading zero bytes
    kInputTooShort,            // truncated item
    kInputTooLong,             // trailing bytes where none are allowed
    kNonCanonicalSize,         // length which has a shorter encoding
    kUnexpectedLength,         // fixed-size field (hash, address) of the wrong size
    kUnexpectedString,
    kUnexpectedList,
    kUnexpectedListElements,   // list with more elements than fields
    kInvalidFieldset,          // unknown record tag or mixed record kinds
};

using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace snapsync
