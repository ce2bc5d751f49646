// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <intx/intx.hpp>

#include <snapsync/core/common/base.hpp>
#include <snapsync/core/common/bytes.hpp>

namespace intx {

template <unsigned N>
inline std::ostream& operator<<(std::ostream& out, const uint<N>& value) {
    return out << "0x" << intx::hex(value);
}

}  // namespace intx

namespace snapsync {

//! \brief Strips leftmost zeroed bytes from byte sequence
ByteView zeroless_view(ByteView data);

//! \brief Lowercase hex rendering, optionally with 0x prefix
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Parses hex digits with optional 0x prefix, an odd digit count gets an implicit leading zero
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Renders a byte count with binary prefix (e.g. "16.00 MB")
std::string human_size(uint64_t bytes, const char* unit = "B");

//! \brief Length of the common prefix of two byte sequences
size_t prefix_length(ByteView a, ByteView b);

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

inline std::ostream& operator<<(std::ostream& out, ByteView bytes) {
    for (const auto& b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << int{b};
    }
    return out << std::dec;
}

inline std::ostream& operator<<(std::ostream& out, const Bytes& bytes) {
    return out << to_hex(bytes);
}

}  // namespace snapsync
