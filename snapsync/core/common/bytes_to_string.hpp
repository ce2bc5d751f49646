// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Conversions between byte buffers and the char-based std I/O interfaces

#include <string_view>

#include <snapsync/core/common/bytes.hpp>

namespace snapsync {

inline char* byte_ptr_cast(uint8_t* ptr) { return reinterpret_cast<char*>(ptr); }
inline const char* byte_ptr_cast(const uint8_t* ptr) { return reinterpret_cast<const char*>(ptr); }

inline ByteView string_view_to_byte_view(std::string_view v) {
    return {reinterpret_cast<const uint8_t*>(v.data()), v.size()};
}

}  // namespace snapsync
