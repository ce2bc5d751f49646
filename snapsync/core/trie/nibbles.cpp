// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "nibbles.hpp"

namespace snapsync::trie {

Bytes unpack_nibbles(ByteView data) {
    Bytes out;
    out.reserve(2 * data.size());
    for (const uint8_t b : data) {
        out.push_back(b >> 4);
        out.push_back(b & 0x0F);
    }
    return out;
}

}  // namespace snapsync::trie
