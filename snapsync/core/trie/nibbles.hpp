// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <snapsync/core/common/bytes.hpp>

namespace snapsync::trie {

//! \brief Splits every byte into its high and low nibble, one nibble per output byte
Bytes unpack_nibbles(ByteView data);

}  // namespace snapsync::trie
