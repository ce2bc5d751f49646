// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <string>

#include <snapsync/core/common/bytes.hpp>
#include <snapsync/core/common/util.hpp>

namespace snapsync {

// Peers
using PeerId = Bytes;

// Bytes already has operator<<, but a PeerId is too long for log lines
inline std::string human_readable_id(const PeerId& peer_id) {
    return to_hex(ByteView{peer_id.data(), std::min<size_t>(peer_id.size(), 20)});
}

}  // namespace snapsync
