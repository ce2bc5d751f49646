// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "snapshot.hpp"

#include <utility>

#include <snapsync/core/types/evmc_bytes32.hpp>

namespace snapsync::snapshots {

std::ostream& operator<<(std::ostream& out, const SnapshotDescriptor& descriptor) {
    out << "block: " << descriptor.block_number
        << " state_root: 0x" << to_hex(descriptor.state_root)
        << " chunk_tree_root: 0x" << to_hex(descriptor.chunk_tree_root)
        << " chunks: " << descriptor.chunk_count;
    return out;
}

SnapshotAnnouncement make_announcement(const Snapshot& snapshot, PeerId provider) {
    return {
        .block_number = snapshot.block_number,
        .state_root = snapshot.state_root,
        .chunk_tree_root = snapshot.chunk_tree_root,
        .chunk_count = snapshot.metadata.chunk_count,
        .total_size = snapshot.metadata.total_size,
        .provider = std::move(provider),
    };
}

}  // namespace snapsync::snapshots
