// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <vector>

#include <evmc/evmc.hpp>

#include <snapsync/core/common/base.hpp>
#include <snapsync/snapshots/chunk.hpp>
#include <snapsync/snapshots/peer_id.hpp>

namespace snapsync::snapshots {

//! The identity of a snapshot shared by all providers serving it
struct SnapshotDescriptor {
    BlockNum block_number{0};
    evmc::bytes32 state_root;
    evmc::bytes32 chunk_tree_root;
    uint32_t chunk_count{0};

    friend bool operator==(const SnapshotDescriptor&, const SnapshotDescriptor&) = default;
};

std::ostream& operator<<(std::ostream& out, const SnapshotDescriptor& descriptor);

struct SnapshotMetadata {
    std::chrono::system_clock::time_point created_at;
    uint64_t total_size{0};  // sum of chunk payload sizes
    uint32_t chunk_count{0};
};

//! \brief Immutable description and content of the world state at a finalized block
struct Snapshot {
    BlockNum block_number{0};
    evmc::bytes32 state_root;
    evmc::bytes32 chunk_tree_root;
    std::vector<SnapshotChunk> chunks;
    SnapshotMetadata metadata;

    SnapshotDescriptor descriptor() const {
        return {block_number, state_root, chunk_tree_root, metadata.chunk_count};
    }
};

//! Advertisement of a snapshot available from a provider
struct SnapshotAnnouncement {
    BlockNum block_number{0};
    evmc::bytes32 state_root;
    evmc::bytes32 chunk_tree_root;
    uint32_t chunk_count{0};
    uint64_t total_size{0};
    PeerId provider;

    SnapshotDescriptor descriptor() const {
        return {block_number, state_root, chunk_tree_root, chunk_count};
    }

    friend bool operator==(const SnapshotAnnouncement&, const SnapshotAnnouncement&) = default;
};

SnapshotAnnouncement make_announcement(const Snapshot& snapshot, PeerId provider);

}  // namespace snapsync::snapshots
