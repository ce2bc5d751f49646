// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <evmc/evmc.hpp>

#include <snapsync/core/common/base.hpp>
#include <snapsync/snapshots/chunk.hpp>
#include <snapsync/snapshots/chunk_tree.hpp>

namespace snapsync::sync {

//! Request for some chunks of the snapshot of a target state
struct ChunkRequest {
    BlockNum block_number{0};
    evmc::bytes32 state_root;
    std::vector<uint32_t> chunk_indices;

    friend bool operator==(const ChunkRequest&, const ChunkRequest&) = default;
};

//! A chunk together with the proof binding it to the chunk tree root
struct ChunkResponse {
    snapshots::SnapshotChunk chunk;
    snapshots::MerkleProof proof;

    friend bool operator==(const ChunkResponse&, const ChunkResponse&) = default;
};

}  // namespace snapsync::sync
