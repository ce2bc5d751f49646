// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <evmc/evmc.hpp>

#include <snapsync/snapshots/chunk.hpp>

namespace snapsync::snapshots {

//! Authentication path binding a chunk content hash to a chunk tree root
struct MerkleProof {
    uint32_t leaf_index{0};
    evmc::bytes32 leaf_hash;
    std::vector<evmc::bytes32> sibling_path;  // bottom-up

    friend bool operator==(const MerkleProof&, const MerkleProof&) = default;
};

//! \brief Binary Merkle tree over the ordered content hashes of the chunks of a snapshot
//! \details Leaves are padded up to the next power of two with the hash of the empty string and every internal
//! node is keccak256(left ++ right). A tree without chunks has the padding sentinel as root.
struct ChunkTree {
    //! Number of real (non-padding) leaves
    size_t leaf_count{0};

    //! All tree levels bottom-up: levels.front() holds the padded leaves, levels.back() holds the root only
    std::vector<std::vector<evmc::bytes32>> levels;

    const evmc::bytes32& root() const { return levels.back().front(); }
};

//! Hash of an internal node
evmc::bytes32 hash_pair(const evmc::bytes32& left, const evmc::bytes32& right);

ChunkTree build_tree(const std::vector<evmc::bytes32>& leaf_hashes);

ChunkTree build_tree(const std::vector<SnapshotChunk>& chunks);

//! \brief Builds the authentication path of the chunk at the given index
//! \throws std::invalid_argument if index is not lower than the number of chunks
MerkleProof prove_chunk(const ChunkTree& tree, uint32_t index);

//! Number of sibling hashes in the proof of any leaf of a tree with leaf_count chunks
size_t tree_depth(size_t leaf_count);

//! \brief Checks that the proof leads from its leaf to the expected root of a tree with leaf_count chunks
//! \details The leaf index must be lower than leaf_count and the path exactly tree_depth(leaf_count) long,
//! so that an internal node cannot be passed off as a leaf by a shorter path.
bool verify_chunk(const MerkleProof& proof, const evmc::bytes32& expected_root, size_t leaf_count);

}  // namespace snapsync::snapshots
