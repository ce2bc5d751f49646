// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chunk_tree.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <string>

#include <snapsync/core/common/empty_hashes.hpp>
#include <snapsync/core/common/util.hpp>
#include <snapsync/infra/common/ensure.hpp>

namespace snapsync::snapshots {

evmc::bytes32 hash_pair(const evmc::bytes32& left, const evmc::bytes32& right) {
    uint8_t buffer[2 * kHashLength];
    std::memcpy(buffer, left.bytes, kHashLength);
    std::memcpy(buffer + kHashLength, right.bytes, kHashLength);
    const ethash::hash256 hash{keccak256(ByteView{buffer})};
    evmc::bytes32 node;
    std::memcpy(node.bytes, hash.bytes, kHashLength);
    return node;
}

ChunkTree build_tree(const std::vector<evmc::bytes32>& leaf_hashes) {
    ChunkTree tree{.leaf_count = leaf_hashes.size()};

    const size_t width{leaf_hashes.empty() ? 1 : std::bit_ceil(leaf_hashes.size())};
    std::vector<evmc::bytes32> level{leaf_hashes};
    level.resize(width, kEmptyHash);
    tree.levels.push_back(std::move(level));

    while (tree.levels.back().size() > 1) {
        const auto& below{tree.levels.back()};
        std::vector<evmc::bytes32> above;
        above.reserve(below.size() / 2);
        for (size_t i{0}; i < below.size(); i += 2) {
            above.push_back(hash_pair(below[i], below[i + 1]));
        }
        tree.levels.push_back(std::move(above));
    }

    return tree;
}

ChunkTree build_tree(const std::vector<SnapshotChunk>& chunks) {
    std::vector<evmc::bytes32> leaf_hashes;
    leaf_hashes.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        leaf_hashes.push_back(chunk.content_hash);
    }
    return build_tree(leaf_hashes);
}

MerkleProof prove_chunk(const ChunkTree& tree, uint32_t index) {
    ensure_pre_condition(index < tree.leaf_count, [&]() {
        return "chunk index " + std::to_string(index) + " out of range [0, " + std::to_string(tree.leaf_count) + ")";
    });

    MerkleProof proof{.leaf_index = index, .leaf_hash = tree.levels.front()[index]};
    size_t position{index};
    for (size_t depth{0}; depth + 1 < tree.levels.size(); ++depth) {
        proof.sibling_path.push_back(tree.levels[depth][position ^ 1]);
        position >>= 1;
    }
    return proof;
}

size_t tree_depth(size_t leaf_count) {
    return static_cast<size_t>(std::bit_width(std::bit_ceil(std::max<size_t>(leaf_count, 1)))) - 1;
}

bool verify_chunk(const MerkleProof& proof, const evmc::bytes32& expected_root, size_t leaf_count) {
    if (proof.leaf_index >= leaf_count || proof.sibling_path.size() != tree_depth(leaf_count)) {
        return false;
    }
    evmc::bytes32 node{proof.leaf_hash};
    uint64_t position{proof.leaf_index};
    for (const auto& sibling : proof.sibling_path) {
        node = (position & 1) ? hash_pair(sibling, node) : hash_pair(node, sibling);
        position >>= 1;
    }
    return node == expected_root;
}

}  // namespace snapsync::snapshots
