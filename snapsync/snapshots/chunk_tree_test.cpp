// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chunk_tree.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <snapsync/core/common/empty_hashes.hpp>
#include <snapsync/core/types/evmc_bytes32.hpp>

namespace snapsync::snapshots {

static std::vector<evmc::bytes32> make_leaves(size_t count) {
    std::vector<evmc::bytes32> leaves;
    for (size_t i{0}; i < count; ++i) {
        leaves.push_back(chunk_content_hash(Bytes(i + 1, static_cast<uint8_t>(i))));
    }
    return leaves;
}

TEST_CASE("build_tree", "[snapsync][snapshots][chunk_tree]") {
    SECTION("no leaves") {
        const ChunkTree tree{build_tree(std::vector<evmc::bytes32>{})};
        CHECK(tree.leaf_count == 0);
        CHECK(tree.root() == kEmptyHash);
    }

    SECTION("single leaf is the root") {
        const auto leaves{make_leaves(1)};
        const ChunkTree tree{build_tree(leaves)};
        CHECK(tree.levels.size() == 1);
        CHECK(tree.root() == leaves[0]);
    }

    SECTION("odd number of leaves is padded") {
        const auto leaves{make_leaves(3)};
        const ChunkTree tree{build_tree(leaves)};
        REQUIRE(tree.levels.size() == 3);
        CHECK(tree.levels[0].size() == 4);
        CHECK(tree.levels[0][3] == kEmptyHash);
        CHECK(tree.root() == hash_pair(hash_pair(leaves[0], leaves[1]), hash_pair(leaves[2], kEmptyHash)));
    }

    SECTION("leaf order matters") {
        auto leaves{make_leaves(4)};
        const auto root{build_tree(leaves).root()};
        std::swap(leaves[1], leaves[2]);
        CHECK(build_tree(leaves).root() != root);
    }
}

TEST_CASE("tree_depth", "[snapsync][snapshots][chunk_tree]") {
    CHECK(tree_depth(0) == 0);
    CHECK(tree_depth(1) == 0);
    CHECK(tree_depth(2) == 1);
    CHECK(tree_depth(5) == 3);
    CHECK(tree_depth(8) == 3);
    CHECK(tree_depth(9) == 4);
}

TEST_CASE("prove_chunk and verify_chunk", "[snapsync][snapshots][chunk_tree]") {
    for (size_t count : {1u, 2u, 5u, 8u, 13u}) {
        const auto leaves{make_leaves(count)};
        const ChunkTree tree{build_tree(leaves)};
        for (uint32_t i{0}; i < count; ++i) {
            const MerkleProof proof{prove_chunk(tree, i)};
            CHECK(proof.leaf_hash == leaves[i]);
            CHECK(verify_chunk(proof, tree.root(), count));
        }
    }

    const auto leaves{make_leaves(5)};
    const ChunkTree tree{build_tree(leaves)};

    SECTION("index out of range") {
        CHECK_THROWS_AS(prove_chunk(tree, 5), std::invalid_argument);
    }

    SECTION("tampered leaf hash") {
        MerkleProof proof{prove_chunk(tree, 2)};
        proof.leaf_hash = leaves[3];
        CHECK(!verify_chunk(proof, tree.root(), 5));
    }

    SECTION("tampered sibling") {
        MerkleProof proof{prove_chunk(tree, 2)};
        proof.sibling_path[1] = kEmptyHash;
        CHECK(!verify_chunk(proof, tree.root(), 5));
    }

    SECTION("proof for another position") {
        MerkleProof proof{prove_chunk(tree, 2)};
        proof.leaf_index = 3;
        CHECK(!verify_chunk(proof, tree.root(), 5));
    }

    SECTION("index beyond the tree width") {
        MerkleProof proof{prove_chunk(tree, 2)};
        proof.leaf_index += 8;
        CHECK(!verify_chunk(proof, tree.root(), 5));
    }

    SECTION("index of a padding leaf") {
        const ChunkTree padded{build_tree(make_leaves(3))};
        MerkleProof proof{prove_chunk(padded, 2)};
        proof.leaf_index = 3;
        proof.leaf_hash = kEmptyHash;
        proof.sibling_path[0] = padded.levels[0][2];
        CHECK(!verify_chunk(proof, padded.root(), 3));
    }

    SECTION("internal node presented as a leaf") {
        MerkleProof proof{prove_chunk(tree, 0)};
        proof.leaf_hash = tree.levels[1][0];
        proof.sibling_path.erase(proof.sibling_path.begin());
        CHECK(!verify_chunk(proof, tree.root(), 5));
    }

    SECTION("path longer than the tree") {
        MerkleProof proof{prove_chunk(tree, 1)};
        proof.sibling_path.push_back(kEmptyHash);
        CHECK(!verify_chunk(proof, tree.root(), 5));
    }

    SECTION("another root") {
        const MerkleProof proof{prove_chunk(tree, 0)};
        CHECK(!verify_chunk(proof, build_tree(make_leaves(6)).root(), 6));
    }
}

}  // namespace snapsync::snapshots
