// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "hash_builder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <snapsync/core/common/empty_hashes.hpp>
#include <snapsync/core/common/util.hpp>
#include <snapsync/core/trie/nibbles.hpp>
#include <snapsync/core/types/evmc_bytes32.hpp>

namespace snapsync::trie {

static std::string hashed_hex(const Bytes& node_rlp) { return to_hex(keccak256(node_rlp).bytes); }

TEST_CASE("HashBuilder without leaves", "[snapsync][core][trie]") {
    HashBuilder builder;
    CHECK(builder.root_hash() == kEmptyRoot);
}

TEST_CASE("HashBuilder with a single leaf", "[snapsync][core][trie]") {
    HashBuilder builder;
    builder.add_leaf(unpack_nibbles(*from_hex("6b6579")), *from_hex("76616c"));

    // [0x20 ++ key, value]: the root is hashed even if shorter than 32 bytes
    const Bytes leaf{*from_hex("c984206b65798376616c")};
    CHECK(to_hex(builder.root_hash()) == hashed_hex(leaf));
}

TEST_CASE("HashBuilder with a branch at the root", "[snapsync][core][trie]") {
    HashBuilder builder;
    builder.add_leaf(unpack_nibbles(*from_hex("10")), *from_hex("aa"));
    builder.add_leaf(unpack_nibbles(*from_hex("20")), *from_hex("bb"));

    // leaves with odd remaining path [0] are embedded into slots 1 and 2
    const Bytes branch{*from_hex("d780c33081aac33081bb8080808080808080808080808080")};
    REQUIRE(branch.size() == 24);
    CHECK(to_hex(builder.root_hash()) == hashed_hex(branch));

    SECTION("reset") {
        builder.reset();
        CHECK(builder.root_hash() == kEmptyRoot);
        builder.add_leaf(unpack_nibbles(*from_hex("6b6579")), *from_hex("76616c"));
        CHECK(to_hex(builder.root_hash()) == hashed_hex(*from_hex("c984206b65798376616c")));
    }
}

TEST_CASE("HashBuilder with a branch under an extension", "[snapsync][core][trie]") {
    HashBuilder builder;
    builder.add_leaf(unpack_nibbles(*from_hex("ab01")), *from_hex("aa"));
    builder.add_leaf(unpack_nibbles(*from_hex("ab02")), *from_hex("bb"));

    // shared path a-b-0 (odd extension: 0x1a 0xb0), then leaves with empty remaining path
    const Bytes branch{*from_hex("d780c32081aac32081bb8080808080808080808080808080")};
    const Bytes extension{*from_hex("db821ab0") + branch};
    CHECK(to_hex(builder.root_hash()) == hashed_hex(extension));
}

TEST_CASE("HashBuilder with hashed child references", "[snapsync][core][trie]") {
    const Bytes long_value(40, 0x01);
    HashBuilder builder;
    builder.add_leaf(unpack_nibbles(*from_hex("10")), long_value);
    builder.add_leaf(unpack_nibbles(*from_hex("20")), long_value);

    // leaf [0x30, 0xa8 ++ value] is 43 bytes long, so the branch stores its hash
    const Bytes leaf{*from_hex("ea30a8") + long_value};
    const Bytes leaf_ref{*from_hex("a0") + *from_hex(hashed_hex(leaf))};
    const Bytes branch{*from_hex("f851") + *from_hex("80") + leaf_ref + leaf_ref +
                       *from_hex("80808080808080808080808080") + *from_hex("80")};
    CHECK(to_hex(builder.root_hash()) == hashed_hex(branch));
}

TEST_CASE("unpack_nibbles", "[snapsync][core][trie]") {
    CHECK(to_hex(unpack_nibbles(*from_hex("ab01"))) == "0a0b0001");
    CHECK(unpack_nibbles({}).empty());
}

}  // namespace snapsync::trie
