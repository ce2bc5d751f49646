// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <snapsync/core/common/base.hpp>
#include <snapsync/core/common/bytes.hpp>

namespace snapsync::trie {

//! \brief Streaming root computation of a Merkle Patricia trie (Yellow Paper, appendix D)
//! \details Only the nodes on the path of the last added leaf are kept in memory, so a whole
//! account or storage trie is hashed in a single pass over its sorted leaves.
class HashBuilder {
  public:
    HashBuilder() = default;

    HashBuilder(const HashBuilder&) = delete;
    HashBuilder& operator=(const HashBuilder&) = delete;

    //! \param nibbled_key one nibble per byte, strictly greater than the previous key and not a prefix of it
    void add_leaf(Bytes nibbled_key, ByteView value);

    //! kEmptyRoot when no leaf was added
    evmc::bytes32 root_hash();

    void reset();

  private:
    void finalize();

    // Folds the nodes which cannot receive further children given the next key
    void gen_struct_step(ByteView current, ByteView succeeding);

    void branch_ref(uint16_t state_mask);

    ByteView leaf_node_rlp(ByteView path, ByteView value);

    ByteView extension_node_rlp(ByteView path, ByteView child_ref);

    Bytes key_;  // pending leaf
    Bytes value_;

    std::vector<uint16_t> groups_;  // child masks of the open branches, by depth
    std::vector<Bytes> stack_;      // child references: RLP-wrapped hashes or nodes shorter than 32 bytes

    Bytes rlp_buffer_;
};

}  // namespace snapsync::trie
