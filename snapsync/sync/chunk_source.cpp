// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chunk_source.hpp"

#include <snapsync/core/common/overloaded.hpp>

namespace snapsync::sync {

PeerId source_id(const ChunkSource& source) {
    return std::visit(Overloaded{
                          [](const LocalPeer&) { return kLocalPeerId; },
                          [](const RemoteAnnouncement& remote) { return remote.announcement.provider; },
                      },
                      source);
}

bool can_serve(const ChunkSource& source, const snapshots::TrustedHeader& target, const evmc::bytes32& chunk_tree_root) {
    return std::visit(Overloaded{
                          [](const LocalPeer& local) { return local.chunk_store != nullptr; },
                          [&](const RemoteAnnouncement& remote) {
                              const auto& announcement{remote.announcement};
                              return announcement.block_number == target.block_number &&
                                     announcement.state_root == target.state_root &&
                                     announcement.chunk_tree_root == chunk_tree_root;
                          },
                      },
                      source);
}

}  // namespace snapsync::sync
