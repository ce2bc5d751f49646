// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <variant>

#include <evmc/evmc.hpp>

#include <snapsync/snapshots/peer_id.hpp>
#include <snapsync/snapshots/snapshot.hpp>
#include <snapsync/snapshots/state_provider.hpp>

namespace snapsync::sync {

class ChunkStore;

//! Chunks retained by this node during previous attempts
struct LocalPeer {
    ChunkStore* chunk_store{nullptr};
};

//! A remote provider that advertised a snapshot
struct RemoteAnnouncement {
    snapshots::SnapshotAnnouncement announcement;
};

//! Anything able to serve a range of chunks of a snapshot
using ChunkSource = std::variant<LocalPeer, RemoteAnnouncement>;

//! Identity of the local chunk source in logs and statistics
inline const PeerId kLocalPeerId{'l', 'o', 'c', 'a', 'l'};

PeerId source_id(const ChunkSource& source);

//! Whether the source may hold chunks of the snapshot with the given chunk tree root for the target state
bool can_serve(const ChunkSource& source, const snapshots::TrustedHeader& target, const evmc::bytes32& chunk_tree_root);

}  // namespace snapsync::sync
