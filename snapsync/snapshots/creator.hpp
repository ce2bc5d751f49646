// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <tl/expected.hpp>

#include <snapsync/core/common/base.hpp>
#include <snapsync/snapshots/chunk_tree.hpp>
#include <snapsync/snapshots/settings.hpp>
#include <snapsync/snapshots/snapshot.hpp>
#include <snapsync/snapshots/snapshot_error.hpp>
#include <snapsync/snapshots/state_provider.hpp>

namespace snapsync::snapshots {

//! Sorts state records into canonical snapshot order dropping duplicates after the first occurrence
std::vector<StateRecord> canonical_order(std::vector<StateRecord> records);

//! \brief SnapshotCreator produces immutable snapshots of the finalized state served by a StateProvider
class SnapshotCreator {
  public:
    SnapshotCreator(StateProvider& state_provider, ChunkingSettings settings)
        : state_provider_{state_provider}, settings_{settings} {}

    // Not copyable nor movable
    SnapshotCreator(const SnapshotCreator&) = delete;
    SnapshotCreator& operator=(const SnapshotCreator&) = delete;

    //! \brief Builds the snapshot of the state at the given block
    //! \return the snapshot or kUnknownBlock if the state is not available, kEncodingError if a record does not fit
    //! into a chunk
    tl::expected<Snapshot, SnapshotError> create_snapshot(BlockNum block_number);

    //! \brief Builds the chunk tree of a snapshot previously produced by this creator
    static ChunkTree chunk_tree_of(const Snapshot& snapshot) { return build_tree(snapshot.chunks); }

  private:
    StateProvider& state_provider_;
    ChunkingSettings settings_;
};

}  // namespace snapsync::snapshots
