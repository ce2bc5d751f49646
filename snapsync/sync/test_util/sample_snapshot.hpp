// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <snapsync/snapshots/chunk_tree.hpp>
#include <snapsync/snapshots/snapshot.hpp>
#include <snapsync/snapshots/state_provider.hpp>
#include <snapsync/snapshots/state_record.hpp>
#include <snapsync/snapshots/verifier.hpp>
#include <snapsync/sync/chunk_transfer.hpp>

namespace snapsync::sync::test_util {

//! A snapshot of a sample state together with everything needed to serve and check it
struct SampleSnapshot {
    std::shared_ptr<const snapshots::Snapshot> snapshot;
    snapshots::TrustedHeader header;
    snapshots::ChunkTree tree;
    std::vector<snapshots::StateRecord> records;  // canonical order

    uint32_t chunk_count() const { return snapshot->metadata.chunk_count; }

    //! The chunk at the given index with its proof
    ChunkResponse response(uint32_t index) const;

    //! The snapshot as agreed by the given providers
    snapshots::CrossCheckedSnapshot agreed_by(std::vector<PeerId> providers) const;
};

//! \brief Builds the snapshot of a deterministic sample state at the given block
//! \param target_chunk_size a small size producing many chunks
SampleSnapshot make_sample_snapshot(BlockNum block_number, size_t num_accounts = 16, size_t target_chunk_size = 512);

inline PeerId make_peer(uint8_t n) {
    return PeerId(64, n);
}

}  // namespace snapsync::sync::test_util
