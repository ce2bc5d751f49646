// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <snapsync/core/common/base.hpp>
#include <snapsync/infra/concurrency/task.hpp>
#include <snapsync/snapshots/peer_id.hpp>
#include <snapsync/snapshots/snapshot.hpp>
#include <snapsync/sync/chunk_transfer.hpp>

namespace snapsync::sync {

//! \brief The peer-to-peer transport of snapshot announcements and chunks
class SnapshotPeerNetwork {
  public:
    virtual ~SnapshotPeerNetwork() = default;

    //! Advertises a locally held snapshot to the network
    virtual Task<void> announce(snapshots::SnapshotAnnouncement announcement) = 0;

    //! Announcements currently known for the given block
    virtual Task<std::vector<snapshots::SnapshotAnnouncement>> discover(BlockNum block_number) = 0;

    //! \brief Asks a provider for some chunks
    //! \details The provider may return fewer chunks than requested, in any order. Silence or an error signals
    //! unavailability, not corruption.
    virtual Task<std::vector<ChunkResponse>> request_chunks(PeerId provider, ChunkRequest request) = 0;
};

}  // namespace snapsync::sync
