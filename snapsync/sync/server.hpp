// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

#include <snapsync/core/common/bytes.hpp>
#include <snapsync/infra/concurrency/task.hpp>
#include <snapsync/snapshots/chunk_tree.hpp>
#include <snapsync/snapshots/peer_id.hpp>
#include <snapsync/snapshots/snapshot.hpp>
#include <snapsync/sync/chunk_transfer.hpp>
#include <snapsync/sync/distributor_context.hpp>
#include <snapsync/sync/peer_network.hpp>
#include <snapsync/sync/settings.hpp>

namespace snapsync::sync {

enum class ServerState {
    kIdle,        // no snapshot held
    kAnnouncing,  // advertising held snapshots
    kServing,     // snapshots advertised, answering chunk requests
};

std::string_view to_string(ServerState state);

//! \brief SnapshotServer is the serving role of the snapshot distributor
//! \details Serving is stateless per request: any request can be answered without a prior session
class SnapshotServer {
  public:
    SnapshotServer(PeerId node_id, SnapshotPeerNetwork& network, DistributorContext& context, ServerSettings settings);

    // Not copyable nor movable
    SnapshotServer(const SnapshotServer&) = delete;
    SnapshotServer& operator=(const SnapshotServer&) = delete;

    //! Holds a new snapshot for serving, replacing any snapshot for the same target
    void add_snapshot(std::shared_ptr<const snapshots::Snapshot> snapshot);

    //! Advertises all held snapshots to the network
    Task<void> announce();

    //! \brief Answers a chunk request with the requested chunks held and their proofs
    //! \details Unknown targets and indices are skipped, the answer is truncated when the bandwidth budget is exhausted
    std::vector<ChunkResponse> serve(const ChunkRequest& request);

    std::vector<snapshots::SnapshotAnnouncement> announcements() const;

    ServerState state() const { return state_.load(); }
    const PeerId& node_id() const { return node_id_; }

  private:
    using TargetKey = std::pair<BlockNum, Bytes>;

    struct ServedSnapshot {
        std::shared_ptr<const snapshots::Snapshot> snapshot;
        snapshots::ChunkTree tree;
    };

    static TargetKey key_of(BlockNum block_number, const evmc::bytes32& state_root);

    PeerId node_id_;
    SnapshotPeerNetwork& network_;
    DistributorContext& context_;
    ServerSettings settings_;
    std::atomic<ServerState> state_{ServerState::kIdle};

    mutable std::mutex mutex_;
    std::map<TargetKey, ServedSnapshot> snapshots_;
};

}  // namespace snapsync::sync
