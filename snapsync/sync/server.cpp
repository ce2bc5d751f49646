// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "server.hpp"

#include <magic_enum.hpp>

#include <snapsync/core/common/util.hpp>
#include <snapsync/core/types/evmc_bytes32.hpp>
#include <snapsync/infra/common/ensure.hpp>
#include <snapsync/infra/common/log.hpp>
#include <snapsync/infra/concurrency/parallel_group_utils.hpp>

namespace snapsync::sync {

using snapshots::SnapshotAnnouncement;

std::string_view to_string(ServerState state) {
    return magic_enum::enum_name(state);
}

SnapshotServer::SnapshotServer(PeerId node_id, SnapshotPeerNetwork& network, DistributorContext& context,
                               ServerSettings settings)
    : node_id_{std::move(node_id)}, network_{network}, context_{context}, settings_{settings} {}

SnapshotServer::TargetKey SnapshotServer::key_of(BlockNum block_number, const evmc::bytes32& state_root) {
    return {block_number, Bytes{state_root.bytes, kHashLength}};
}

void SnapshotServer::add_snapshot(std::shared_ptr<const snapshots::Snapshot> snapshot) {
    ensure_pre_condition(snapshot != nullptr, []() { return "SnapshotServer::add_snapshot null snapshot"; });

    ServedSnapshot served{.snapshot = snapshot, .tree = snapshots::build_tree(snapshot->chunks)};
    ensure_invariant(served.tree.root() == snapshot->chunk_tree_root, [&]() {
        return "SnapshotServer::add_snapshot inconsistent chunk tree root for block " +
               std::to_string(snapshot->block_number);
    });

    std::scoped_lock lock{mutex_};
    snapshots_.insert_or_assign(key_of(snapshot->block_number, snapshot->state_root), std::move(served));
    SNAP_INFO_M("SnapshotServer: holding snapshot",
                {"block", std::to_string(snapshot->block_number),
                 "chunks", std::to_string(snapshot->chunks.size()),
                 "size", human_size(snapshot->metadata.total_size)});
}

std::vector<SnapshotAnnouncement> SnapshotServer::announcements() const {
    std::scoped_lock lock{mutex_};
    std::vector<SnapshotAnnouncement> result;
    result.reserve(snapshots_.size());
    for (const auto& [_, served] : snapshots_) {
        result.push_back(snapshots::make_announcement(*served.snapshot, node_id_));
    }
    return result;
}

Task<void> SnapshotServer::announce() {
    const auto to_announce{announcements()};
    if (to_announce.empty()) {
        SNAP_DEBUG << "SnapshotServer: no snapshot to announce";
        co_return;
    }

    state_ = ServerState::kAnnouncing;
    co_await concurrency::generate_parallel_group_task(to_announce.size(), [&](size_t index) {
        return network_.announce(to_announce[index]);
    });
    SNAP_DEBUG << "SnapshotServer: announced " << to_announce.size() << " snapshots";
    state_ = ServerState::kServing;
}

std::vector<ChunkResponse> SnapshotServer::serve(const ChunkRequest& request) {
    std::vector<ChunkResponse> responses;

    std::scoped_lock lock{mutex_};
    const auto it{snapshots_.find(key_of(request.block_number, request.state_root))};
    if (it == snapshots_.end()) {
        SNAP_DEBUG << "SnapshotServer: request for unknown snapshot at block " << request.block_number;
        return responses;
    }
    const auto& [snapshot, tree] = it->second;

    for (const uint32_t index : request.chunk_indices) {
        if (responses.size() >= settings_.max_chunks_per_response) break;
        if (index >= snapshot->chunks.size()) continue;

        const auto& chunk{snapshot->chunks[index]};
        if (!context_.bandwidth().try_consume(chunk.payload.size())) {
            SNAP_DEBUG << "SnapshotServer: bandwidth budget exhausted, serving " << responses.size() << " of "
                       << request.chunk_indices.size() << " chunks";
            break;
        }
        responses.push_back({.chunk = chunk, .proof = snapshots::prove_chunk(tree, index)});
    }
    return responses;
}

}  // namespace snapsync::sync
