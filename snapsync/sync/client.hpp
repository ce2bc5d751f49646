// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <snapsync/core/common/base.hpp>
#include <snapsync/infra/concurrency/channel.hpp>
#include <snapsync/infra/concurrency/task.hpp>
#include <snapsync/infra/concurrency/task_group.hpp>
#include <snapsync/snapshots/snapshot.hpp>
#include <snapsync/snapshots/state_provider.hpp>
#include <snapsync/snapshots/verifier.hpp>
#include <snapsync/sync/chunk_source.hpp>
#include <snapsync/sync/chunk_store.hpp>
#include <snapsync/sync/distributor_context.hpp>
#include <snapsync/sync/download_job.hpp>
#include <snapsync/sync/peer_network.hpp>
#include <snapsync/sync/settings.hpp>
#include <snapsync/sync/statistics.hpp>

namespace snapsync::sync {

enum class AbortReason {
    kTimeout,
    kVerificationFailed,
    kNoProviders,
};

std::string_view to_string(AbortReason reason);

struct SyncCompleted {
    BlockNum block_number{0};
};

//! The caller is expected to fall back to historical replay
struct SyncAborted {
    AbortReason reason{AbortReason::kTimeout};
    std::string detail;
};

using SyncResult = std::variant<SyncCompleted, SyncAborted>;

std::ostream& operator<<(std::ostream& out, const SyncResult& result);

//! \brief SnapshotClient is the requesting role of the snapshot distributor
//! \details It drives a DownloadJob per sync attempt: discovery, parallel chunk fetching with per-request deadlines,
//! final verification and the single hand-off of the verified records to the state materializer.
class SnapshotClient {
  public:
    SnapshotClient(SnapshotPeerNetwork& network,
                   snapshots::HeaderChain& header_chain,
                   snapshots::StateMaterializer& materializer,
                   ChunkStore& chunk_store,
                   DistributorContext& context,
                   SnapshotSyncSettings settings);

    // Not copyable nor movable
    SnapshotClient(const SnapshotClient&) = delete;
    SnapshotClient& operator=(const SnapshotClient&) = delete;

    //! Synchronizes the state at the given block from snapshot providers
    Task<SyncResult> sync(BlockNum block_number);

    //! Statistics of the last sync attempt
    const std::optional<DownloadStatistics>& last_statistics() const { return last_statistics_; }

  private:
    struct Agreement {
        snapshots::CrossCheckedSnapshot snapshot;
        std::vector<snapshots::SnapshotAnnouncement> announcements;
    };

    struct FetchOutcome {
        PeerId provider;
        std::vector<uint32_t> chunk_indices;
        std::vector<ChunkResponse> responses;
        bool timed_out{false};
        std::chrono::milliseconds latency{0};
    };

    using OutcomeChannel = concurrency::Channel<FetchOutcome>;

    Task<SyncResult> run_job(DownloadJob& job);

    Task<std::optional<Agreement>> discover(const snapshots::TrustedHeader& target);
    Task<Agreement> poll_announcements(const snapshots::TrustedHeader& target);
    Task<void> refresh_providers(DownloadJob& job);

    //! Announcements currently known to the network, empty if the network fails to answer
    Task<std::vector<snapshots::SnapshotAnnouncement>> fetch_announcements(BlockNum block_number);

    //! Forgets the chunks retained for the target, logging store failures
    void discard_retained_chunks(const snapshots::TrustedHeader& target);
    void add_sources(DownloadJob& job, const std::vector<snapshots::SnapshotAnnouncement>& announcements);

    Task<void> resume(DownloadJob& job);
    Task<void> fetch_chunks(DownloadJob& job);
    Task<void> schedule_requests(DownloadJob& job, concurrency::TaskGroup& workers, OutcomeChannel& outcomes);
    Task<void> fetch_worker(ChunkSource source, ChunkRequest request, OutcomeChannel& outcomes);
    Task<std::vector<ChunkResponse>> fetch(const ChunkSource& source, ChunkRequest request);
    void apply_outcome(DownloadJob& job, FetchOutcome outcome);

    SyncResult finalize(DownloadJob& job, const std::vector<snapshots::SnapshotAnnouncement>& announcements);

    SnapshotPeerNetwork& network_;
    snapshots::HeaderChain& header_chain_;
    snapshots::StateMaterializer& materializer_;
    ChunkStore& chunk_store_;
    DistributorContext& context_;
    SnapshotSyncSettings settings_;
    snapshots::SnapshotVerifier verifier_;

    std::map<PeerId, ChunkSource> sources_;  // remote sources of the current job
    std::optional<DownloadStatistics> last_statistics_;
};

}  // namespace snapsync::sync
