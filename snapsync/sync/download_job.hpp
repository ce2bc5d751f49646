// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <snapsync/snapshots/peer_id.hpp>
#include <snapsync/snapshots/snapshot.hpp>
#include <snapsync/snapshots/state_provider.hpp>
#include <snapsync/snapshots/verifier.hpp>
#include <snapsync/sync/chunk_transfer.hpp>
#include <snapsync/sync/peer_reputation.hpp>
#include <snapsync/sync/settings.hpp>
#include <snapsync/sync/statistics.hpp>

namespace snapsync::sync {

enum class JobState {
    kDiscover,     // collecting announcements
    kPlanning,     // chunks pending, nothing assigned
    kFetching,     // chunk requests in flight
    kFinalVerify,  // all chunks completed, waiting for the whole snapshot verification
    kDone,
    kFailed,
};

//! Why a provider did not supply a valid chunk
enum class SourceFailure {
    kCorrupt,
    kTimeout,
    kNotDelivered,
};

//! Outcome of processing a single received chunk
enum class ChunkEvent {
    kAccepted,
    kCorrupt,
    kDuplicate,
    kUnexpected,
};

std::string_view to_string(JobState state);
std::string_view to_string(SourceFailure failure);
std::string_view to_string(ChunkEvent event);

//! Chunks to request from one provider
struct ChunkAssignment {
    PeerId provider;
    std::vector<uint32_t> chunk_indices;
    std::chrono::steady_clock::time_point deadline;
};

//! Snapshot of the job state for monitoring
struct JobProgress {
    JobState state{JobState::kDiscover};
    uint32_t chunk_count{0};
    size_t pending{0};
    size_t in_flight{0};
    size_t completed{0};
    size_t providers{0};
};

std::ostream& operator<<(std::ostream& out, const JobProgress& progress);

/** DownloadJob represents the download of the snapshot of a target state from remote providers.
 *  It has these responsibilities:
 *    - decide which chunks to request to which provider
 *    - verify each received chunk against the agreed chunk tree root
 *    - keep track of the providers that failed to serve each chunk
 *  It is a synchronous state machine owned and mutated by a single coordinator.
 */
class DownloadJob {
  public:
    using Clock = std::chrono::steady_clock;

    struct InFlightChunk {
        PeerId provider;
        Clock::time_point deadline;
    };

    DownloadJob(snapshots::TrustedHeader target, DownloadSettings settings, PeerReputation& reputation);

    // Not copyable nor movable
    DownloadJob(const DownloadJob&) = delete;
    DownloadJob& operator=(const DownloadJob&) = delete;

    //! Ends discovery: all chunks of the agreed snapshot become pending
    void start(const snapshots::CrossCheckedSnapshot& agreed);

    //! Adds a provider of the agreed snapshot found after start
    void add_provider(const PeerId& provider);

    //! Reuses a chunk retained during a previous attempt, after verifying it again
    ChunkEvent restore_chunk(const ChunkResponse& response);

    //! Assigns pending chunks to the best ranked providers within the concurrency limits
    std::vector<ChunkAssignment> plan_requests(Clock::time_point now = Clock::now());

    //! Verifies a chunk received from a provider and completes it on success
    ChunkEvent accept_chunk(const PeerId& provider, const ChunkResponse& response);

    //! Closes a request answered by the provider: requested chunks missing from the answer are requeued
    void request_completed(const PeerId& provider, const std::vector<uint32_t>& chunk_indices,
                           std::chrono::milliseconds latency);

    //! Closes a request whose deadline expired: its chunks are requeued and the provider is penalized
    void request_timed_out(const PeerId& provider, const std::vector<uint32_t>& chunk_indices);

    //! Requeues all chunks in flight without blaming their providers (e.g. on disconnection)
    void cancel_in_flight();

    bool all_chunks_completed() const;

    //! Completed chunks in index order
    std::vector<snapshots::SnapshotChunk> completed_chunks() const;

    //! Applies the whole snapshot verification outcome
    void finish_verification(const snapshots::VerificationResult& result);

    void fail(std::string reason);

    const snapshots::TrustedHeader& target() const { return target_; }
    JobState state() const { return state_; }
    const std::string& failure_reason() const { return failure_reason_; }
    const snapshots::SnapshotDescriptor& descriptor() const { return descriptor_; }
    const std::set<PeerId>& providers() const { return providers_; }
    const std::set<uint32_t>& pending() const { return pending_; }
    const std::map<uint32_t, InFlightChunk>& in_flight() const { return in_flight_; }
    size_t completed_count() const { return completed_.size(); }
    const std::map<uint32_t, std::map<PeerId, SourceFailure>>& failed_sources() const { return failed_sources_; }
    const std::set<PeerId>& corrupt_providers() const { return corrupt_providers_; }
    const DownloadStatistics& statistics() const { return statistics_; }
    JobProgress progress() const;

  private:
    bool is_excluded(uint32_t index, const PeerId& provider) const;
    std::optional<PeerId> select_provider(uint32_t index, const std::map<PeerId, size_t>& batch_sizes,
                                          Clock::time_point now);
    void requeue(uint32_t index);
    void record_failure(uint32_t index, const PeerId& provider, SourceFailure failure);
    void update_state();

    snapshots::TrustedHeader target_;
    DownloadSettings settings_;
    PeerReputation& reputation_;

    JobState state_{JobState::kDiscover};
    std::string failure_reason_;
    snapshots::SnapshotDescriptor descriptor_;
    std::set<PeerId> providers_;

    std::set<uint32_t> pending_;
    std::map<uint32_t, InFlightChunk> in_flight_;
    std::map<PeerId, size_t> in_flight_by_provider_;
    std::map<uint32_t, ChunkResponse> completed_;
    std::map<uint32_t, PeerId> delivered_by_;  // provider of each downloaded (not restored) chunk
    std::map<uint32_t, std::map<PeerId, SourceFailure>> failed_sources_;
    std::set<PeerId> corrupt_providers_;

    DownloadStatistics statistics_;
};

}  // namespace snapsync::sync
