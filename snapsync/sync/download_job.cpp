// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "download_job.hpp"

#include <tuple>
#include <utility>

#include <magic_enum.hpp>

#include <snapsync/core/types/evmc_bytes32.hpp>
#include <snapsync/infra/common/ensure.hpp>
#include <snapsync/infra/common/log.hpp>

namespace snapsync::sync {

using snapshots::SnapshotVerifier;
using snapshots::VerificationOutcome;

std::string_view to_string(JobState state) {
    return magic_enum::enum_name(state);
}

std::string_view to_string(SourceFailure failure) {
    return magic_enum::enum_name(failure);
}

std::string_view to_string(ChunkEvent event) {
    return magic_enum::enum_name(event);
}

std::ostream& operator<<(std::ostream& out, const JobProgress& progress) {
    out << "state=" << to_string(progress.state)
        << " completed=" << progress.completed << "/" << progress.chunk_count
        << " pending=" << progress.pending
        << " in_flight=" << progress.in_flight
        << " providers=" << progress.providers;
    return out;
}

DownloadJob::DownloadJob(snapshots::TrustedHeader target, DownloadSettings settings, PeerReputation& reputation)
    : target_{target}, settings_{settings}, reputation_{reputation} {}

void DownloadJob::start(const snapshots::CrossCheckedSnapshot& agreed) {
    ensure_pre_condition(state_ == JobState::kDiscover, [&]() {
        return "DownloadJob::start unexpected state " + std::string{to_string(state_)};
    });
    ensure_pre_condition(agreed.descriptor.block_number == target_.block_number &&
                             agreed.descriptor.state_root == target_.state_root,
                         [&]() { return "DownloadJob::start agreed snapshot for another target"; });

    descriptor_ = agreed.descriptor;
    providers_.insert(agreed.providers.begin(), agreed.providers.end());
    for (uint32_t index{0}; index < descriptor_.chunk_count; ++index) {
        pending_.insert(index);
    }
    statistics_ = {};
    state_ = JobState::kPlanning;
    update_state();

    SNAP_INFO_M("DownloadJob: snapshot agreed",
                {"block", std::to_string(descriptor_.block_number),
                 "chunks", std::to_string(descriptor_.chunk_count),
                 "root", to_hex(descriptor_.chunk_tree_root),
                 "providers", std::to_string(providers_.size())});
}

void DownloadJob::add_provider(const PeerId& provider) {
    if (providers_.insert(provider).second) {
        SNAP_DEBUG << "DownloadJob: new provider " << human_readable_id(provider);
    }
}

ChunkEvent DownloadJob::restore_chunk(const ChunkResponse& response) {
    const uint32_t index{response.chunk.index};
    if (completed_.contains(index)) {
        return ChunkEvent::kDuplicate;
    }
    if (!pending_.contains(index)) {
        return ChunkEvent::kUnexpected;
    }
    if (!SnapshotVerifier::check_chunk(response.chunk, response.proof, descriptor_)) {
        SNAP_DEBUG << "DownloadJob: retained chunk " << index << " does not match the agreed snapshot";
        return ChunkEvent::kCorrupt;
    }
    pending_.erase(index);
    completed_.emplace(index, response);
    ++statistics_.restored_chunks;
    update_state();
    return ChunkEvent::kAccepted;
}

bool DownloadJob::is_excluded(uint32_t index, const PeerId& provider) const {
    const auto it{failed_sources_.find(index)};
    return it != failed_sources_.end() && it->second.contains(provider);
}

std::optional<PeerId> DownloadJob::select_provider(uint32_t index, const std::map<PeerId, size_t>& batch_sizes,
                                                   Clock::time_point now) {
    const auto all_excluded = [&]() {
        for (const auto& provider : providers_) {
            if (!is_excluded(index, provider)) return false;
        }
        return true;
    };
    if (!providers_.empty() && all_excluded()) {
        // retry indefinitely: forget unavailability, never corruption
        auto& failures{failed_sources_[index]};
        std::erase_if(failures, [](const auto& entry) { return entry.second != SourceFailure::kCorrupt; });
    }

    using Rank = std::tuple<bool, bool, int64_t, size_t>;
    std::optional<PeerId> best;
    Rank best_rank;
    for (const auto& provider : providers_) {
        if (is_excluded(index, provider)) continue;

        const auto in_flight_it{in_flight_by_provider_.find(provider)};
        const size_t in_flight{in_flight_it == in_flight_by_provider_.end() ? 0 : in_flight_it->second};
        if (in_flight >= settings_.max_in_flight_chunks_per_provider) continue;
        const auto batch_it{batch_sizes.find(provider)};
        if (batch_it != batch_sizes.end() && batch_it->second >= settings_.max_chunks_per_request) continue;

        const auto latency{reputation_.latency(provider)};
        const Rank rank{corrupt_providers_.contains(provider),
                        reputation_.is_deprioritized(provider, now),
                        latency ? latency->count() : 0,
                        in_flight};
        if (!best || rank < best_rank) {  // ties go to the lowest provider id
            best = provider;
            best_rank = rank;
        }
    }
    return best;
}

std::vector<ChunkAssignment> DownloadJob::plan_requests(Clock::time_point now) {
    std::vector<ChunkAssignment> assignments;
    if (state_ != JobState::kPlanning && state_ != JobState::kFetching) {
        return assignments;
    }

    std::map<PeerId, size_t> batch_index;  // provider -> position in assignments
    std::map<PeerId, size_t> batch_sizes;
    const auto deadline{now + settings_.request_timeout};

    const std::vector<uint32_t> candidates{pending_.begin(), pending_.end()};
    for (const uint32_t index : candidates) {
        if (in_flight_.size() >= settings_.max_in_flight_chunks) break;

        const auto provider{select_provider(index, batch_sizes, now)};
        if (!provider) continue;

        auto [it, inserted] = batch_index.emplace(*provider, assignments.size());
        if (inserted) {
            assignments.push_back({.provider = *provider, .deadline = deadline});
        }
        assignments[it->second].chunk_indices.push_back(index);
        ++batch_sizes[*provider];

        pending_.erase(index);
        in_flight_.emplace(index, InFlightChunk{*provider, deadline});
        ++in_flight_by_provider_[*provider];
        ++statistics_.requested_chunks;
    }

    update_state();
    return assignments;
}

ChunkEvent DownloadJob::accept_chunk(const PeerId& provider, const ChunkResponse& response) {
    const auto& chunk{response.chunk};
    ++statistics_.received_chunks;
    statistics_.received_bytes += chunk.payload.size();

    if (completed_.contains(chunk.index)) {
        ++statistics_.reject_causes.duplicated;
        return ChunkEvent::kDuplicate;
    }
    const auto in_flight_it{in_flight_.find(chunk.index)};
    if (in_flight_it == in_flight_.end() || in_flight_it->second.provider != provider) {
        SNAP_DEBUG << "DownloadJob: unexpected chunk " << chunk.index << " from " << human_readable_id(provider);
        ++statistics_.reject_causes.not_requested;
        return ChunkEvent::kUnexpected;
    }

    if (!SnapshotVerifier::check_chunk(chunk, response.proof, descriptor_)) {
        SNAP_WARN << "DownloadJob: corrupt chunk " << chunk.index << " from provider " << human_readable_id(provider);
        ++statistics_.reject_causes.corrupt;
        requeue(chunk.index);
        record_failure(chunk.index, provider, SourceFailure::kCorrupt);
        corrupt_providers_.insert(provider);
        reputation_.record_corruption(provider);
        update_state();
        return ChunkEvent::kCorrupt;
    }

    in_flight_.erase(in_flight_it);
    --in_flight_by_provider_[provider];
    completed_.emplace(chunk.index, response);
    delivered_by_.insert_or_assign(chunk.index, provider);
    ++statistics_.accepted_chunks;
    update_state();
    return ChunkEvent::kAccepted;
}

void DownloadJob::request_completed(const PeerId& provider, const std::vector<uint32_t>& chunk_indices,
                                    std::chrono::milliseconds latency) {
    size_t undelivered{0};
    size_t accepted{0};
    for (const uint32_t index : chunk_indices) {
        const auto delivered_it{delivered_by_.find(index)};
        if (delivered_it != delivered_by_.end() && delivered_it->second == provider) {
            ++accepted;
            continue;
        }
        const auto it{in_flight_.find(index)};
        if (it == in_flight_.end() || it->second.provider != provider) continue;
        requeue(index);
        record_failure(index, provider, SourceFailure::kNotDelivered);
        ++undelivered;
    }
    statistics_.undelivered_chunks += undelivered;
    if (accepted > 0) {
        reputation_.record_delivery(provider, latency, accepted);
    }
    if (undelivered > 0) {
        SNAP_DEBUG << "DownloadJob: provider " << human_readable_id(provider) << " did not deliver " << undelivered
                   << " of " << chunk_indices.size() << " chunks";
    }
    update_state();
}

void DownloadJob::request_timed_out(const PeerId& provider, const std::vector<uint32_t>& chunk_indices) {
    size_t expired{0};
    for (const uint32_t index : chunk_indices) {
        const auto it{in_flight_.find(index)};
        if (it == in_flight_.end() || it->second.provider != provider) continue;
        requeue(index);
        record_failure(index, provider, SourceFailure::kTimeout);
        ++expired;
    }
    if (expired > 0) {
        ++statistics_.timed_out_requests;
        reputation_.record_timeout(provider, settings_.request_timeout);
        SNAP_DEBUG << "DownloadJob: request to " << human_readable_id(provider) << " for " << expired
                   << " chunks timed out";
    }
    update_state();
}

void DownloadJob::cancel_in_flight() {
    while (!in_flight_.empty()) {
        requeue(in_flight_.begin()->first);
    }
    update_state();
}

bool DownloadJob::all_chunks_completed() const {
    return state_ != JobState::kDiscover && completed_.size() == descriptor_.chunk_count;
}

std::vector<snapshots::SnapshotChunk> DownloadJob::completed_chunks() const {
    std::vector<snapshots::SnapshotChunk> chunks;
    chunks.reserve(completed_.size());
    for (const auto& [_, response] : completed_) {
        chunks.push_back(response.chunk);
    }
    return chunks;
}

void DownloadJob::finish_verification(const snapshots::VerificationResult& result) {
    ensure_pre_condition(state_ == JobState::kFinalVerify, [&]() {
        return "DownloadJob::finish_verification unexpected state " + std::string{to_string(state_)};
    });

    switch (result.outcome) {
        case VerificationOutcome::kAccepted:
            state_ = JobState::kDone;
            break;
        case VerificationOutcome::kCorruptChunks:
            for (const uint32_t index : result.corrupt_chunks) {
                if (completed_.erase(index)) {
                    delivered_by_.erase(index);
                    pending_.insert(index);
                }
            }
            state_ = JobState::kPlanning;
            break;
        case VerificationOutcome::kRejected:
            fail(result.error ? std::string{snapshots::to_string(*result.error)} : "rejected");
            break;
    }
}

void DownloadJob::fail(std::string reason) {
    cancel_in_flight();
    state_ = JobState::kFailed;
    failure_reason_ = std::move(reason);
    SNAP_WARN << "DownloadJob: failed for block " << target_.block_number << ": " << failure_reason_
              << " stats: " << statistics_;
}

JobProgress DownloadJob::progress() const {
    return {
        .state = state_,
        .chunk_count = descriptor_.chunk_count,
        .pending = pending_.size(),
        .in_flight = in_flight_.size(),
        .completed = completed_.size(),
        .providers = providers_.size(),
    };
}

void DownloadJob::requeue(uint32_t index) {
    const auto it{in_flight_.find(index)};
    if (it == in_flight_.end()) return;
    --in_flight_by_provider_[it->second.provider];
    in_flight_.erase(it);
    pending_.insert(index);
}

void DownloadJob::record_failure(uint32_t index, const PeerId& provider, SourceFailure failure) {
    auto [it, inserted] = failed_sources_[index].emplace(provider, failure);
    if (!inserted && it->second != SourceFailure::kCorrupt) {
        it->second = failure;
    }
}

void DownloadJob::update_state() {
    if (state_ != JobState::kPlanning && state_ != JobState::kFetching) return;
    if (completed_.size() == descriptor_.chunk_count) {
        state_ = JobState::kFinalVerify;
    } else if (in_flight_.empty()) {
        state_ = JobState::kPlanning;
    } else {
        state_ = JobState::kFetching;
    }
}

}  // namespace snapsync::sync
