// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <set>
#include <utility>

#include <magic_enum.hpp>

#include <boost/asio/this_coro.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <snapsync/core/common/overloaded.hpp>
#include <snapsync/core/types/evmc_bytes32.hpp>
#include <snapsync/infra/common/log.hpp>
#include <snapsync/infra/concurrency/awaitable_wait_for_one.hpp>
#include <snapsync/infra/concurrency/sleep.hpp>
#include <snapsync/infra/concurrency/timeout.hpp>

namespace snapsync::sync {

using namespace std::chrono;
using snapshots::SnapshotAnnouncement;
using snapshots::TrustedHeader;

std::string_view to_string(AbortReason reason) {
    return magic_enum::enum_name(reason);
}

std::ostream& operator<<(std::ostream& out, const SyncResult& result) {
    std::visit(Overloaded{
                   [&](const SyncCompleted& completed) { out << "Completed(" << completed.block_number << ")"; },
                   [&](const SyncAborted& aborted) {
                       out << "Aborted(" << to_string(aborted.reason) << ": " << aborted.detail << ")";
                   },
               },
               result);
    return out;
}

SnapshotClient::SnapshotClient(SnapshotPeerNetwork& network,
                               snapshots::HeaderChain& header_chain,
                               snapshots::StateMaterializer& materializer,
                               ChunkStore& chunk_store,
                               DistributorContext& context,
                               SnapshotSyncSettings settings)
    : network_{network},
      header_chain_{header_chain},
      materializer_{materializer},
      chunk_store_{chunk_store},
      context_{context},
      settings_{settings},
      verifier_{settings.verifier} {}

Task<SyncResult> SnapshotClient::sync(BlockNum block_number) {
    using namespace concurrency::awaitable_wait_for_one;

    const auto header{header_chain_.header_at(block_number)};
    if (!header) {
        SNAP_WARN << "SnapshotClient: no trusted header for block " << block_number;
        co_return SyncAborted{AbortReason::kVerificationFailed, "no trusted header for block"};
    }

    SNAP_INFO_M("SnapshotClient: sync started",
                {"block", std::to_string(block_number), "state_root", to_hex(header->state_root)});

    DownloadJob job{*header, settings_.download, context_.reputation()};
    SyncResult result;
    try {
        auto outcome = co_await (run_job(job) || concurrency::timeout(settings_.download.job_timeout));
        result = std::move(std::get<0>(outcome));
    } catch (const concurrency::TimeoutExpiredError&) {
        job.fail("job timeout");
        result = SyncAborted{AbortReason::kTimeout,
                             "not completed within " + std::to_string(settings_.download.job_timeout.count()) + "ms"};
    }
    sources_.clear();
    last_statistics_ = job.statistics();

    SNAP_INFO << "SnapshotClient: sync finished " << result << " progress: " << job.progress()
              << " stats: " << job.statistics();
    co_return result;
}

Task<SyncResult> SnapshotClient::run_job(DownloadJob& job) {
    auto agreement{co_await discover(job.target())};
    if (!agreement) {
        job.fail("no providers");
        co_return SyncAborted{AbortReason::kNoProviders,
                              "fewer than " + std::to_string(settings_.verifier.cross_check_threshold) +
                                  " providers agree on a snapshot"};
    }

    job.start(agreement->snapshot);
    add_sources(job, agreement->announcements);

    co_await resume(job);
    if (!job.all_chunks_completed()) {
        co_await fetch_chunks(job);
    }

    co_return finalize(job, agreement->announcements);
}

Task<std::optional<SnapshotClient::Agreement>> SnapshotClient::discover(const TrustedHeader& target) {
    using namespace concurrency::awaitable_wait_for_one;
    try {
        auto agreement = co_await (poll_announcements(target) || concurrency::timeout(settings_.download.discovery_timeout));
        co_return std::move(std::get<0>(agreement));
    } catch (const concurrency::TimeoutExpiredError&) {
        SNAP_WARN << "SnapshotClient: discovery timed out for block " << target.block_number;
    }
    co_return std::nullopt;
}

Task<SnapshotClient::Agreement> SnapshotClient::poll_announcements(const TrustedHeader& target) {
    std::map<PeerId, SnapshotAnnouncement> known;  // latest announcement by provider
    while (true) {
        for (auto& announcement : co_await fetch_announcements(target.block_number)) {
            if (announcement.state_root != target.state_root) {
                SNAP_DEBUG << "SnapshotClient: ignoring announcement from " << human_readable_id(announcement.provider)
                           << " with untrusted state root 0x" << to_hex(announcement.state_root);
                continue;
            }
            known.insert_or_assign(announcement.provider, std::move(announcement));
        }

        std::vector<SnapshotAnnouncement> announcements;
        for (const auto& [_, announcement] : known) {
            announcements.push_back(announcement);
        }
        if (auto agreed{verifier_.cross_check(announcements, target)}) {
            co_return Agreement{.snapshot = std::move(*agreed), .announcements = std::move(announcements)};
        }
        co_await sleep(settings_.download.discovery_poll_interval);
    }
}

void SnapshotClient::add_sources(DownloadJob& job, const std::vector<SnapshotAnnouncement>& announcements) {
    for (const auto& announcement : announcements) {
        ChunkSource source{RemoteAnnouncement{announcement}};
        if (!can_serve(source, job.target(), job.descriptor().chunk_tree_root)) continue;
        sources_.insert_or_assign(announcement.provider, std::move(source));
        job.add_provider(announcement.provider);
    }
}

Task<void> SnapshotClient::refresh_providers(DownloadJob& job) {
    add_sources(job, co_await fetch_announcements(job.target().block_number));
}

Task<std::vector<SnapshotAnnouncement>> SnapshotClient::fetch_announcements(BlockNum block_number) {
    try {
        co_return co_await network_.discover(block_number);
    } catch (const boost::system::system_error& ex) {
        if (ex.code() == boost::system::errc::operation_canceled) throw;
        SNAP_DEBUG << "SnapshotClient: provider discovery failed: " << ex.what();
    } catch (const std::exception& ex) {
        SNAP_DEBUG << "SnapshotClient: provider discovery failed: " << ex.what();
    }
    co_return std::vector<SnapshotAnnouncement>{};
}

void SnapshotClient::discard_retained_chunks(const TrustedHeader& target) {
    try {
        chunk_store_.remove_all(target);
    } catch (const std::exception& ex) {
        SNAP_ERROR << "SnapshotClient: cannot discard retained chunks of block " << target.block_number << ": "
                   << ex.what();
    }
}

Task<void> SnapshotClient::resume(DownloadJob& job) {
    if (job.pending().empty()) co_return;

    const ChunkSource local{LocalPeer{&chunk_store_}};
    ChunkRequest request{
        .block_number = job.target().block_number,
        .state_root = job.target().state_root,
        .chunk_indices = {job.pending().begin(), job.pending().end()},
    };
    std::vector<ChunkResponse> retained;
    try {
        retained = co_await fetch(local, std::move(request));
    } catch (const boost::system::system_error& ex) {
        if (ex.code() == boost::system::errc::operation_canceled) throw;
        SNAP_WARN << "SnapshotClient: cannot read retained chunks: " << ex.what();
    } catch (const std::exception& ex) {
        SNAP_WARN << "SnapshotClient: cannot read retained chunks: " << ex.what();
    }

    size_t restored{0};
    for (const auto& response : retained) {
        if (job.restore_chunk(response) == ChunkEvent::kAccepted) {
            ++restored;
        }
    }
    if (!retained.empty()) {
        SNAP_INFO << "SnapshotClient: resumed " << restored << " chunks, discarded " << retained.size() - restored;
    }
}

Task<void> SnapshotClient::fetch_chunks(DownloadJob& job) {
    using namespace concurrency::awaitable_wait_for_one;

    auto executor = co_await boost::asio::this_coro::executor;
    // a finished worker may linger in the group while its replacement is spawned
    concurrency::TaskGroup workers{executor, 2 * settings_.download.max_in_flight_chunks};
    OutcomeChannel outcomes{executor, settings_.download.max_in_flight_chunks};

    co_await (schedule_requests(job, workers, outcomes) || workers.wait());
}

Task<void> SnapshotClient::schedule_requests(DownloadJob& job, concurrency::TaskGroup& workers, OutcomeChannel& outcomes) {
    auto executor = co_await boost::asio::this_coro::executor;
    auto last_progress_log{steady_clock::now()};

    while (!job.all_chunks_completed()) {
        for (auto& assignment : job.plan_requests()) {
            ChunkRequest request{
                .block_number = job.target().block_number,
                .state_root = job.target().state_root,
                .chunk_indices = std::move(assignment.chunk_indices),
            };
            workers.spawn(executor, fetch_worker(sources_.at(assignment.provider), std::move(request), outcomes));
        }

        if (job.in_flight().empty()) {
            SNAP_DEBUG << "SnapshotClient: no provider available for " << job.pending().size() << " pending chunks";
            co_await refresh_providers(job);
            co_await sleep(settings_.download.discovery_poll_interval);
            continue;
        }

        apply_outcome(job, co_await outcomes.receive());

        if (steady_clock::now() - last_progress_log >= settings_.download.progress_log_interval) {
            SNAP_INFO << "SnapshotClient: download progress " << job.progress() << " stats: " << job.statistics();
            last_progress_log = steady_clock::now();
        }
    }
}

Task<void> SnapshotClient::fetch_worker(ChunkSource source, ChunkRequest request, OutcomeChannel& outcomes) {
    using namespace concurrency::awaitable_wait_for_one;

    FetchOutcome outcome{.provider = source_id(source), .chunk_indices = request.chunk_indices};
    const auto start_time{steady_clock::now()};
    try {
        auto responses = co_await (fetch(source, std::move(request)) || concurrency::timeout(settings_.download.request_timeout));
        if (auto* delivered{std::get_if<0>(&responses)}) {
            outcome.responses = std::move(*delivered);
        }
    } catch (const concurrency::TimeoutExpiredError&) {
        outcome.timed_out = true;
    } catch (const boost::system::system_error& ex) {
        if (ex.code() == boost::system::errc::operation_canceled) throw;
        SNAP_DEBUG << "SnapshotClient: request to " << human_readable_id(outcome.provider) << " failed: " << ex.what();
    } catch (const std::exception& ex) {
        SNAP_DEBUG << "SnapshotClient: request to " << human_readable_id(outcome.provider) << " failed: " << ex.what();
    }
    outcome.latency = duration_cast<milliseconds>(steady_clock::now() - start_time);

    uint64_t received_bytes{0};
    for (const auto& response : outcome.responses) {
        received_bytes += response.chunk.payload.size();
    }
    co_await context_.bandwidth().consume(received_bytes);

    co_await outcomes.send(std::move(outcome));
}

Task<std::vector<ChunkResponse>> SnapshotClient::fetch(const ChunkSource& source, ChunkRequest request) {
    if (const auto* local{std::get_if<LocalPeer>(&source)}) {
        const TrustedHeader target{request.block_number, request.state_root};
        const std::set<uint32_t> requested{request.chunk_indices.begin(), request.chunk_indices.end()};
        std::vector<ChunkResponse> responses;
        for (auto& response : local->chunk_store->get_all(target)) {
            if (requested.contains(response.chunk.index)) {
                responses.push_back(std::move(response));
            }
        }
        co_return responses;
    }
    const auto& remote{std::get<RemoteAnnouncement>(source)};
    co_return co_await network_.request_chunks(remote.announcement.provider, std::move(request));
}

void SnapshotClient::apply_outcome(DownloadJob& job, FetchOutcome outcome) {
    if (outcome.timed_out) {
        job.request_timed_out(outcome.provider, outcome.chunk_indices);
        return;
    }
    for (const auto& response : outcome.responses) {
        if (job.accept_chunk(outcome.provider, response) != ChunkEvent::kAccepted) continue;
        try {
            chunk_store_.put(job.target(), response);
        } catch (const std::exception& ex) {
            SNAP_ERROR << "SnapshotClient: cannot retain chunk " << response.chunk.index << ": " << ex.what();
        }
    }
    job.request_completed(outcome.provider, outcome.chunk_indices, outcome.latency);
}

SyncResult SnapshotClient::finalize(DownloadJob& job, const std::vector<SnapshotAnnouncement>& announcements) {
    auto result{verifier_.verify(job.descriptor(), job.target(), job.completed_chunks(), announcements)};
    job.finish_verification(result);

    if (result.accepted()) {
        const size_t record_count{result.records.size()};
        materializer_.import_verified_records(std::move(result.records));
        discard_retained_chunks(job.target());
        SNAP_INFO_M("SnapshotClient: snapshot verified and imported",
                    {"block", std::to_string(job.target().block_number),
                     "records", std::to_string(record_count),
                     "chunks", std::to_string(job.descriptor().chunk_count)});
        return SyncCompleted{job.target().block_number};
    }

    if (job.state() != JobState::kFailed) {
        job.fail("final verification " + std::string{snapshots::to_string(result.outcome)});
    }
    // the retained chunks belong to a snapshot that does not match the trusted state
    discard_retained_chunks(job.target());

    std::string detail{result.error ? std::string{snapshots::to_string(*result.error)} : "rejected"};
    SNAP_ERROR << "SnapshotClient: snapshot for block " << job.target().block_number << " rejected: " << detail
               << " providers: " << job.providers().size();
    return SyncAborted{AbortReason::kVerificationFailed, std::move(detail)};
}

}  // namespace snapsync::sync
