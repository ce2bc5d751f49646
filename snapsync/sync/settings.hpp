// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include <snapsync/core/common/base.hpp>
#include <snapsync/snapshots/settings.hpp>

namespace snapsync::sync {

//! The settings for downloading snapshots from remote providers
struct DownloadSettings {
    constexpr static size_t kDefaultMaxInFlightChunks{16};
    constexpr static size_t kDefaultMaxInFlightChunksPerProvider{4};
    constexpr static size_t kDefaultMaxChunksPerRequest{4};
    constexpr static std::chrono::milliseconds kDefaultRequestTimeout{std::chrono::seconds{10}};
    constexpr static std::chrono::milliseconds kDefaultJobTimeout{std::chrono::minutes{30}};
    constexpr static std::chrono::milliseconds kDefaultDiscoveryTimeout{std::chrono::seconds{60}};
    constexpr static std::chrono::milliseconds kDefaultDiscoveryPollInterval{std::chrono::seconds{1}};
    constexpr static std::chrono::seconds kDefaultProgressLogInterval{30};

    //! Upper bound on the number of chunks requested and not yet received across all providers
    size_t max_in_flight_chunks{kDefaultMaxInFlightChunks};

    //! Upper bound on the number of chunks requested and not yet received from a single provider
    size_t max_in_flight_chunks_per_provider{kDefaultMaxInFlightChunksPerProvider};

    size_t max_chunks_per_request{kDefaultMaxChunksPerRequest};

    //! Deadline of a single chunk request
    std::chrono::milliseconds request_timeout{kDefaultRequestTimeout};

    //! Deadline of a whole sync attempt, after which the caller falls back to historical replay
    std::chrono::milliseconds job_timeout{kDefaultJobTimeout};

    //! Maximum time spent looking for enough agreeing providers
    std::chrono::milliseconds discovery_timeout{kDefaultDiscoveryTimeout};

    //! Time between two discovery rounds
    std::chrono::milliseconds discovery_poll_interval{kDefaultDiscoveryPollInterval};

    std::chrono::seconds progress_log_interval{kDefaultProgressLogInterval};
};

//! The settings for serving snapshots to remote peers
struct ServerSettings {
    constexpr static size_t kDefaultMaxChunksPerResponse{16};

    size_t max_chunks_per_response{kDefaultMaxChunksPerResponse};
};

//! The settings of the transfer rate limit shared by serving and downloading
struct BandwidthSettings {
    constexpr static uint64_t kDefaultRateLimit{64_Mebi};  // bytes per second
    constexpr static uint64_t kDefaultBurstSize{16_Mebi};

    //! Sustained transfer rate in bytes per second (0 means unlimited)
    uint64_t rate_limit{kDefaultRateLimit};

    //! Maximum credit accumulated while idle
    uint64_t burst_size{kDefaultBurstSize};
};

//! The settings for ranking snapshot providers
struct ReputationSettings {
    constexpr static std::chrono::milliseconds kDefaultCorruptionPenalty{std::chrono::minutes{10}};
    constexpr static double kDefaultLatencySmoothing{0.25};

    //! Time a provider stays deprioritized after serving a corrupt chunk
    std::chrono::milliseconds corruption_penalty{kDefaultCorruptionPenalty};

    //! Weight of the latest sample in the exponentially weighted latency average
    double latency_smoothing{kDefaultLatencySmoothing};
};

struct SnapshotSyncSettings {
    snapshots::ChunkingSettings chunking;
    snapshots::VerifierSettings verifier;
    DownloadSettings download;
    ServerSettings server;
    BandwidthSettings bandwidth;
    ReputationSettings reputation;
};

}  // namespace snapsync::sync
