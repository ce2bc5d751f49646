// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

#include <snapsync/snapshots/peer_id.hpp>
#include <snapsync/sync/settings.hpp>

namespace snapsync::sync {

//! What is known about a snapshot provider across sync jobs
struct PeerStats {
    std::optional<std::chrono::milliseconds> latency;  // smoothed request latency
    uint64_t delivered_chunks{0};
    uint64_t corrupt_chunks{0};
    uint64_t timeouts{0};
    std::chrono::steady_clock::time_point deprioritized_until;
};

//! \brief Thread-safe table of provider reputations shared by all sync jobs
class PeerReputation {
  public:
    using Clock = std::chrono::steady_clock;

    explicit PeerReputation(ReputationSettings settings = {}) : settings_{settings} {}

    // Not copyable nor movable
    PeerReputation(const PeerReputation&) = delete;
    PeerReputation& operator=(const PeerReputation&) = delete;

    //! Records a request answered after the given latency with some delivered chunks
    void record_delivery(const PeerId& peer_id, std::chrono::milliseconds latency, size_t chunk_count);

    //! Records a corrupt chunk and deprioritizes the provider for the configured penalty period
    void record_corruption(const PeerId& peer_id, Clock::time_point now = Clock::now());

    //! Records an expired request, the latency sample is the elapsed request timeout
    void record_timeout(const PeerId& peer_id, std::chrono::milliseconds request_timeout);

    bool is_deprioritized(const PeerId& peer_id, Clock::time_point now = Clock::now()) const;

    std::optional<std::chrono::milliseconds> latency(const PeerId& peer_id) const;

    PeerStats stats(const PeerId& peer_id) const;

  private:
    void add_latency_sample(PeerStats& stats, std::chrono::milliseconds sample) const;

    ReputationSettings settings_;
    mutable std::mutex mutex_;
    std::map<PeerId, PeerStats> peers_;
};

}  // namespace snapsync::sync
