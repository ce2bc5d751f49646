// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "peer_reputation.hpp"

#include <snapsync/infra/common/log.hpp>

namespace snapsync::sync {

void PeerReputation::add_latency_sample(PeerStats& stats, std::chrono::milliseconds sample) const {
    if (!stats.latency) {
        stats.latency = sample;
        return;
    }
    const double smoothed{settings_.latency_smoothing * static_cast<double>(sample.count()) +
                          (1.0 - settings_.latency_smoothing) * static_cast<double>(stats.latency->count())};
    stats.latency = std::chrono::milliseconds{static_cast<int64_t>(smoothed)};
}

void PeerReputation::record_delivery(const PeerId& peer_id, std::chrono::milliseconds latency, size_t chunk_count) {
    std::scoped_lock lock{mutex_};
    auto& stats{peers_[peer_id]};
    add_latency_sample(stats, latency);
    stats.delivered_chunks += chunk_count;
}

void PeerReputation::record_corruption(const PeerId& peer_id, Clock::time_point now) {
    std::scoped_lock lock{mutex_};
    auto& stats{peers_[peer_id]};
    ++stats.corrupt_chunks;
    stats.deprioritized_until = now + settings_.corruption_penalty;
    SNAP_WARN << "PeerReputation: provider " << human_readable_id(peer_id) << " deprioritized after "
              << stats.corrupt_chunks << " corrupt chunks";
}

void PeerReputation::record_timeout(const PeerId& peer_id, std::chrono::milliseconds request_timeout) {
    std::scoped_lock lock{mutex_};
    auto& stats{peers_[peer_id]};
    ++stats.timeouts;
    add_latency_sample(stats, request_timeout);
}

bool PeerReputation::is_deprioritized(const PeerId& peer_id, Clock::time_point now) const {
    std::scoped_lock lock{mutex_};
    const auto it{peers_.find(peer_id)};
    return it != peers_.end() && now < it->second.deprioritized_until;
}

std::optional<std::chrono::milliseconds> PeerReputation::latency(const PeerId& peer_id) const {
    std::scoped_lock lock{mutex_};
    const auto it{peers_.find(peer_id)};
    if (it == peers_.end()) return std::nullopt;
    return it->second.latency;
}

PeerStats PeerReputation::stats(const PeerId& peer_id) const {
    std::scoped_lock lock{mutex_};
    const auto it{peers_.find(peer_id)};
    if (it == peers_.end()) return {};
    return it->second;
}

}  // namespace snapsync::sync
