// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "loopback_peer_network.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>

#include <boost/asio/this_coro.hpp>

#include <snapsync/infra/concurrency/sleep.hpp>

namespace snapsync::sync::test_util {

using namespace std::chrono_literals;

void LoopbackPeerNetwork::set_behavior(const PeerId& provider, ProviderBehavior behavior, std::set<uint32_t> affected) {
    behaviors_[provider] = Behavior{behavior, std::move(affected)};
}

Task<void> LoopbackPeerNetwork::announce(snapshots::SnapshotAnnouncement announcement) {
    co_await boost::asio::this_coro::executor;
    announcements_.push_back(std::move(announcement));
}

Task<std::vector<snapshots::SnapshotAnnouncement>> LoopbackPeerNetwork::discover(BlockNum block_number) {
    co_await boost::asio::this_coro::executor;
    std::vector<snapshots::SnapshotAnnouncement> found;
    std::copy_if(announcements_.begin(), announcements_.end(), std::back_inserter(found),
                 [&](const auto& announcement) { return announcement.block_number == block_number; });
    co_return found;
}

Task<std::vector<ChunkResponse>> LoopbackPeerNetwork::request_chunks(PeerId provider, ChunkRequest request) {
    co_await boost::asio::this_coro::executor;
    requests_.emplace_back(provider, request);

    const auto server_it{servers_.find(provider)};
    if (server_it == servers_.end()) {
        throw std::runtime_error{"unknown peer " + human_readable_id(provider)};
    }

    auto& behavior{behaviors_[provider]};
    switch (behavior.kind) {
        case ProviderBehavior::kHang:
            co_await sleep(24h);
            co_return std::vector<ChunkResponse>{};
        case ProviderBehavior::kFail:
            throw std::runtime_error{"connection reset by " + human_readable_id(provider)};
        case ProviderBehavior::kBreakDown:
            throw std::logic_error{"invalid session state for " + human_readable_id(provider)};
        default:
            break;
    }

    auto responses{server_it->second->serve(request)};
    if (behavior.kind == ProviderBehavior::kDropChunks) {
        std::erase_if(responses, [&](const ChunkResponse& response) { return behavior.applies_to(response.chunk.index); });
    } else if (behavior.kind == ProviderBehavior::kCorruptOnce) {
        const bool all_chunks{behavior.affected.empty()};
        bool corrupted{false};
        for (auto& response : responses) {
            const uint32_t index{response.chunk.index};
            if (!(all_chunks || behavior.affected.contains(index)) || response.chunk.payload.empty()) continue;
            response.chunk.payload[0] ^= 0xff;
            corrupted = true;
            if (!all_chunks) behavior.affected.erase(index);
        }
        if (corrupted && behavior.affected.empty()) {
            behavior.kind = ProviderBehavior::kHonest;
        }
    }
    co_return responses;
}

size_t LoopbackPeerNetwork::request_count(uint32_t index) const {
    return static_cast<size_t>(std::count_if(requests_.begin(), requests_.end(), [&](const auto& entry) {
        return std::ranges::find(entry.second.chunk_indices, index) != entry.second.chunk_indices.end();
    }));
}

size_t LoopbackPeerNetwork::request_count(const PeerId& provider, uint32_t index) const {
    return static_cast<size_t>(std::count_if(requests_.begin(), requests_.end(), [&](const auto& entry) {
        return entry.first == provider &&
               std::ranges::find(entry.second.chunk_indices, index) != entry.second.chunk_indices.end();
    }));
}

}  // namespace snapsync::sync::test_util
