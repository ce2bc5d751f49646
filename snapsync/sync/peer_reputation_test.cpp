// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "peer_reputation.hpp"

#include <catch2/catch_test_macros.hpp>

#include <snapsync/infra/test_util/log.hpp>

namespace snapsync::sync {

using namespace std::chrono_literals;

TEST_CASE("PeerReputation", "[snapsync][sync][reputation]") {
    snapsync::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    PeerReputation reputation;
    const PeerId peer(64, 0x01);
    const PeerId other(64, 0x02);

    SECTION("unknown provider") {
        CHECK(!reputation.latency(peer));
        CHECK(!reputation.is_deprioritized(peer));
        CHECK(reputation.stats(peer).delivered_chunks == 0);
    }

    SECTION("latency is smoothed") {
        reputation.record_delivery(peer, 100ms, 2);
        CHECK(reputation.latency(peer) == 100ms);
        reputation.record_delivery(peer, 200ms, 1);
        CHECK(reputation.latency(peer) == 125ms);
        CHECK(reputation.stats(peer).delivered_chunks == 3);
        CHECK(!reputation.latency(other));
    }

    SECTION("timeout counts as a slow answer") {
        reputation.record_delivery(peer, 100ms, 1);
        reputation.record_timeout(peer, 500ms);
        CHECK(reputation.latency(peer) == 200ms);
        CHECK(reputation.stats(peer).timeouts == 1);
    }

    SECTION("corruption deprioritizes for the penalty period") {
        const auto t0{PeerReputation::Clock::now()};
        reputation.record_corruption(peer, t0);
        CHECK(reputation.is_deprioritized(peer, t0));
        CHECK(reputation.is_deprioritized(peer, t0 + 9min));
        CHECK(!reputation.is_deprioritized(peer, t0 + ReputationSettings::kDefaultCorruptionPenalty));
        CHECK(!reputation.is_deprioritized(other, t0));
        CHECK(reputation.stats(peer).corrupt_chunks == 1);
    }
}

TEST_CASE("PeerReputation custom settings", "[snapsync][sync][reputation]") {
    snapsync::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    PeerReputation reputation{ReputationSettings{.corruption_penalty = 1s, .latency_smoothing = 0.5}};
    const PeerId peer(64, 0x01);
    const auto t0{PeerReputation::Clock::now()};

    reputation.record_corruption(peer, t0);
    CHECK(reputation.is_deprioritized(peer, t0 + 999ms));
    CHECK(!reputation.is_deprioritized(peer, t0 + 1s));

    reputation.record_delivery(peer, 100ms, 1);
    reputation.record_delivery(peer, 300ms, 1);
    CHECK(reputation.latency(peer) == 200ms);
}

}  // namespace snapsync::sync
