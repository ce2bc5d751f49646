// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "server.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <snapsync/infra/test_util/log.hpp>
#include <snapsync/infra/test_util/task_runner.hpp>
#include <snapsync/snapshots/verifier.hpp>
#include <snapsync/sync/test_util/loopback_peer_network.hpp>
#include <snapsync/sync/test_util/sample_snapshot.hpp>

namespace snapsync::sync {

using test_util::make_peer;

static SnapshotSyncSettings unlimited_bandwidth_settings() {
    SnapshotSyncSettings settings;
    settings.bandwidth.rate_limit = 0;
    return settings;
}

class SnapshotServerTest : public snapsync::test_util::TaskRunner {
  protected:
    explicit SnapshotServerTest(SnapshotSyncSettings sync_settings = unlimited_bandwidth_settings())
        : settings{sync_settings} {}

    ChunkRequest request_for(std::vector<uint32_t> indices) const {
        return {.block_number = sample.header.block_number,
                .state_root = sample.header.state_root,
                .chunk_indices = std::move(indices)};
    }

    snapsync::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::SampleSnapshot sample{test_util::make_sample_snapshot(2'000)};
    SnapshotSyncSettings settings;
    test_util::LoopbackPeerNetwork network;
    DistributorContext context{settings};
    SnapshotServer server{make_peer(7), network, context, settings.server};
};

TEST_CASE_METHOD(SnapshotServerTest, "SnapshotServer::announce", "[snapsync][sync][server]") {
    CHECK(server.state() == ServerState::kIdle);
    CHECK(server.node_id() == make_peer(7));

    SECTION("nothing to announce") {
        run(server.announce());
        CHECK(server.state() == ServerState::kIdle);
        CHECK(run(network.discover(2'000)).empty());
    }

    SECTION("held snapshots are announced") {
        server.add_snapshot(sample.snapshot);
        CHECK(server.announcements() == std::vector{snapshots::make_announcement(*sample.snapshot, make_peer(7))});

        run(server.announce());
        CHECK(server.state() == ServerState::kServing);
        const auto announced{run(network.discover(2'000))};
        REQUIRE(announced.size() == 1);
        CHECK(announced[0].provider == make_peer(7));
        CHECK(announced[0].chunk_tree_root == sample.snapshot->chunk_tree_root);
        CHECK(announced[0].chunk_count == sample.chunk_count());
        CHECK(run(network.discover(2'001)).empty());
    }

    SECTION("snapshot for the same target is replaced") {
        server.add_snapshot(sample.snapshot);
        server.add_snapshot(sample.snapshot);
        CHECK(server.announcements().size() == 1);
    }
}

TEST_CASE_METHOD(SnapshotServerTest, "SnapshotServer::add_snapshot inconsistent", "[snapsync][sync][server]") {
    auto tampered{std::make_shared<snapshots::Snapshot>(*sample.snapshot)};
    tampered->chunk_tree_root = sample.header.state_root;
    CHECK_THROWS_AS(server.add_snapshot(tampered), std::logic_error);
    CHECK_THROWS_AS(server.add_snapshot(nullptr), std::invalid_argument);
    CHECK(server.announcements().empty());
}

TEST_CASE_METHOD(SnapshotServerTest, "SnapshotServer::serve", "[snapsync][sync][server]") {
    server.add_snapshot(sample.snapshot);
    REQUIRE(sample.chunk_count() > 4);

    SECTION("requested chunks come with valid proofs") {
        const auto responses{server.serve(request_for({3, 0, 1}))};
        REQUIRE(responses.size() == 3);
        CHECK(responses[0] == sample.response(3));
        CHECK(responses[1] == sample.response(0));
        for (const auto& response : responses) {
            CHECK(snapshots::SnapshotVerifier::check_chunk(response.chunk, response.proof,
                                                           sample.snapshot->descriptor())
                      .has_value());
        }
        CHECK(context.bandwidth().consumed_bytes() > 0);
    }

    SECTION("unknown indices are skipped") {
        const auto responses{server.serve(request_for({1, sample.chunk_count(), 1'000'000}))};
        REQUIRE(responses.size() == 1);
        CHECK(responses[0].chunk.index == 1);
    }

    SECTION("unknown target") {
        auto request{request_for({0, 1})};
        request.block_number += 1;
        CHECK(server.serve(request).empty());
        request = request_for({0, 1});
        request.state_root = sample.snapshot->chunk_tree_root;
        CHECK(server.serve(request).empty());
    }

    SECTION("no request session needed") {
        SnapshotServer other{make_peer(8), network, context, settings.server};
        other.add_snapshot(sample.snapshot);
        CHECK(other.serve(request_for({2})) == server.serve(request_for({2})));
    }
}

class LimitedSnapshotServerTest : public SnapshotServerTest {
  protected:
    static SnapshotSyncSettings limited_settings() {
        SnapshotSyncSettings limited;
        limited.server.max_chunks_per_response = 2;
        limited.bandwidth = {.rate_limit = 1'000, .burst_size = 1'000};
        return limited;
    }

    LimitedSnapshotServerTest() : SnapshotServerTest{limited_settings()} {}
};

TEST_CASE_METHOD(LimitedSnapshotServerTest, "SnapshotServer::serve limits", "[snapsync][sync][server]") {
    server.add_snapshot(sample.snapshot);

    SECTION("answer is truncated to the response limit") {
        const auto responses{server.serve(request_for({0, 1, 2, 3}))};
        CHECK(responses.size() <= 2);
    }

    SECTION("answer is truncated when the bandwidth budget is exhausted") {
        // every chunk payload is close to 512 bytes: the burst admits two chunks at most
        size_t served{0};
        for (uint32_t index{0}; index < sample.chunk_count(); ++index) {
            served += server.serve(request_for({index})).size();
        }
        CHECK(served >= 1);
        CHECK(served < sample.chunk_count());
    }
}

}  // namespace snapsync::sync
