// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "creator.hpp"

#include <algorithm>

#include <catch2/catch_test_macros.hpp>

#include <snapsync/infra/test_util/log.hpp>
#include <snapsync/snapshots/state_root.hpp>
#include <snapsync/snapshots/test_util/sample_state.hpp>

namespace snapsync::snapshots {

using namespace evmc::literals;

TEST_CASE("canonical_order", "[snapsync][snapshots][creator]") {
    const auto records{test_util::sample_state_records(8, 2, 16)};
    const auto ordered{canonical_order(records)};
    REQUIRE(ordered.size() == records.size());

    for (size_t i{1}; i < ordered.size(); ++i) {
        const auto previous_kind{record_kind(ordered[i - 1])};
        const auto kind{record_kind(ordered[i])};
        CHECK(previous_kind <= kind);
        if (previous_kind == kind) {
            CHECK(canonical_key(ordered[i - 1]) < canonical_key(ordered[i]));
        }
    }

    SECTION("input order does not matter") {
        auto reversed{records};
        std::reverse(reversed.begin(), reversed.end());
        CHECK(canonical_order(reversed) == ordered);
    }

    SECTION("duplicates keep the first occurrence") {
        auto duplicated{records};
        auto first{std::get<AccountRecord>(records.back())};
        auto second{first};
        second.nonce += 1;
        duplicated.emplace_back(second);
        duplicated.insert(duplicated.begin(), first);
        const auto result{canonical_order(duplicated)};
        CHECK(result == ordered);
    }

    SECTION("zero storage slots are dropped") {
        auto with_zero{records};
        with_zero.emplace_back(StorageRecord{.address = std::get<AccountRecord>(records.back()).address,
                                             .location = 0xff_bytes32,
                                             .value = kZeroHash});
        CHECK(canonical_order(with_zero) == ordered);
    }
}

TEST_CASE("SnapshotCreator", "[snapsync][snapshots][creator]") {
    snapsync::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::InMemoryStateProvider state_provider;
    state_provider.add_state(1000, test_util::sample_state_records(20, 5, 200));
    SnapshotCreator creator{state_provider, ChunkingSettings{.target_chunk_size = 1024}};

    SECTION("unknown block") {
        const auto snapshot{creator.create_snapshot(999)};
        REQUIRE(!snapshot);
        CHECK(snapshot.error() == SnapshotError::kUnknownBlock);
    }

    SECTION("snapshot content") {
        const auto snapshot{creator.create_snapshot(1000)};
        REQUIRE(snapshot);
        CHECK(snapshot->block_number == 1000);
        CHECK(snapshot->state_root == *state_provider.state_root_at(1000));
        CHECK(snapshot->metadata.chunk_count == snapshot->chunks.size());
        CHECK(snapshot->chunk_tree_root == SnapshotCreator::chunk_tree_of(*snapshot).root());

        uint64_t total_size{0};
        for (uint32_t i{0}; i < snapshot->chunks.size(); ++i) {
            CHECK(snapshot->chunks[i].index == i);
            CHECK(snapshot->chunks[i].payload.size() <= 1024);
            total_size += snapshot->chunks[i].payload.size();
        }
        CHECK(snapshot->metadata.total_size == total_size);

        const SnapshotDescriptor descriptor{snapshot->descriptor()};
        CHECK(descriptor.chunk_count == snapshot->chunks.size());
        CHECK(descriptor.chunk_tree_root == snapshot->chunk_tree_root);
    }

    SECTION("snapshots are deterministic") {
        test_util::InMemoryStateProvider shuffled_provider;
        auto records{test_util::sample_state_records(20, 5, 200)};
        std::reverse(records.begin(), records.end());
        shuffled_provider.add_state(1000, records);
        SnapshotCreator other_creator{shuffled_provider, ChunkingSettings{.target_chunk_size = 1024}};

        const auto snapshot1{creator.create_snapshot(1000)};
        const auto snapshot2{other_creator.create_snapshot(1000)};
        REQUIRE(snapshot1);
        REQUIRE(snapshot2);
        CHECK(snapshot1->chunk_tree_root == snapshot2->chunk_tree_root);
        CHECK(snapshot1->chunks == snapshot2->chunks);
    }

    SECTION("record larger than target chunk size") {
        SnapshotCreator tiny_creator{state_provider, ChunkingSettings{.target_chunk_size = 64}};
        const auto snapshot{tiny_creator.create_snapshot(1000)};
        REQUIRE(!snapshot);
        CHECK(snapshot.error() == SnapshotError::kEncodingError);
    }

    SECTION("empty state") {
        test_util::InMemoryStateProvider empty_provider;
        empty_provider.add_state(1, {});
        SnapshotCreator empty_creator{empty_provider, ChunkingSettings{}};
        const auto snapshot{empty_creator.create_snapshot(1)};
        REQUIRE(snapshot);
        CHECK(snapshot->chunks.empty());
        CHECK(snapshot->state_root == kEmptyRoot);
    }
}

}  // namespace snapsync::snapshots
