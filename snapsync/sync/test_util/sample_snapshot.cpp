// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sample_snapshot.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <snapsync/snapshots/creator.hpp>
#include <snapsync/snapshots/test_util/sample_state.hpp>

namespace snapsync::sync::test_util {

ChunkResponse SampleSnapshot::response(uint32_t index) const {
    return {.chunk = snapshot->chunks.at(index), .proof = snapshots::prove_chunk(tree, index)};
}

snapshots::CrossCheckedSnapshot SampleSnapshot::agreed_by(std::vector<PeerId> providers) const {
    return {
        .descriptor = snapshot->descriptor(),
        .total_size = snapshot->metadata.total_size,
        .providers = std::move(providers),
    };
}

SampleSnapshot make_sample_snapshot(BlockNum block_number, size_t num_accounts, size_t target_chunk_size) {
    snapshots::test_util::InMemoryStateProvider state_provider;
    state_provider.add_state(block_number, snapshots::test_util::sample_state_records(num_accounts, 4, 120));

    snapshots::SnapshotCreator creator{state_provider, snapshots::ChunkingSettings{.target_chunk_size = target_chunk_size}};
    auto created{creator.create_snapshot(block_number)};
    if (!created) {
        throw std::logic_error{"make_sample_snapshot: " + std::string{snapshots::to_string(created.error())}};
    }

    SampleSnapshot sample;
    sample.header = {.block_number = block_number, .state_root = created->state_root};
    sample.tree = snapshots::SnapshotCreator::chunk_tree_of(*created);
    sample.records = snapshots::canonical_order(state_provider.enumerate_state_records(block_number));
    sample.snapshot = std::make_shared<const snapshots::Snapshot>(std::move(*created));
    return sample;
}

}  // namespace snapsync::sync::test_util
