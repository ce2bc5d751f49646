// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "creator.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

#include <snapsync/core/common/util.hpp>
#include <snapsync/core/types/evmc_bytes32.hpp>
#include <snapsync/infra/common/log.hpp>
#include <snapsync/snapshots/state_root.hpp>

namespace snapsync::snapshots {

std::vector<StateRecord> canonical_order(std::vector<StateRecord> records) {
    struct KeyedRecord {
        RecordKind kind;
        Bytes key;
        StateRecord record;
    };
    std::vector<KeyedRecord> keyed;
    keyed.reserve(records.size());
    for (auto& record : records) {
        if (const auto* storage{std::get_if<StorageRecord>(&record)}; storage && evmc::is_zero(storage->value)) {
            continue;  // zero slots are not part of the storage trie
        }
        keyed.push_back({record_kind(record), canonical_key(record), std::move(record)});
    }

    const auto less = [](const KeyedRecord& a, const KeyedRecord& b) {
        return a.kind != b.kind ? a.kind < b.kind : a.key < b.key;
    };
    const auto same = [](const KeyedRecord& a, const KeyedRecord& b) {
        return a.kind == b.kind && a.key == b.key;
    };
    std::stable_sort(keyed.begin(), keyed.end(), less);
    keyed.erase(std::unique(keyed.begin(), keyed.end(), same), keyed.end());

    std::vector<StateRecord> ordered;
    ordered.reserve(keyed.size());
    for (auto& item : keyed) {
        ordered.push_back(std::move(item.record));
    }
    return ordered;
}

tl::expected<Snapshot, SnapshotError> SnapshotCreator::create_snapshot(BlockNum block_number) {
    const auto state_root{state_provider_.state_root_at(block_number)};
    if (!state_root) {
        SNAP_WARN << "SnapshotCreator: no state available at block " << block_number;
        return tl::unexpected{SnapshotError::kUnknownBlock};
    }

    const auto start_time{std::chrono::steady_clock::now()};
    auto records{canonical_order(state_provider_.enumerate_state_records(block_number))};

    auto chunks{chunk_records(records, settings_.target_chunk_size)};
    if (!chunks) {
        SNAP_ERROR << "SnapshotCreator: cannot chunk state at block " << block_number << ": " << chunks.error();
        return tl::unexpected{chunks.error()};
    }

    Snapshot snapshot{
        .block_number = block_number,
        .state_root = *state_root,
        .chunk_tree_root = build_tree(*chunks).root(),
        .chunks = std::move(*chunks),
    };
    snapshot.metadata.created_at = std::chrono::system_clock::now();
    snapshot.metadata.chunk_count = static_cast<uint32_t>(snapshot.chunks.size());
    for (const auto& chunk : snapshot.chunks) {
        snapshot.metadata.total_size += chunk.payload.size();
    }

    const auto elapsed{std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time)};
    SNAP_INFO_M("SnapshotCreator: snapshot created",
                {"block", std::to_string(block_number),
                 "records", std::to_string(records.size()),
                 "chunks", std::to_string(snapshot.metadata.chunk_count),
                 "size", human_size(snapshot.metadata.total_size),
                 "root", to_hex(snapshot.chunk_tree_root),
                 "elapsed", std::to_string(elapsed.count()) + "ms"});

    return snapshot;
}

}  // namespace snapsync::snapshots
