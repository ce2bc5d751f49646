// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "verifier.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <tuple>
#include <utility>

#include <magic_enum.hpp>

#include <snapsync/core/types/evmc_bytes32.hpp>
#include <snapsync/infra/common/log.hpp>
#include <snapsync/snapshots/state_root.hpp>

namespace snapsync::snapshots {

std::string_view to_string(VerificationStage stage) {
    return magic_enum::enum_name(stage);
}

std::string_view to_string(VerificationOutcome outcome) {
    return magic_enum::enum_name(outcome);
}

static VerificationResult rejected(std::optional<VerificationStage> last_passed_stage, SnapshotError error) {
    return {.outcome = VerificationOutcome::kRejected, .last_passed_stage = last_passed_stage, .error = error};
}

tl::expected<void, SnapshotError> SnapshotVerifier::check_chunk(const SnapshotChunk& chunk,
                                                                const MerkleProof& proof,
                                                                const SnapshotDescriptor& agreed) {
    if (!chunk.has_valid_hash()) {
        SNAP_DEBUG << "SnapshotVerifier: chunk " << chunk.index << " payload does not match its content hash";
        return tl::unexpected{SnapshotError::kChunkCorrupt};
    }
    if (proof.leaf_index != chunk.index || proof.leaf_hash != chunk.content_hash) {
        SNAP_DEBUG << "SnapshotVerifier: chunk " << chunk.index << " proof is bound to another leaf";
        return tl::unexpected{SnapshotError::kChunkCorrupt};
    }
    if (!verify_chunk(proof, agreed.chunk_tree_root, agreed.chunk_count)) {
        SNAP_DEBUG << "SnapshotVerifier: chunk " << chunk.index << " proof does not lead to 0x"
                   << to_hex(agreed.chunk_tree_root) << " over " << agreed.chunk_count << " chunks";
        return tl::unexpected{SnapshotError::kChunkCorrupt};
    }
    return {};
}

tl::expected<CrossCheckedSnapshot, SnapshotError> SnapshotVerifier::cross_check(
    const std::vector<SnapshotAnnouncement>& announcements,
    const TrustedHeader& trusted_header) const {
    using Key = std::tuple<Bytes, uint32_t, uint64_t>;  // chunk tree root, chunk count, total size
    std::map<Key, std::set<PeerId>> providers_by_snapshot;
    for (const auto& announcement : announcements) {
        if (announcement.block_number != trusted_header.block_number ||
            announcement.state_root != trusted_header.state_root) {
            continue;
        }
        Key key{Bytes{announcement.chunk_tree_root.bytes, kHashLength}, announcement.chunk_count, announcement.total_size};
        providers_by_snapshot[std::move(key)].insert(announcement.provider);
    }

    const Key* best_key{nullptr};
    const std::set<PeerId>* best_providers{nullptr};
    for (const auto& [key, providers] : providers_by_snapshot) {
        if (!best_providers || providers.size() > best_providers->size()) {
            best_key = &key;
            best_providers = &providers;
        }
    }

    const size_t threshold{std::max<size_t>(settings_.cross_check_threshold, 1)};
    if (!best_providers || best_providers->size() < threshold) {
        SNAP_DEBUG << "SnapshotVerifier: cross-check failed for block " << trusted_header.block_number
                   << " agreeing providers: " << (best_providers ? best_providers->size() : 0)
                   << " required: " << threshold;
        return tl::unexpected{SnapshotError::kNoProviders};
    }

    CrossCheckedSnapshot agreed{
        .descriptor = {
            .block_number = trusted_header.block_number,
            .state_root = trusted_header.state_root,
            .chunk_tree_root = to_bytes32(std::get<0>(*best_key)),
            .chunk_count = std::get<1>(*best_key),
        },
        .total_size = std::get<2>(*best_key),
        .providers = {best_providers->begin(), best_providers->end()},
    };
    return agreed;
}

VerificationResult SnapshotVerifier::verify(const SnapshotDescriptor& snapshot,
                                            const TrustedHeader& trusted_header,
                                            std::vector<SnapshotChunk> received_chunks,
                                            const std::vector<SnapshotAnnouncement>& announcements) const {
    // StructureChecked: indices are exactly [0, chunk_count)
    std::sort(received_chunks.begin(), received_chunks.end(),
              [](const SnapshotChunk& a, const SnapshotChunk& b) { return a.index < b.index; });
    if (received_chunks.size() != snapshot.chunk_count) {
        SNAP_WARN << "SnapshotVerifier: expected " << snapshot.chunk_count << " chunks, received " << received_chunks.size();
        return rejected(std::nullopt, SnapshotError::kMalformedSnapshot);
    }
    for (size_t i{0}; i < received_chunks.size(); ++i) {
        if (received_chunks[i].index != i) {
            SNAP_WARN << "SnapshotVerifier: chunk indices are not contiguous at position " << i;
            return rejected(std::nullopt, SnapshotError::kMalformedSnapshot);
        }
    }

    // ChunksHashed: corrupt chunks are recoverable by fetching them again
    VerificationResult result{.last_passed_stage = VerificationStage::kStructureChecked};
    for (const auto& chunk : received_chunks) {
        if (!chunk.has_valid_hash()) {
            result.corrupt_chunks.push_back(chunk.index);
        }
    }
    if (!result.corrupt_chunks.empty()) {
        SNAP_WARN << "SnapshotVerifier: " << result.corrupt_chunks.size() << " corrupt chunks";
        result.outcome = VerificationOutcome::kCorruptChunks;
        result.error = SnapshotError::kChunkCorrupt;
        return result;
    }
    result.last_passed_stage = VerificationStage::kChunksHashed;

    // RootReplayed
    if (trusted_header.block_number != snapshot.block_number) {
        SNAP_WARN << "SnapshotVerifier: trusted header block " << trusted_header.block_number
                  << " does not match snapshot block " << snapshot.block_number;
        return rejected(result.last_passed_stage, SnapshotError::kStateRootMismatch);
    }
    const ChunkTree tree{build_tree(received_chunks)};
    if (tree.root() != snapshot.chunk_tree_root) {
        SNAP_WARN << "SnapshotVerifier: chunk tree root mismatch declared 0x" << to_hex(snapshot.chunk_tree_root)
                  << " computed 0x" << to_hex(tree.root());
        return rejected(result.last_passed_stage, SnapshotError::kMalformedSnapshot);
    }

    std::vector<StateRecord> records;
    for (const auto& chunk : received_chunks) {
        auto chunk_records{decode_chunk(chunk)};
        if (!chunk_records) {
            SNAP_WARN << "SnapshotVerifier: cannot decode chunk " << chunk.index << ": "
                      << magic_enum::enum_name(chunk_records.error());
            return rejected(result.last_passed_stage, SnapshotError::kMalformedSnapshot);
        }
        std::move(chunk_records->begin(), chunk_records->end(), std::back_inserter(records));
    }

    const auto state_root{compute_state_root(records)};
    if (!state_root) {
        SNAP_WARN << "SnapshotVerifier: state replay failed: " << state_root.error();
        return rejected(result.last_passed_stage, state_root.error());
    }
    if (*state_root != trusted_header.state_root) {
        SNAP_WARN << "SnapshotVerifier: state root mismatch trusted 0x" << to_hex(trusted_header.state_root)
                  << " replayed 0x" << to_hex(*state_root);
        return rejected(result.last_passed_stage, SnapshotError::kStateRootMismatch);
    }
    result.last_passed_stage = VerificationStage::kRootReplayed;

    // CrossChecked
    if (settings_.cross_check_threshold > 0 && !announcements.empty()) {
        const auto agreed{cross_check(announcements, trusted_header)};
        if (!agreed) {
            return rejected(result.last_passed_stage, agreed.error());
        }
        if (agreed->descriptor.chunk_tree_root != snapshot.chunk_tree_root) {
            SNAP_WARN << "SnapshotVerifier: providers agree on a different chunk tree root 0x"
                      << to_hex(agreed->descriptor.chunk_tree_root);
            return rejected(result.last_passed_stage, SnapshotError::kNoProviders);
        }
    }
    result.last_passed_stage = VerificationStage::kCrossChecked;

    result.outcome = VerificationOutcome::kAccepted;
    result.error.reset();
    result.records = std::move(records);
    return result;
}

}  // namespace snapsync::snapshots
