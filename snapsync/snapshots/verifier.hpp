// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include <snapsync/snapshots/chunk.hpp>
#include <snapsync/snapshots/chunk_tree.hpp>
#include <snapsync/snapshots/settings.hpp>
#include <snapsync/snapshots/snapshot.hpp>
#include <snapsync/snapshots/snapshot_error.hpp>
#include <snapsync/snapshots/state_provider.hpp>

namespace snapsync::snapshots {

//! Verification stages in the order they are performed
enum class VerificationStage {
    kStructureChecked,
    kChunksHashed,
    kRootReplayed,
    kCrossChecked,
};

enum class VerificationOutcome {
    kAccepted,       // all stages passed, records are ready for import
    kCorruptChunks,  // some chunks do not match their hash, re-fetching them may succeed
    kRejected,       // the snapshot is unusable for this target
};

struct VerificationResult {
    VerificationOutcome outcome{VerificationOutcome::kRejected};
    std::optional<VerificationStage> last_passed_stage;
    std::optional<SnapshotError> error;
    std::vector<uint32_t> corrupt_chunks;
    std::vector<StateRecord> records;  // canonical order, only when accepted

    bool accepted() const { return outcome == VerificationOutcome::kAccepted; }
};

//! The snapshot identity agreed by enough distinct providers
struct CrossCheckedSnapshot {
    SnapshotDescriptor descriptor;
    uint64_t total_size{0};
    std::vector<PeerId> providers;
};

std::string_view to_string(VerificationStage stage);
std::string_view to_string(VerificationOutcome outcome);

//! \brief SnapshotVerifier checks received snapshots against independently trusted block headers
class SnapshotVerifier {
  public:
    explicit SnapshotVerifier(VerifierSettings settings = {}) : settings_{settings} {}

    //! \brief Checks a single transferred chunk: content hash, leaf binding and Merkle proof against the agreed
    //! chunk tree root and chunk count
    //! \return kChunkCorrupt if any check fails
    static tl::expected<void, SnapshotError> check_chunk(const SnapshotChunk& chunk,
                                                         const MerkleProof& proof,
                                                         const SnapshotDescriptor& agreed);

    //! \brief Selects the snapshot advertised for the trusted header by the largest set of distinct providers
    //! \details Announcements for other blocks or state roots are ignored
    //! \return the agreed snapshot or kNoProviders if fewer than the configured threshold of providers agree
    tl::expected<CrossCheckedSnapshot, SnapshotError> cross_check(const std::vector<SnapshotAnnouncement>& announcements,
                                                                  const TrustedHeader& trusted_header) const;

    //! \brief Verifies a complete set of received chunks through all stages
    //! \param announcements optional provider announcements used by the cross-check stage
    VerificationResult verify(const SnapshotDescriptor& snapshot,
                              const TrustedHeader& trusted_header,
                              std::vector<SnapshotChunk> received_chunks,
                              const std::vector<SnapshotAnnouncement>& announcements = {}) const;

    const VerifierSettings& settings() const { return settings_; }

  private:
    VerifierSettings settings_;
};

}  // namespace snapsync::snapshots
