// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string_view>

namespace snapsync::snapshots {

//! Failures of snapshot creation, transfer and verification
enum class [[nodiscard]] SnapshotError {
    kEncodingError,      // a single record does not fit in the target chunk size
    kUnknownBlock,       // no state is available at the requested block
    kMalformedSnapshot,  // chunk set or record sequence is structurally invalid
    kChunkCorrupt,       // chunk content does not match its hash or Merkle proof
    kChunkTimeout,       // chunk was not delivered before its deadline
    kStateRootMismatch,  // replayed state does not match the trusted header
    kNoProviders,        // not enough agreeing providers for the target
};

std::string_view to_string(SnapshotError error);

std::ostream& operator<<(std::ostream& out, SnapshotError error);

}  // namespace snapsync::snapshots
