// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>

#include <snapsync/core/common/base.hpp>

namespace snapsync::snapshots {

//! The settings for splitting state records into snapshot chunks
struct ChunkingSettings {
    constexpr static size_t kDefaultTargetChunkSize{16_Mebi};

    //! Upper bound on the payload size of a single chunk
    size_t target_chunk_size{kDefaultTargetChunkSize};
};

//! The settings for verifying downloaded snapshots
struct VerifierSettings {
    constexpr static size_t kDefaultCrossCheckThreshold{2};

    //! Number of distinct providers that must advertise the same chunk tree root (0 disables cross-checking)
    size_t cross_check_threshold{kDefaultCrossCheckThreshold};
};

}  // namespace snapsync::snapshots
