// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace snapsync::sync {

//! Counters of a chunk download job
struct DownloadStatistics {
    std::chrono::steady_clock::time_point start_tp{std::chrono::steady_clock::now()};
    std::chrono::steady_clock::duration elapsed() const;

    uint64_t requested_chunks{0};
    uint64_t received_chunks{0};
    uint64_t accepted_chunks{0};
    uint64_t restored_chunks{0};  // reused from the chunk store
    uint64_t received_bytes{0};
    uint64_t rejected_chunks() const { return received_chunks - accepted_chunks; }

    struct RejectCauses {
        uint64_t not_requested{0};
        uint64_t duplicated{0};
        uint64_t corrupt{0};
    } reject_causes;

    uint64_t timed_out_requests{0};
    uint64_t undelivered_chunks{0};

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& os, const DownloadStatistics& stats);

}  // namespace snapsync::sync
