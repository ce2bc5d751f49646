// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "statistics.hpp"

#include <iomanip>
#include <sstream>

namespace snapsync::sync {

std::ostream& operator<<(std::ostream& os, const DownloadStatistics& stats) {
    using namespace std::chrono;
    uint64_t perc_received = stats.requested_chunks > 0 ? stats.received_chunks * 100 / stats.requested_chunks : 0;
    uint64_t perc_accepted = stats.received_chunks > 0 ? stats.accepted_chunks * 100 / stats.received_chunks : 0;
    uint64_t perc_rejected = stats.received_chunks > 0 ? stats.rejected_chunks() * 100 / stats.received_chunks : 0;

    os << std::setfill('_')
       << "req=" << std::setw(7) << std::right << stats.requested_chunks << ", "
       << "rec=" << std::setw(7) << std::right << stats.received_chunks << " (" << perc_received << "%) -> "
       << "acc=" << std::setw(7) << std::right << stats.accepted_chunks << " (" << perc_accepted << "%), "
       << "rej=" << std::setw(7) << std::right << stats.rejected_chunks() << " (" << perc_rejected << "%";

    os << ", reasons: "
       << "unr=" << stats.reject_causes.not_requested << ", "
       << "dup=" << stats.reject_causes.duplicated << ", "
       << "bad=" << stats.reject_causes.corrupt << ")";

    os << ", restored=" << stats.restored_chunks
       << ", timeouts=" << stats.timed_out_requests
       << ", undelivered=" << stats.undelivered_chunks
       << ", bytes=" << stats.received_bytes;

    os << " [elapsed(s)=" << duration_cast<seconds>(stats.elapsed()).count() << "]";

    return os;
}

std::chrono::steady_clock::duration DownloadStatistics::elapsed() const {
    return std::chrono::steady_clock::now() - start_tp;
}

std::string DownloadStatistics::to_string() const {
    std::ostringstream os;
    os << *this;
    return os.str();
}

}  // namespace snapsync::sync
