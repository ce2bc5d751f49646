// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include <snapsync/infra/concurrency/task.hpp>
#include <snapsync/sync/settings.hpp>

namespace snapsync::sync {

/**
 * BandwidthBudget is a credit bucket limiting the bytes transferred per second by all chunk transfers.
 *
 * Credits are refilled at the configured rate up to the burst size. A transfer is admitted as long as
 * some credit is left and then takes its whole size, possibly driving the balance negative: large
 * transfers are never starved by small ones and the debt is repaid by the following refills.
 * All operations are lock-free.
 */
class BandwidthBudget {
  public:
    using Clock = std::chrono::steady_clock;

    explicit BandwidthBudget(BandwidthSettings settings, Clock::time_point now = Clock::now());

    // Not copyable nor movable
    BandwidthBudget(const BandwidthBudget&) = delete;
    BandwidthBudget& operator=(const BandwidthBudget&) = delete;

    bool unlimited() const { return settings_.rate_limit == 0; }

    //! Takes credit for a transfer of the given size if any credit is available
    bool try_consume(uint64_t size, Clock::time_point now = Clock::now());

    //! Waits until credit is available, then takes credit for a transfer of the given size
    Task<void> consume(uint64_t size);

    //! Current credit balance (negative when in debt)
    int64_t available(Clock::time_point now = Clock::now());

    //! Total number of bytes admitted so far
    uint64_t consumed_bytes() const { return consumed_bytes_.load(std::memory_order_relaxed); }

  private:
    void refill(Clock::time_point now);

    BandwidthSettings settings_;
    std::atomic<int64_t> credits_;
    std::atomic<int64_t> last_refill_us_;
    std::atomic<uint64_t> consumed_bytes_{0};
};

}  // namespace snapsync::sync
