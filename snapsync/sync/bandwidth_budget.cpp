// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bandwidth_budget.hpp"

#include <algorithm>
#include <limits>

#include <snapsync/infra/concurrency/sleep.hpp>

namespace snapsync::sync {

using std::chrono::duration_cast;
using std::chrono::microseconds;
using std::chrono::milliseconds;

static int64_t to_microseconds(BandwidthBudget::Clock::time_point tp) {
    return duration_cast<microseconds>(tp.time_since_epoch()).count();
}

BandwidthBudget::BandwidthBudget(BandwidthSettings settings, Clock::time_point now)
    : settings_{settings},
      credits_{static_cast<int64_t>(settings.burst_size)},
      last_refill_us_{to_microseconds(now)} {}

void BandwidthBudget::refill(Clock::time_point now) {
    const int64_t now_us{to_microseconds(now)};
    int64_t last_us{last_refill_us_.load(std::memory_order_relaxed)};
    if (now_us <= last_us) return;
    // only the thread advancing the refill timestamp credits the elapsed interval
    if (!last_refill_us_.compare_exchange_strong(last_us, now_us, std::memory_order_acq_rel)) return;

    // the refill is capped past this interval, which also keeps elapsed_us * rate_limit below 2^64
    const uint64_t max_useful_us{((settings_.burst_size + settings_.rate_limit) / settings_.rate_limit + 1) * 1'000'000};
    const auto elapsed_us{std::min(static_cast<uint64_t>(now_us - last_us), max_useful_us)};
    const auto refill_amount{static_cast<int64_t>(
        std::min<uint64_t>(elapsed_us * settings_.rate_limit / 1'000'000, settings_.burst_size + settings_.rate_limit))};
    const auto burst_size{static_cast<int64_t>(settings_.burst_size)};

    int64_t credits{credits_.load(std::memory_order_relaxed)};
    int64_t refilled{0};
    do {
        refilled = std::min(credits + refill_amount, std::max(credits, burst_size));
    } while (!credits_.compare_exchange_weak(credits, refilled, std::memory_order_acq_rel));
}

bool BandwidthBudget::try_consume(uint64_t size, Clock::time_point now) {
    if (unlimited()) {
        consumed_bytes_.fetch_add(size, std::memory_order_relaxed);
        return true;
    }
    refill(now);

    int64_t credits{credits_.load(std::memory_order_relaxed)};
    do {
        if (credits <= 0) return false;
    } while (!credits_.compare_exchange_weak(credits, credits - static_cast<int64_t>(size), std::memory_order_acq_rel));

    consumed_bytes_.fetch_add(size, std::memory_order_relaxed);
    return true;
}

Task<void> BandwidthBudget::consume(uint64_t size) {
    while (!try_consume(size)) {
        const int64_t debt{1 - available()};
        const auto wait_ms{std::max<int64_t>(debt * 1000 / static_cast<int64_t>(settings_.rate_limit), 1)};
        co_await sleep(milliseconds{wait_ms});
    }
}

int64_t BandwidthBudget::available(Clock::time_point now) {
    if (unlimited()) return std::numeric_limits<int64_t>::max();
    refill(now);
    return credits_.load(std::memory_order_relaxed);
}

}  // namespace snapsync::sync
