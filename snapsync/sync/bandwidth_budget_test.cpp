// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bandwidth_budget.hpp"

#include <limits>

#include <catch2/catch_test_macros.hpp>

#include <snapsync/infra/test_util/task_runner.hpp>

namespace snapsync::sync {

using namespace std::chrono_literals;

TEST_CASE("BandwidthBudget::try_consume", "[snapsync][sync][bandwidth]") {
    const auto t0{BandwidthBudget::Clock::now()};
    BandwidthBudget budget{BandwidthSettings{.rate_limit = 1'000, .burst_size = 2'000}, t0};
    CHECK(!budget.unlimited());
    CHECK(budget.available(t0) == 2'000);

    SECTION("transfer is admitted while credit is left") {
        CHECK(budget.try_consume(1'500, t0));
        CHECK(budget.available(t0) == 500);
        CHECK(budget.try_consume(1'000, t0));
        CHECK(budget.available(t0) == -500);
        CHECK(!budget.try_consume(1, t0));
        CHECK(budget.consumed_bytes() == 2'500);
    }

    SECTION("debt is repaid by refills") {
        REQUIRE(budget.try_consume(2'500, t0));
        CHECK(!budget.try_consume(1, t0 + 100ms));
        CHECK(budget.available(t0 + 500ms) == 0);
        CHECK(budget.try_consume(100, t0 + 1s));
        CHECK(budget.available(t0 + 1s) == 400);
    }

    SECTION("credit never exceeds the burst size") {
        REQUIRE(budget.try_consume(100, t0));
        CHECK(budget.available(t0 + 10s) == 2'000);
        CHECK(budget.available(t0 + 20s) == 2'000);
    }
}

TEST_CASE("BandwidthBudget refill after a long idle period", "[snapsync][sync][bandwidth]") {
    const auto t0{BandwidthBudget::Clock::now()};
    const BandwidthSettings settings{.rate_limit = 64 * kMebi, .burst_size = 16 * kMebi};
    BandwidthBudget budget{settings, t0};
    REQUIRE(budget.try_consume(kMebi, t0));

    // 2^38 us at 2^26 bytes/s is exactly 2^64 byte-microseconds
    CHECK(budget.available(t0 + std::chrono::microseconds{1ull << 38}) == static_cast<int64_t>(settings.burst_size));
    CHECK(budget.available(t0 + 100h) == static_cast<int64_t>(settings.burst_size));
}

TEST_CASE("BandwidthBudget unlimited", "[snapsync][sync][bandwidth]") {
    BandwidthBudget budget{BandwidthSettings{.rate_limit = 0}};
    CHECK(budget.unlimited());
    for (int i{0}; i < 10; ++i) {
        CHECK(budget.try_consume(1_Gibi));
    }
    CHECK(budget.available() == std::numeric_limits<int64_t>::max());
    CHECK(budget.consumed_bytes() == 10 * 1_Gibi);
}

TEST_CASE("BandwidthBudget::consume", "[snapsync][sync][bandwidth]") {
    snapsync::test_util::TaskRunner runner;
    BandwidthBudget budget{BandwidthSettings{.rate_limit = 1'000'000, .burst_size = 1'000}};

    // first transfer drives the balance into debt, the second waits for about 4ms of refill
    runner.run(budget.consume(5'000));
    const auto start{BandwidthBudget::Clock::now()};
    runner.run(budget.consume(10));
    CHECK(BandwidthBudget::Clock::now() - start >= 1ms);
    CHECK(budget.consumed_bytes() == 5'010);
}

}  // namespace snapsync::sync
