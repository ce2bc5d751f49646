// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "timeout.hpp"

#include <stdexcept>
#include <string>

#include <boost/asio/this_coro.hpp>
#include <catch2/catch_test_macros.hpp>

#include <snapsync/infra/concurrency/awaitable_wait_for_one.hpp>
#include <snapsync/infra/concurrency/sleep.hpp>
#include <snapsync/infra/test_util/task_runner.hpp>

namespace snapsync::concurrency {

using namespace std::chrono_literals;
using namespace awaitable_wait_for_one;

namespace {

    struct ProviderFailure : std::runtime_error {
        ProviderFailure() : std::runtime_error{"provider failure"} {}
    };

    Task<std::string> fetch_after(std::chrono::milliseconds delay) {
        co_await sleep(delay);
        co_return std::string{"chunk"};
    }

    Task<void> fail_immediately() {
        co_await boost::asio::this_coro::executor;
        throw ProviderFailure{};
    }

}  // namespace

TEST_CASE("timeout", "[snapsync][infra][concurrency]") {
    test_util::TaskRunner runner;

    SECTION("expires alone") {
        CHECK_THROWS_AS(runner.run(SNAP_CONCURRENCY_TIMEOUT(1ms)), TimeoutExpiredError);
    }

    SECTION("loses against a faster operation") {
        auto result = runner.run(fetch_after(1ms) || timeout(1h));
        REQUIRE(result.index() == 0);
        CHECK(std::get<0>(result) == "chunk");
    }

    SECTION("wins against a slower operation") {
        CHECK_THROWS_AS(runner.run(fetch_after(1h) || timeout(5ms)), TimeoutExpiredError);
        CHECK_THROWS_AS(runner.run(sleep(1h) || timeout(5ms)), TimeoutExpiredError);
    }

    SECTION("does not hide a failure coming first") {
        CHECK_THROWS_AS(runner.run(fail_immediately() || timeout(1h)), ProviderFailure);
        CHECK_THROWS_AS(runner.run(timeout(1h) || fail_immediately()), ProviderFailure);
    }

    SECTION("cancelled timeout completes silently") {
        CHECK_NOTHROW(runner.run(sleep(1ms) || timeout(1h)));
    }
}

TEST_CASE("TimeoutExpiredError", "[snapsync][infra][concurrency]") {
    const TimeoutExpiredError error;
    CHECK(std::string{error.what()}.find("timeout") != std::string::npos);
}

}  // namespace snapsync::concurrency
