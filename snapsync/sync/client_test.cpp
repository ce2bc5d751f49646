// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <filesystem>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <boost/asio/this_coro.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <snapsync/infra/test_util/log.hpp>
#include <snapsync/infra/test_util/task_runner.hpp>
#include <snapsync/snapshots/creator.hpp>
#include <snapsync/snapshots/test_util/sample_state.hpp>
#include <snapsync/sync/server.hpp>
#include <snapsync/sync/test_util/loopback_peer_network.hpp>
#include <snapsync/sync/test_util/sample_snapshot.hpp>

namespace snapsync::sync {

using namespace std::chrono_literals;
using testing::_;
using testing::Invoke;
using test_util::make_peer;
using test_util::ProviderBehavior;

static constexpr BlockNum kBlock{5'000};

namespace {

    //! InMemoryChunkStore whose disk-like operations can be made to fail
    class FailingChunkStore : public InMemoryChunkStore {
      public:
        std::vector<ChunkResponse> get_all(const snapshots::TrustedHeader& target) override {
            if (fail_reads) throw_io_error("get_all");
            return InMemoryChunkStore::get_all(target);
        }

        void remove_all(const snapshots::TrustedHeader& target) override {
            if (fail_removals) throw_io_error("remove_all");
            InMemoryChunkStore::remove_all(target);
        }

        bool fail_reads{false};
        bool fail_removals{false};

      private:
        [[noreturn]] static void throw_io_error(const char* operation) {
            throw std::filesystem::filesystem_error{operation, std::make_error_code(std::errc::io_error)};
        }
    };

    Task<std::vector<snapshots::SnapshotAnnouncement>> discover_with_error(BlockNum) {
        co_await boost::asio::this_coro::executor;
        throw std::runtime_error{"discovery service unreachable"};
    }

    Task<std::vector<snapshots::SnapshotAnnouncement>> discover_with_system_error(BlockNum) {
        co_await boost::asio::this_coro::executor;
        throw boost::system::system_error{make_error_code(boost::system::errc::host_unreachable)};
    }

}  // namespace

static SnapshotSyncSettings fast_settings() {
    SnapshotSyncSettings settings;
    settings.bandwidth.rate_limit = 0;
    settings.download.request_timeout = 100ms;
    settings.download.job_timeout = 3s;
    settings.download.discovery_timeout = 200ms;
    settings.download.discovery_poll_interval = 5ms;
    return settings;
}

class SnapshotClientTest : public snapsync::test_util::TaskRunner {
  protected:
    explicit SnapshotClientTest(SnapshotSyncSettings sync_settings = fast_settings()) : settings{sync_settings} {
        header_chain.add_header(sample.header);
        ON_CALL(materializer, import_verified_records(_))
            .WillByDefault(Invoke([this](std::vector<snapshots::StateRecord> records) {
                imported.push_back(std::move(records));
            }));
    }

    //! Starts providers announcing the given snapshot
    void add_providers(const std::vector<PeerId>& providers, std::shared_ptr<const snapshots::Snapshot> snapshot) {
        for (const auto& provider : providers) {
            auto server{std::make_unique<SnapshotServer>(provider, network, server_context, settings.server)};
            server->add_snapshot(snapshot);
            network.add_server(*server);
            run(server->announce());
            servers.push_back(std::move(server));
        }
    }

    void add_providers(const std::vector<PeerId>& providers) { add_providers(providers, sample.snapshot); }

    SyncResult sync(BlockNum block_number = kBlock) { return run(client.sync(block_number)); }

    snapsync::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::SampleSnapshot sample{test_util::make_sample_snapshot(kBlock)};
    SnapshotSyncSettings settings;
    test_util::LoopbackPeerNetwork network;
    DistributorContext server_context{settings};
    DistributorContext client_context{settings};
    snapshots::test_util::InMemoryHeaderChain header_chain;
    testing::NiceMock<snapshots::test_util::MockStateMaterializer> materializer;
    std::vector<std::vector<snapshots::StateRecord>> imported;
    InMemoryChunkStore chunk_store;
    std::vector<std::unique_ptr<SnapshotServer>> servers;
    SnapshotClient client{network, header_chain, materializer, chunk_store, client_context, settings};
};

class SingleChunkRequestsClientTest : public SnapshotClientTest {
  protected:
    static SnapshotSyncSettings single_chunk_settings() {
        auto single{fast_settings()};
        single.download.max_in_flight_chunks_per_provider = 1;
        single.download.max_chunks_per_request = 1;
        return single;
    }

    SingleChunkRequestsClientTest() : SnapshotClientTest{single_chunk_settings()} {}
};

class ShortJobClientTest : public SnapshotClientTest {
  protected:
    static SnapshotSyncSettings short_job_settings() {
        auto short_job{fast_settings()};
        short_job.download.job_timeout = 300ms;
        return short_job;
    }

    ShortJobClientTest() : SnapshotClientTest{short_job_settings()} {}
};

TEST_CASE_METHOD(SnapshotClientTest, "SnapshotClient::sync from honest providers", "[snapsync][sync][client]") {
    REQUIRE(sample.chunk_count() > 4);
    add_providers({make_peer(1), make_peer(2), make_peer(3)});
    EXPECT_CALL(materializer, import_verified_records(_)).Times(1);

    const auto result{sync()};
    REQUIRE(std::holds_alternative<SyncCompleted>(result));
    CHECK(std::get<SyncCompleted>(result).block_number == kBlock);

    REQUIRE(imported.size() == 1);
    CHECK(imported[0] == sample.records);
    CHECK(chunk_store.get_all(sample.header).empty());

    const auto& stats{client.last_statistics()};
    REQUIRE(stats);
    CHECK(stats->accepted_chunks == sample.chunk_count());
    CHECK(stats->reject_causes.corrupt == 0);
    for (uint32_t index{0}; index < sample.chunk_count(); ++index) {
        CHECK(network.request_count(index) == 1);
    }
}

TEST_CASE_METHOD(SnapshotClientTest, "SnapshotClient::sync without trusted header", "[snapsync][sync][client]") {
    add_providers({make_peer(1), make_peer(2)});
    EXPECT_CALL(materializer, import_verified_records(_)).Times(0);

    const auto result{sync(kBlock + 1)};
    REQUIRE(std::holds_alternative<SyncAborted>(result));
    CHECK(std::get<SyncAborted>(result).reason == AbortReason::kVerificationFailed);
    CHECK(std::get<SyncAborted>(result).detail == "no trusted header for block");
    CHECK(network.requests().empty());
    CHECK(imported.empty());
}

TEST_CASE_METHOD(SnapshotClientTest, "SnapshotClient::sync without enough providers", "[snapsync][sync][client]") {
    EXPECT_CALL(materializer, import_verified_records(_)).Times(0);

    SECTION("nobody announces") {
        const auto result{sync()};
        REQUIRE(std::holds_alternative<SyncAborted>(result));
        CHECK(std::get<SyncAborted>(result).reason == AbortReason::kNoProviders);
    }

    SECTION("a single provider is not trusted") {
        add_providers({make_peer(1)});
        const auto result{sync()};
        REQUIRE(std::holds_alternative<SyncAborted>(result));
        CHECK(std::get<SyncAborted>(result).reason == AbortReason::kNoProviders);
        CHECK(network.requests().empty());
    }

    SECTION("providers of another state are ignored") {
        const auto other{test_util::make_sample_snapshot(kBlock, 8)};
        add_providers({make_peer(1), make_peer(2)}, other.snapshot);
        const auto result{sync()};
        REQUIRE(std::holds_alternative<SyncAborted>(result));
        CHECK(std::get<SyncAborted>(result).reason == AbortReason::kNoProviders);
    }
    CHECK(imported.empty());
}

TEST_CASE_METHOD(SnapshotClientTest, "SnapshotClient::sync forged snapshot", "[snapsync][sync][client]") {
    // providers agree on a snapshot claiming the trusted state root for a different state
    auto records{snapshots::test_util::sample_state_records(16, 4, 120)};
    for (auto& record : records) {
        if (auto* account{std::get_if<snapshots::AccountRecord>(&record)}) {
            account->balance += 1;
            break;
        }
    }
    snapshots::test_util::InMemoryStateProvider dishonest_provider;
    dishonest_provider.add_state(kBlock, records, sample.header.state_root);
    snapshots::SnapshotCreator dishonest_creator{dishonest_provider, snapshots::ChunkingSettings{.target_chunk_size = 512}};
    auto forged{dishonest_creator.create_snapshot(kBlock)};
    REQUIRE(forged);
    add_providers({make_peer(1), make_peer(2)}, std::make_shared<const snapshots::Snapshot>(std::move(*forged)));
    EXPECT_CALL(materializer, import_verified_records(_)).Times(0);

    const auto result{sync()};
    REQUIRE(std::holds_alternative<SyncAborted>(result));
    CHECK(std::get<SyncAborted>(result).reason == AbortReason::kVerificationFailed);
    CHECK(std::get<SyncAborted>(result).detail == snapshots::to_string(snapshots::SnapshotError::kStateRootMismatch));
    CHECK(imported.empty());
    CHECK(chunk_store.get_all(sample.header).empty());
}

TEST_CASE_METHOD(SingleChunkRequestsClientTest, "SnapshotClient::sync with a corrupting provider",
                 "[snapsync][sync][client]") {
    const PeerId p1{make_peer(1)};
    const PeerId p2{make_peer(2)};
    add_providers({p1, p2});
    network.set_behavior(p2, ProviderBehavior::kCorruptOnce, {1});
    EXPECT_CALL(materializer, import_verified_records(_)).Times(1);

    const auto result{sync()};
    REQUIRE(std::holds_alternative<SyncCompleted>(result));
    REQUIRE(imported.size() == 1);
    CHECK(imported[0] == sample.records);

    // the corrupt chunk is fetched again from the honest provider only
    CHECK(network.request_count(p2, 1) == 1);
    CHECK(network.request_count(p1, 1) == 1);
    CHECK(client.last_statistics()->reject_causes.corrupt == 1);
    CHECK(client_context.reputation().is_deprioritized(p2));
    CHECK(!client_context.reputation().is_deprioritized(p1));
}

TEST_CASE_METHOD(SnapshotClientTest, "SnapshotClient::sync with unresponsive providers", "[snapsync][sync][client]") {
    const PeerId p1{make_peer(1)};
    const PeerId p2{make_peer(2)};
    add_providers({p1, p2});
    EXPECT_CALL(materializer, import_verified_records(_)).Times(1);

    SECTION("hanging provider") {
        network.set_behavior(p1, ProviderBehavior::kHang);
    }

    SECTION("failing provider") {
        network.set_behavior(p1, ProviderBehavior::kFail);
    }

    SECTION("provider failing with a non-network error") {
        network.set_behavior(p1, ProviderBehavior::kBreakDown);
    }

    SECTION("provider missing some chunks") {
        network.set_behavior(p1, ProviderBehavior::kDropChunks, {0, 2});
    }

    const auto result{sync()};
    REQUIRE(std::holds_alternative<SyncCompleted>(result));
    REQUIRE(imported.size() == 1);
    CHECK(imported[0] == sample.records);
}

TEST_CASE_METHOD(ShortJobClientTest, "SnapshotClient::sync job timeout", "[snapsync][sync][client]") {
    add_providers({make_peer(1), make_peer(2)});
    network.set_behavior(make_peer(1), ProviderBehavior::kHang);
    network.set_behavior(make_peer(2), ProviderBehavior::kHang);
    EXPECT_CALL(materializer, import_verified_records(_)).Times(0);

    const auto result{sync()};
    REQUIRE(std::holds_alternative<SyncAborted>(result));
    CHECK(std::get<SyncAborted>(result).reason == AbortReason::kTimeout);
    CHECK(client.last_statistics()->timed_out_requests > 0);
    CHECK(imported.empty());
}

TEST_CASE_METHOD(ShortJobClientTest, "SnapshotClient::sync resumes from retained chunks", "[snapsync][sync][client]") {
    const std::set<uint32_t> missing{3, 4};
    add_providers({make_peer(1), make_peer(2)});
    network.set_behavior(make_peer(1), ProviderBehavior::kDropChunks, missing);
    network.set_behavior(make_peer(2), ProviderBehavior::kDropChunks, missing);
    EXPECT_CALL(materializer, import_verified_records(_)).Times(1);

    const auto interrupted{sync()};
    REQUIRE(std::holds_alternative<SyncAborted>(interrupted));
    REQUIRE(std::get<SyncAborted>(interrupted).reason == AbortReason::kTimeout);
    CHECK(imported.empty());
    CHECK(chunk_store.get_all(sample.header).size() == sample.chunk_count() - missing.size());

    network.set_behavior(make_peer(1), ProviderBehavior::kHonest);
    network.set_behavior(make_peer(2), ProviderBehavior::kHonest);
    const size_t previous_requests{network.requests().size()};

    const auto resumed{sync()};
    REQUIRE(std::holds_alternative<SyncCompleted>(resumed));
    REQUIRE(imported.size() == 1);
    CHECK(imported[0] == sample.records);
    CHECK(client.last_statistics()->restored_chunks == sample.chunk_count() - missing.size());

    // only the missing chunks are requested again
    for (size_t i{previous_requests}; i < network.requests().size(); ++i) {
        for (const uint32_t index : network.requests()[i].second.chunk_indices) {
            CHECK(missing.contains(index));
        }
    }
    CHECK(chunk_store.get_all(sample.header).empty());
}

TEST_CASE_METHOD(SnapshotClientTest, "SnapshotClient::sync with failing discovery", "[snapsync][sync][client]") {
    add_providers({make_peer(1), make_peer(2)});
    testing::NiceMock<test_util::MockSnapshotPeerNetwork> flaky_network;
    ON_CALL(flaky_network, request_chunks(_, _)).WillByDefault(Invoke([this](PeerId provider, ChunkRequest request) {
        return network.request_chunks(std::move(provider), std::move(request));
    }));
    SnapshotClient flaky_client{flaky_network, header_chain, materializer, chunk_store, client_context, settings};

    SECTION("discovery never answers") {
        EXPECT_CALL(flaky_network, discover(kBlock))
            .WillOnce(Invoke(discover_with_system_error))
            .WillRepeatedly(Invoke(discover_with_error));
        EXPECT_CALL(materializer, import_verified_records(_)).Times(0);

        const auto result{run(flaky_client.sync(kBlock))};
        REQUIRE(std::holds_alternative<SyncAborted>(result));
        CHECK(std::get<SyncAborted>(result).reason == AbortReason::kNoProviders);
        CHECK(imported.empty());
    }

    SECTION("discovery recovers") {
        EXPECT_CALL(flaky_network, discover(kBlock))
            .WillOnce(Invoke(discover_with_error))
            .WillRepeatedly(Invoke([this](BlockNum block_number) { return network.discover(block_number); }));
        EXPECT_CALL(materializer, import_verified_records(_)).Times(1);

        const auto result{run(flaky_client.sync(kBlock))};
        REQUIRE(std::holds_alternative<SyncCompleted>(result));
        REQUIRE(imported.size() == 1);
        CHECK(imported[0] == sample.records);
    }
}

TEST_CASE_METHOD(SnapshotClientTest, "SnapshotClient::sync with failing chunk store", "[snapsync][sync][client]") {
    add_providers({make_peer(1), make_peer(2)});
    FailingChunkStore failing_store;
    SnapshotClient store_client{network, header_chain, materializer, failing_store, client_context, settings};
    EXPECT_CALL(materializer, import_verified_records(_)).Times(1);

    SECTION("retained chunks cannot be read") {
        failing_store.fail_reads = true;
    }

    SECTION("retained chunks cannot be discarded after import") {
        failing_store.fail_removals = true;
    }

    const auto result{run(store_client.sync(kBlock))};
    REQUIRE(std::holds_alternative<SyncCompleted>(result));
    REQUIRE(imported.size() == 1);
    CHECK(imported[0] == sample.records);
    CHECK(store_client.last_statistics()->accepted_chunks == sample.chunk_count());
}

TEST_CASE("SyncResult output", "[snapsync][sync][client]") {
    std::stringstream out;
    out << SyncResult{SyncCompleted{42}};
    CHECK(out.str() == "Completed(42)");
    out.str("");
    out << SyncResult{SyncAborted{AbortReason::kNoProviders, "nobody"}};
    CHECK(out.str() == "Aborted(kNoProviders: nobody)");
}

}  // namespace snapsync::sync
