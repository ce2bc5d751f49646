// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chunk_store.hpp"

#include <fstream>

#include <catch2/catch_test_macros.hpp>

#include <snapsync/infra/common/directories.hpp>
#include <snapsync/infra/test_util/log.hpp>
#include <snapsync/sync/test_util/sample_snapshot.hpp>

namespace snapsync::sync {

using test_util::make_sample_snapshot;

static std::vector<uint32_t> indices_of(const std::vector<ChunkResponse>& responses) {
    std::vector<uint32_t> indices;
    for (const auto& response : responses) {
        indices.push_back(response.chunk.index);
    }
    return indices;
}

static void check_store_semantics(ChunkStore& store, const test_util::SampleSnapshot& sample) {
    const auto& target{sample.header};
    CHECK(store.get_all(target).empty());

    store.put(target, sample.response(3));
    store.put(target, sample.response(0));
    store.put(target, sample.response(2));
    const auto retained{store.get_all(target)};
    CHECK(indices_of(retained) == std::vector<uint32_t>{0, 2, 3});
    CHECK(retained[1] == sample.response(2));

    // the same index is retained once
    store.put(target, sample.response(2));
    CHECK(store.get_all(target).size() == 3);

    // other targets are isolated
    snapshots::TrustedHeader other_block{target.block_number + 1, target.state_root};
    snapshots::TrustedHeader other_root{target.block_number, sample.snapshot->chunk_tree_root};
    CHECK(store.get_all(other_block).empty());
    CHECK(store.get_all(other_root).empty());
    store.put(other_block, sample.response(1));
    CHECK(indices_of(store.get_all(other_block)) == std::vector<uint32_t>{1});

    store.remove_all(target);
    CHECK(store.get_all(target).empty());
    CHECK(store.get_all(other_block).size() == 1);
}

TEST_CASE("InMemoryChunkStore", "[snapsync][sync][chunk_store]") {
    const auto sample{make_sample_snapshot(100)};
    REQUIRE(sample.chunk_count() > 4);
    InMemoryChunkStore store;
    check_store_semantics(store, sample);
}

TEST_CASE("FileChunkStore", "[snapsync][sync][chunk_store]") {
    snapsync::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const auto sample{make_sample_snapshot(100)};
    REQUIRE(sample.chunk_count() > 4);
    TemporaryDirectory tmp_dir;

    SECTION("store semantics") {
        FileChunkStore store{tmp_dir.path() / "chunks"};
        check_store_semantics(store, sample);
    }

    SECTION("chunks survive restarts") {
        {
            FileChunkStore store{tmp_dir.path()};
            for (uint32_t index{0}; index < sample.chunk_count(); ++index) {
                store.put(sample.header, sample.response(index));
            }
        }
        FileChunkStore store{tmp_dir.path()};
        const auto retained{store.get_all(sample.header)};
        REQUIRE(retained.size() == sample.chunk_count());
        for (uint32_t index{0}; index < sample.chunk_count(); ++index) {
            CHECK(retained[index] == sample.response(index));
        }
    }

    SECTION("one directory per target") {
        FileChunkStore store{tmp_dir.path()};
        store.put(sample.header, sample.response(0));
        const auto target_dir{store.target_path(sample.header)};
        CHECK(target_dir.parent_path() == tmp_dir.path());
        CHECK(target_dir.filename().string().starts_with("100-"));
        CHECK(std::filesystem::exists(target_dir / "0.chunk"));

        store.remove_all(sample.header);
        CHECK(!std::filesystem::exists(target_dir));
    }

    SECTION("unreadable chunk files are discarded") {
        FileChunkStore store{tmp_dir.path()};
        store.put(sample.header, sample.response(0));
        store.put(sample.header, sample.response(1));
        const auto garbage_path{store.target_path(sample.header) / "1.chunk"};
        {
            std::ofstream file{garbage_path, std::ios::binary | std::ios::trunc};
            file << "not a chunk";
        }
        std::ofstream{store.target_path(sample.header) / "notes.txt"} << "ignored";

        CHECK(indices_of(store.get_all(sample.header)) == std::vector<uint32_t>{0});
        CHECK(!std::filesystem::exists(garbage_path));
        CHECK(std::filesystem::exists(store.target_path(sample.header) / "notes.txt"));
    }
}

TEST_CASE("FileChunkStore::decode", "[snapsync][sync][chunk_store]") {
    const auto sample{make_sample_snapshot(100)};
    const auto response{sample.response(2)};
    const Bytes encoded{FileChunkStore::encode(response)};

    SECTION("valid") {
        const auto decoded{FileChunkStore::decode(encoded)};
        REQUIRE(decoded);
        CHECK(*decoded == response);
    }

    SECTION("truncated") {
        const auto decoded{FileChunkStore::decode(ByteView{encoded}.substr(0, encoded.size() - 1))};
        CHECK(!decoded);
    }

    SECTION("trailing bytes") {
        Bytes data{encoded};
        data.push_back(0x00);
        CHECK(!FileChunkStore::decode(data));
    }

    SECTION("empty") {
        CHECK(!FileChunkStore::decode({}));
    }
}

}  // namespace snapsync::sync
