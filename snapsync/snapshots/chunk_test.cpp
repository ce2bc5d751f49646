// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chunk.hpp"

#include <catch2/catch_test_macros.hpp>

#include <snapsync/core/common/util.hpp>
#include <snapsync/snapshots/creator.hpp>
#include <snapsync/snapshots/test_util/sample_state.hpp>

namespace snapsync::snapshots {

static size_t encoded_size(const StateRecord& record) {
    Bytes encoded;
    rlp::encode(encoded, record);
    return encoded.size();
}

TEST_CASE("chunk_records", "[snapsync][snapshots][chunk]") {
    const auto records{canonical_order(test_util::sample_state_records(10, 4, 100))};

    SECTION("no records produce no chunks") {
        const auto chunks{chunk_records({}, 1024)};
        REQUIRE(chunks);
        CHECK(chunks->empty());
    }

    SECTION("payload never exceeds target size and records are never split") {
        const size_t target_size{300};
        const auto chunks{chunk_records(records, target_size)};
        REQUIRE(chunks);
        REQUIRE(chunks->size() > 3);

        size_t decoded_count{0};
        for (size_t i{0}; i < chunks->size(); ++i) {
            const auto& chunk{(*chunks)[i]};
            CHECK(chunk.index == i);
            CHECK(!chunk.payload.empty());
            CHECK(chunk.payload.size() <= target_size);
            CHECK(chunk.has_valid_hash());

            const auto decoded{decode_chunk(chunk)};
            REQUIRE(decoded);
            for (const auto& record : *decoded) {
                CHECK(record_kind(record) == chunk.kind);
                CHECK(record == records[decoded_count++]);
            }
        }
        CHECK(decoded_count == records.size());
    }

    SECTION("chunks never mix record kinds") {
        const auto chunks{chunk_records(records, 16_Mebi)};
        REQUIRE(chunks);
        REQUIRE(chunks->size() == 3);
        CHECK((*chunks)[0].kind == RecordKind::kAccount);
        CHECK((*chunks)[1].kind == RecordKind::kStorage);
        CHECK((*chunks)[2].kind == RecordKind::kCode);
    }

    SECTION("chunking is deterministic") {
        const auto chunks1{chunk_records(records, 500)};
        const auto chunks2{chunk_records(records, 500)};
        REQUIRE(chunks1);
        REQUIRE(chunks2);
        CHECK(*chunks1 == *chunks2);
    }

    SECTION("oversized record") {
        const StateRecord code{CodeRecord{.code_hash = kEmptyHash, .code = Bytes(1000, 0x60)}};
        CHECK(chunk_records({code}, encoded_size(code)));
        const auto chunks{chunk_records({code}, encoded_size(code) - 1)};
        REQUIRE(!chunks);
        CHECK(chunks.error() == SnapshotError::kEncodingError);
        CHECK(chunk_records({code}, 0).error() == SnapshotError::kEncodingError);
    }
}

TEST_CASE("decode_chunk", "[snapsync][snapshots][chunk]") {
    const auto records{canonical_order(test_util::sample_state_records(4, 2, 10))};
    auto chunks{chunk_records(records, 16_Mebi)};
    REQUIRE(chunks);
    SnapshotChunk chunk{(*chunks)[0]};

    SECTION("trailing garbage") {
        chunk.payload.push_back(0x01);
        CHECK(!decode_chunk(chunk));
    }

    SECTION("truncated payload") {
        chunk.payload.pop_back();
        CHECK(!decode_chunk(chunk));
    }

    SECTION("wrong declared kind") {
        chunk.kind = RecordKind::kStorage;
        CHECK(!decode_chunk(chunk));
    }

    SECTION("empty payload") {
        chunk.payload.clear();
        CHECK(!decode_chunk(chunk));
    }
}

}  // namespace snapsync::snapshots
