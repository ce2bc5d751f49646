// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chunk.hpp"

#include <cstring>
#include <limits>
#include <optional>

#include <snapsync/core/common/util.hpp>
#include <snapsync/infra/common/ensure.hpp>

namespace snapsync::snapshots {

evmc::bytes32 chunk_content_hash(ByteView payload) {
    const ethash::hash256 hash{keccak256(payload)};
    evmc::bytes32 content_hash;
    std::memcpy(content_hash.bytes, hash.bytes, kHashLength);
    return content_hash;
}

bool SnapshotChunk::has_valid_hash() const {
    return chunk_content_hash(payload) == content_hash;
}

tl::expected<std::vector<SnapshotChunk>, SnapshotError> chunk_records(const std::vector<StateRecord>& records,
                                                                      size_t target_size) {
    std::vector<SnapshotChunk> chunks;
    std::optional<SnapshotChunk> current;

    const auto seal = [&]() {
        current->content_hash = chunk_content_hash(current->payload);
        chunks.push_back(std::move(*current));
        current.reset();
    };

    Bytes encoded;
    for (const auto& record : records) {
        encoded.clear();
        rlp::encode(encoded, record);
        if (encoded.size() > target_size) {
            return tl::unexpected{SnapshotError::kEncodingError};
        }

        const RecordKind kind{record_kind(record)};
        if (current && (current->kind != kind || current->payload.size() + encoded.size() > target_size)) {
            seal();
        }
        if (!current) {
            ensure(chunks.size() < std::numeric_limits<uint32_t>::max(), "chunk_records: too many chunks");
            current = SnapshotChunk{.index = static_cast<uint32_t>(chunks.size()), .kind = kind};
        }
        current->payload.append(encoded);
    }
    if (current) {
        seal();
    }

    return chunks;
}

template <class Record>
static DecodingResult decode_records(ByteView payload, std::vector<StateRecord>& records) {
    while (!payload.empty()) {
        Record record;
        if (DecodingResult res{rlp::decode(payload, record, rlp::Leftover::kAllow)}; !res) {
            return res;
        }
        records.emplace_back(std::move(record));
    }
    return {};
}

tl::expected<std::vector<StateRecord>, DecodingError> decode_chunk(const SnapshotChunk& chunk) {
    std::vector<StateRecord> records;
    DecodingResult res;
    switch (chunk.kind) {
        case RecordKind::kAccount:
            res = decode_records<AccountRecord>(chunk.payload, records);
            break;
        case RecordKind::kStorage:
            res = decode_records<StorageRecord>(chunk.payload, records);
            break;
        case RecordKind::kCode:
            res = decode_records<CodeRecord>(chunk.payload, records);
            break;
        default:
            res = tl::unexpected{DecodingError::kInvalidFieldset};
    }
    if (!res) {
        return tl::unexpected{res.error()};
    }
    if (records.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    return records;
}

}  // namespace snapsync::snapshots
