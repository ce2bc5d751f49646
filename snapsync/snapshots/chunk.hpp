// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <snapsync/core/common/bytes.hpp>
#include <snapsync/core/common/decoding_result.hpp>
#include <snapsync/snapshots/snapshot_error.hpp>
#include <snapsync/snapshots/state_record.hpp>

namespace snapsync::snapshots {

//! A contiguous run of same-kind state records, the unit of transfer and verification
struct SnapshotChunk {
    uint32_t index{0};
    RecordKind kind{RecordKind::kAccount};
    Bytes payload;               // concatenated RLP encodings of the records
    evmc::bytes32 content_hash;  // keccak256 of payload

    //! Checks that content_hash is the hash of the current payload
    bool has_valid_hash() const;

    friend bool operator==(const SnapshotChunk&, const SnapshotChunk&) = default;
};

//! Computes the content hash of a chunk payload
evmc::bytes32 chunk_content_hash(ByteView payload);

//! \brief Packs ordered state records into chunks whose payload does not exceed target_size
//! \details Records are never split across chunks and a chunk never mixes record kinds. The same input always
//! produces the same chunks.
//! \return the chunks in index order or SnapshotError::kEncodingError if a single record exceeds target_size
tl::expected<std::vector<SnapshotChunk>, SnapshotError> chunk_records(const std::vector<StateRecord>& records,
                                                                      size_t target_size);

//! \brief Decodes the records of a chunk according to its declared kind
tl::expected<std::vector<StateRecord>, DecodingError> decode_chunk(const SnapshotChunk& chunk);

}  // namespace snapsync::snapshots
