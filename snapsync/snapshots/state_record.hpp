// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <snapsync/core/common/bytes.hpp>
#include <snapsync/core/common/empty_hashes.hpp>
#include <snapsync/core/rlp/decode.hpp>
#include <snapsync/core/types/account.hpp>

namespace snapsync::snapshots {

//! The kind of state entries a chunk carries, in canonical snapshot order
enum class RecordKind : uint8_t {
    kAccount = 0,
    kStorage = 1,
    kCode = 2,
};

//! An account leaf of the state trie together with the root of its storage trie
struct AccountRecord {
    evmc::address address;
    uint64_t nonce{0};
    intx::uint256 balance;
    evmc::bytes32 code_hash{kEmptyHash};
    evmc::bytes32 storage_root{kEmptyRoot};

    Account account() const { return {.nonce = nonce, .balance = balance, .code_hash = code_hash}; }

    friend bool operator==(const AccountRecord&, const AccountRecord&) = default;
};

//! A non-zero storage slot of an account
struct StorageRecord {
    evmc::address address;
    evmc::bytes32 location;
    evmc::bytes32 value;

    friend bool operator==(const StorageRecord&, const StorageRecord&) = default;
};

//! Contract bytecode addressed by its hash
struct CodeRecord {
    evmc::bytes32 code_hash;
    Bytes code;

    friend bool operator==(const CodeRecord&, const CodeRecord&) = default;
};

using StateRecord = std::variant<AccountRecord, StorageRecord, CodeRecord>;

RecordKind record_kind(const StateRecord& record);

std::string to_string(const StateRecord& record);

}  // namespace snapsync::snapshots

namespace snapsync::rlp {

size_t length(const snapshots::AccountRecord& record);
size_t length(const snapshots::StorageRecord& record);
size_t length(const snapshots::CodeRecord& record);

void encode(Bytes& to, const snapshots::AccountRecord& record);
void encode(Bytes& to, const snapshots::StorageRecord& record);
void encode(Bytes& to, const snapshots::CodeRecord& record);
void encode(Bytes& to, const snapshots::StateRecord& record);

DecodingResult decode(ByteView& from, snapshots::AccountRecord& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, snapshots::StorageRecord& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, snapshots::CodeRecord& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace snapsync::rlp
