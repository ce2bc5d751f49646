// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "state_record.hpp"

#include <sstream>

#include <snapsync/core/common/util.hpp>
#include <snapsync/core/rlp/decode_vector.hpp>
#include <snapsync/core/rlp/encode.hpp>
#include <snapsync/core/types/address.hpp>
#include <snapsync/core/types/evmc_bytes32.hpp>

namespace snapsync::snapshots {

RecordKind record_kind(const StateRecord& record) {
    return static_cast<RecordKind>(record.index());
}

std::string to_string(const StateRecord& record) {
    std::stringstream out;
    if (const auto* account{std::get_if<AccountRecord>(&record)}) {
        out << "account " << account->address << " " << account->account().to_string()
            << " storage_root: 0x" << to_hex(account->storage_root);
    } else if (const auto* storage{std::get_if<StorageRecord>(&record)}) {
        out << "storage " << storage->address << " location: 0x" << to_hex(storage->location)
            << " value: 0x" << to_hex(storage->value);
    } else {
        const auto& code{std::get<CodeRecord>(record)};
        out << "code 0x" << to_hex(code.code_hash) << " size: " << code.code.size();
    }
    return out.str();
}

}  // namespace snapsync::snapshots

namespace snapsync::rlp {

using snapshots::AccountRecord;
using snapshots::CodeRecord;
using snapshots::StorageRecord;

static Header header(const AccountRecord& r) {
    Header h{.list = true};
    h.payload_length += length(r.address);
    h.payload_length += length(r.nonce);
    h.payload_length += length(r.balance);
    h.payload_length += kHashLength + 1;
    h.payload_length += kHashLength + 1;
    return h;
}

static Header header(const StorageRecord& r) {
    Header h{.list = true};
    h.payload_length += length(r.address);
    h.payload_length += 2 * (kHashLength + 1);
    return h;
}

static Header header(const CodeRecord& r) {
    Header h{.list = true};
    h.payload_length += kHashLength + 1;
    h.payload_length += length(ByteView{r.code});
    return h;
}

size_t length(const AccountRecord& record) {
    const Header rlp_head{header(record)};
    return length_of_length(rlp_head.payload_length) + rlp_head.payload_length;
}

size_t length(const StorageRecord& record) {
    const Header rlp_head{header(record)};
    return length_of_length(rlp_head.payload_length) + rlp_head.payload_length;
}

size_t length(const CodeRecord& record) {
    const Header rlp_head{header(record)};
    return length_of_length(rlp_head.payload_length) + rlp_head.payload_length;
}

void encode(Bytes& to, const AccountRecord& record) {
    encode_header(to, header(record));
    encode(to, record.address);
    encode(to, record.nonce);
    encode(to, record.balance);
    encode(to, record.code_hash);
    encode(to, record.storage_root);
}

void encode(Bytes& to, const StorageRecord& record) {
    encode_header(to, header(record));
    encode(to, record.address);
    encode(to, record.location);
    encode(to, record.value);
}

void encode(Bytes& to, const CodeRecord& record) {
    encode_header(to, header(record));
    encode(to, record.code_hash);
    encode(to, ByteView{record.code});
}

void encode(Bytes& to, const snapshots::StateRecord& record) {
    std::visit([&to](const auto& r) { encode(to, r); }, record);
}

DecodingResult decode(ByteView& from, AccountRecord& to, Leftover mode) noexcept {
    return decode(from, mode, to.address.bytes, to.nonce, to.balance, to.code_hash.bytes, to.storage_root.bytes);
}

DecodingResult decode(ByteView& from, StorageRecord& to, Leftover mode) noexcept {
    return decode(from, mode, to.address.bytes, to.location.bytes, to.value.bytes);
}

DecodingResult decode(ByteView& from, CodeRecord& to, Leftover mode) noexcept {
    return decode(from, mode, to.code_hash.bytes, to.code);
}

}  // namespace snapsync::rlp
