// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "state_root.hpp"

#include <cstring>
#include <map>
#include <optional>

#include <snapsync/core/common/empty_hashes.hpp>
#include <snapsync/core/common/util.hpp>
#include <snapsync/core/rlp/encode.hpp>
#include <snapsync/core/trie/hash_builder.hpp>
#include <snapsync/core/trie/nibbles.hpp>
#include <snapsync/core/types/evmc_bytes32.hpp>
#include <snapsync/infra/common/log.hpp>

namespace snapsync::snapshots {

static Bytes hashed(ByteView data) {
    const ethash::hash256 hash{keccak256(data)};
    return Bytes{hash.bytes, kHashLength};
}

Bytes canonical_key(const StateRecord& record) {
    if (const auto* account{std::get_if<AccountRecord>(&record)}) {
        return hashed(account->address.bytes);
    }
    if (const auto* storage{std::get_if<StorageRecord>(&record)}) {
        return hashed(storage->address.bytes) + hashed(storage->location.bytes);
    }
    return Bytes{std::get<CodeRecord>(record).code_hash.bytes, kHashLength};
}

namespace {

    //! Accumulates the storage trie of one account at a time
    class StorageReplay {
      public:
        bool active() const { return hashed_address_.has_value(); }
        const Bytes& hashed_address() const { return *hashed_address_; }

        void start(Bytes hashed_address) {
            builder_.reset();
            hashed_address_ = std::move(hashed_address);
        }

        void add(ByteView hashed_location, const evmc::bytes32& value) {
            Bytes value_rlp;
            rlp::encode(value_rlp, zeroless_view(value.bytes));
            builder_.add_leaf(trie::unpack_nibbles(hashed_location), value_rlp);
        }

        evmc::bytes32 finish() {
            hashed_address_.reset();
            return builder_.root_hash();
        }

      private:
        std::optional<Bytes> hashed_address_;
        trie::HashBuilder builder_;
    };

}  // namespace

tl::expected<evmc::bytes32, SnapshotError> compute_state_root(const std::vector<StateRecord>& records) {
    // hashed address -> declared storage root
    std::map<Bytes, evmc::bytes32> storage_roots;
    trie::HashBuilder account_trie;
    StorageReplay storage_trie;

    RecordKind previous_kind{RecordKind::kAccount};
    Bytes previous_key;

    const auto close_storage = [&]() -> bool {
        const Bytes hashed_address{storage_trie.hashed_address()};
        const evmc::bytes32 root{storage_trie.finish()};
        auto it{storage_roots.find(hashed_address)};
        if (root != it->second) {
            SNAP_DEBUG << "compute_state_root: storage root mismatch for account 0x" << to_hex(hashed_address)
                       << " declared 0x" << to_hex(it->second) << " replayed 0x" << to_hex(root);
            return false;
        }
        storage_roots.erase(it);
        return true;
    };

    for (const auto& record : records) {
        const RecordKind kind{record_kind(record)};
        Bytes key{canonical_key(record)};

        if (kind < previous_kind || (kind == previous_kind && !previous_key.empty() && key <= previous_key)) {
            SNAP_DEBUG << "compute_state_root: record out of canonical order: " << to_string(record);
            return tl::unexpected{SnapshotError::kMalformedSnapshot};
        }
        if (kind != previous_kind) {
            previous_key.clear();
        }

        if (const auto* account{std::get_if<AccountRecord>(&record)}) {
            storage_roots.emplace(key, account->storage_root);
            account_trie.add_leaf(trie::unpack_nibbles(key), account->account().rlp(account->storage_root));
        } else if (const auto* storage{std::get_if<StorageRecord>(&record)}) {
            if (evmc::is_zero(storage->value)) {
                SNAP_DEBUG << "compute_state_root: zero storage value: " << to_string(record);
                return tl::unexpected{SnapshotError::kMalformedSnapshot};
            }
            Bytes hashed_address{key.substr(0, kHashLength)};
            if (!storage_trie.active() || storage_trie.hashed_address() != hashed_address) {
                if (storage_trie.active() && !close_storage()) {
                    return tl::unexpected{SnapshotError::kStateRootMismatch};
                }
                if (!storage_roots.contains(hashed_address)) {
                    SNAP_DEBUG << "compute_state_root: storage without account: " << to_string(record);
                    return tl::unexpected{SnapshotError::kMalformedSnapshot};
                }
                storage_trie.start(std::move(hashed_address));
            }
            storage_trie.add(ByteView{key}.substr(kHashLength), storage->value);
        } else {
            if (storage_trie.active() && !close_storage()) {
                return tl::unexpected{SnapshotError::kStateRootMismatch};
            }
            const auto& code{std::get<CodeRecord>(record)};
            if (to_bytes32(hashed(code.code)) != code.code_hash) {
                SNAP_DEBUG << "compute_state_root: code does not match its hash: " << to_string(record);
                return tl::unexpected{SnapshotError::kMalformedSnapshot};
            }
        }

        previous_kind = kind;
        previous_key = std::move(key);
    }

    if (storage_trie.active() && !close_storage()) {
        return tl::unexpected{SnapshotError::kStateRootMismatch};
    }

    // Accounts left without storage records must declare an empty storage trie
    for (const auto& [hashed_address, storage_root] : storage_roots) {
        if (storage_root != kEmptyRoot) {
            SNAP_DEBUG << "compute_state_root: missing storage for account 0x" << to_hex(hashed_address);
            return tl::unexpected{SnapshotError::kStateRootMismatch};
        }
    }

    return account_trie.root_hash();
}

}  // namespace snapsync::snapshots
