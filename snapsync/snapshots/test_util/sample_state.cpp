// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sample_state.hpp"

#include <cstring>
#include <stdexcept>

#include <snapsync/core/common/endian.hpp>
#include <snapsync/core/common/util.hpp>
#include <snapsync/core/rlp/encode.hpp>
#include <snapsync/core/trie/hash_builder.hpp>
#include <snapsync/core/trie/nibbles.hpp>
#include <snapsync/snapshots/creator.hpp>
#include <snapsync/snapshots/state_root.hpp>

namespace snapsync::snapshots::test_util {

static evmc::bytes32 keccak(ByteView data) {
    const ethash::hash256 hash{keccak256(data)};
    evmc::bytes32 out;
    std::memcpy(out.bytes, hash.bytes, kHashLength);
    return out;
}

static evmc::address make_address(uint64_t n) {
    evmc::address address;
    endian::store_big_u64(address.bytes + kAddressLength - 8, n + 1);
    address.bytes[0] = 0xAA;
    return address;
}

static evmc::bytes32 make_word(uint64_t n) {
    evmc::bytes32 word;
    endian::store_big_u64(word.bytes + kHashLength - 8, n);
    return word;
}

evmc::bytes32 storage_root_of(const std::map<evmc::bytes32, evmc::bytes32>& slots) {
    std::map<Bytes, Bytes> leaves;
    for (const auto& [location, value] : slots) {
        Bytes value_rlp;
        rlp::encode(value_rlp, zeroless_view(value.bytes));
        leaves.emplace(trie::unpack_nibbles(keccak(location.bytes).bytes), std::move(value_rlp));
    }
    trie::HashBuilder builder;
    for (const auto& [key, value] : leaves) {
        builder.add_leaf(key, value);
    }
    return builder.root_hash();
}

std::vector<StateRecord> sample_state_records(size_t num_accounts, size_t slots_per_contract, size_t code_size) {
    std::vector<StateRecord> records;
    for (size_t i{0}; i < num_accounts; ++i) {
        AccountRecord account{
            .address = make_address(i),
            .nonce = i,
            .balance = intx::uint256{1'000'000 * (i + 1)},
        };
        if (i % 2 == 1) {
            CodeRecord code{.code = Bytes(code_size, static_cast<uint8_t>(0x60 + i % 16))};
            code.code[0] = static_cast<uint8_t>(i);
            code.code_hash = keccak(code.code);
            account.code_hash = code.code_hash;

            std::map<evmc::bytes32, evmc::bytes32> slots;
            for (size_t j{0}; j < slots_per_contract; ++j) {
                slots.emplace(make_word(j), make_word((i + 1) * 1000 + j));
            }
            account.storage_root = storage_root_of(slots);
            for (const auto& [location, value] : slots) {
                records.emplace_back(StorageRecord{.address = account.address, .location = location, .value = value});
            }
            records.emplace_back(std::move(code));
        }
        records.emplace_back(account);
    }
    return records;
}

void InMemoryStateProvider::add_state(BlockNum block_number, std::vector<StateRecord> records) {
    const auto state_root{compute_state_root(canonical_order(records))};
    if (!state_root) {
        throw std::logic_error{"InMemoryStateProvider: inconsistent sample state"};
    }
    add_state(block_number, std::move(records), *state_root);
}

void InMemoryStateProvider::add_state(BlockNum block_number, std::vector<StateRecord> records,
                                      const evmc::bytes32& state_root) {
    states_[block_number] = {state_root, std::move(records)};
}

std::optional<evmc::bytes32> InMemoryStateProvider::state_root_at(BlockNum block_number) {
    const auto it{states_.find(block_number)};
    if (it == states_.end()) return std::nullopt;
    return it->second.first;
}

std::vector<StateRecord> InMemoryStateProvider::enumerate_state_records(BlockNum block_number) {
    const auto it{states_.find(block_number)};
    if (it == states_.end()) return {};
    return it->second.second;
}

}  // namespace snapsync::snapshots::test_util
