// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

#include <snapsync/snapshots/state_provider.hpp>
#include <snapsync/snapshots/state_record.hpp>

namespace snapsync::snapshots::test_util {

//! Builds a deterministic world state with accounts, storage slots and contract code
//! \param num_accounts number of accounts, every other account is a contract with code and storage
//! \param slots_per_contract number of non-zero storage slots of every contract
//! \param code_size size of the bytecode of every contract
std::vector<StateRecord> sample_state_records(size_t num_accounts, size_t slots_per_contract, size_t code_size);

//! Computes the storage root of the given slots (keys are locations)
evmc::bytes32 storage_root_of(const std::map<evmc::bytes32, evmc::bytes32>& slots);

//! StateProvider serving fixed states kept in memory
class InMemoryStateProvider : public StateProvider {
  public:
    //! Adds the state at the given block declaring the state root computed from the records themselves
    void add_state(BlockNum block_number, std::vector<StateRecord> records);

    //! Adds the state at the given block declaring an arbitrary state root
    void add_state(BlockNum block_number, std::vector<StateRecord> records, const evmc::bytes32& state_root);

    std::optional<evmc::bytes32> state_root_at(BlockNum block_number) override;
    std::vector<StateRecord> enumerate_state_records(BlockNum block_number) override;

  private:
    std::map<BlockNum, std::pair<evmc::bytes32, std::vector<StateRecord>>> states_;
};

//! HeaderChain made of fixed trusted headers
class InMemoryHeaderChain : public HeaderChain {
  public:
    void add_header(TrustedHeader header) { headers_[header.block_number] = header; }

    std::optional<TrustedHeader> header_at(BlockNum block_number) override {
        const auto it{headers_.find(block_number)};
        if (it == headers_.end()) return std::nullopt;
        return it->second;
    }

  private:
    std::map<BlockNum, TrustedHeader> headers_;
};

//! \brief gMock mock class for StateMaterializer
class MockStateMaterializer : public StateMaterializer {
  public:
    MOCK_METHOD((void), import_verified_records, (std::vector<StateRecord>), (override));
};

}  // namespace snapsync::snapshots::test_util
