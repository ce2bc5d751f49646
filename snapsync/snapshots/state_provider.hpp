// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <snapsync/core/common/base.hpp>
#include <snapsync/snapshots/state_record.hpp>

namespace snapsync::snapshots {

//! Read access to the finalized world state of the local node
class StateProvider {
  public:
    virtual ~StateProvider() = default;

    //! The state root at the given block, if the state at that block is available
    virtual std::optional<evmc::bytes32> state_root_at(BlockNum block_number) = 0;

    //! All state records at the given block in any order
    virtual std::vector<StateRecord> enumerate_state_records(BlockNum block_number) = 0;
};

//! A block header validated independently of the snapshot path
struct TrustedHeader {
    BlockNum block_number{0};
    evmc::bytes32 state_root;

    friend bool operator==(const TrustedHeader&, const TrustedHeader&) = default;
};

//! Access to the independently validated chain of block headers
class HeaderChain {
  public:
    virtual ~HeaderChain() = default;

    virtual std::optional<TrustedHeader> header_at(BlockNum block_number) = 0;
};

//! Sink writing verified state into persistent storage
class StateMaterializer {
  public:
    virtual ~StateMaterializer() = default;

    //! Receives the records of a fully verified snapshot in canonical order, once per successful sync
    virtual void import_verified_records(std::vector<StateRecord> records) = 0;
};

}  // namespace snapsync::snapshots
