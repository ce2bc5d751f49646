// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <snapsync/snapshots/snapshot_error.hpp>
#include <snapsync/snapshots/state_record.hpp>

namespace snapsync::snapshots {

//! Canonical ordering key of a record within its kind
Bytes canonical_key(const StateRecord& record);

//! \brief Replays state records into the Modified Merkle Patricia Trie and returns the state root
//! \details Records must be in canonical order: all accounts by keccak(address), then all storage slots by
//! (keccak(address), keccak(location)), then all code by code_hash. Storage slots must belong to an account
//! record and be non-zero, code must hash to its code_hash and every recomputed storage root must match the
//! storage_root declared by its account.
//! \return the state root or kMalformedSnapshot for ordering/consistency violations and kStateRootMismatch
//! when a declared storage root does not match the replayed storage
tl::expected<evmc::bytes32, SnapshotError> compute_state_root(const std::vector<StateRecord>& records);

}  // namespace snapsync::snapshots
