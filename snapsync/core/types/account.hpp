// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <intx/intx.hpp>

#include <snapsync/core/common/bytes.hpp>
#include <snapsync/core/common/empty_hashes.hpp>
#include <snapsync/core/types/evmc_bytes32.hpp>

namespace snapsync {

//! Account fields committed to by the account trie, the storage root is supplied separately
struct Account {
    uint64_t nonce{0};
    intx::uint256 balance;
    evmc::bytes32 code_hash{kEmptyHash};

    //! \brief Account trie leaf value: RLP list [nonce, balance, storage_root, code_hash]
    Bytes rlp(const evmc::bytes32& storage_root) const;

    std::string to_string() const;

    friend bool operator==(const Account&, const Account&) = default;
};

}  // namespace snapsync
