// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <snapsync/sync/bandwidth_budget.hpp>
#include <snapsync/sync/peer_reputation.hpp>
#include <snapsync/sync/settings.hpp>

namespace snapsync::sync {

//! \brief Resources shared by the serving and requesting roles of all sync jobs of a node
class DistributorContext {
  public:
    explicit DistributorContext(const SnapshotSyncSettings& settings)
        : bandwidth_{settings.bandwidth}, reputation_{settings.reputation} {}

    // Not copyable nor movable
    DistributorContext(const DistributorContext&) = delete;
    DistributorContext& operator=(const DistributorContext&) = delete;

    BandwidthBudget& bandwidth() { return bandwidth_; }
    PeerReputation& reputation() { return reputation_; }

  private:
    BandwidthBudget bandwidth_;
    PeerReputation reputation_;
};

}  // namespace snapsync::sync
