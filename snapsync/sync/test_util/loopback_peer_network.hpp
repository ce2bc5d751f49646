// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <set>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

#include <snapsync/sync/peer_network.hpp>
#include <snapsync/sync/server.hpp>

namespace snapsync::sync::test_util {

//! How a provider reacts to chunk requests
enum class ProviderBehavior {
    kHonest,       // serves what it holds
    kHang,         // never answers
    kFail,         // the request fails with a network error
    kBreakDown,    // the request fails with an error which is not a network one
    kCorruptOnce,  // flips one payload byte of the affected chunks, then turns honest for them
    kDropChunks,   // omits the affected chunks from its answers
};

/**
 * In-process network delivering requests to the SnapshotServer instances registered on it.
 * Announcements are kept until cleared. Every request is logged.
 */
class LoopbackPeerNetwork : public SnapshotPeerNetwork {
  public:
    void add_server(SnapshotServer& server) { servers_[server.node_id()] = &server; }

    //! \param affected chunk indices the behavior applies to, all chunks when empty
    void set_behavior(const PeerId& provider, ProviderBehavior behavior, std::set<uint32_t> affected = {});

    void clear_announcements() { announcements_.clear(); }

    Task<void> announce(snapshots::SnapshotAnnouncement announcement) override;
    Task<std::vector<snapshots::SnapshotAnnouncement>> discover(BlockNum block_number) override;
    Task<std::vector<ChunkResponse>> request_chunks(PeerId provider, ChunkRequest request) override;

    const std::vector<std::pair<PeerId, ChunkRequest>>& requests() const { return requests_; }

    //! Number of times the chunk has been requested from any provider
    size_t request_count(uint32_t index) const;

    //! Number of times the chunk has been requested from the provider
    size_t request_count(const PeerId& provider, uint32_t index) const;

  private:
    struct Behavior {
        ProviderBehavior kind{ProviderBehavior::kHonest};
        std::set<uint32_t> affected;

        bool applies_to(uint32_t index) const { return affected.empty() || affected.contains(index); }
    };

    std::map<PeerId, SnapshotServer*> servers_;
    std::map<PeerId, Behavior> behaviors_;
    std::vector<snapshots::SnapshotAnnouncement> announcements_;
    std::vector<std::pair<PeerId, ChunkRequest>> requests_;
};

//! \brief gMock mock class for SnapshotPeerNetwork
class MockSnapshotPeerNetwork : public SnapshotPeerNetwork {
  public:
    MOCK_METHOD((Task<void>), announce, (snapshots::SnapshotAnnouncement), (override));
    MOCK_METHOD((Task<std::vector<snapshots::SnapshotAnnouncement>>), discover, (BlockNum), (override));
    MOCK_METHOD((Task<std::vector<ChunkResponse>>), request_chunks, (PeerId, ChunkRequest), (override));
};

}  // namespace snapsync::sync::test_util
