// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include <snapsync/core/common/bytes.hpp>
#include <snapsync/core/common/decoding_result.hpp>
#include <snapsync/snapshots/state_provider.hpp>
#include <snapsync/sync/chunk_transfer.hpp>

namespace snapsync::sync {

//! \brief Retention of downloaded chunks allowing an interrupted sync to resume without downloading them again
//! \details Retained chunks are not trusted: they must be verified again against the agreed chunk tree root
class ChunkStore {
  public:
    virtual ~ChunkStore() = default;

    //! Retains a chunk of the snapshot of the given target state
    virtual void put(const snapshots::TrustedHeader& target, const ChunkResponse& response) = 0;

    //! All chunks retained for the given target state, in index order
    virtual std::vector<ChunkResponse> get_all(const snapshots::TrustedHeader& target) = 0;

    //! Forgets all chunks retained for the given target state
    virtual void remove_all(const snapshots::TrustedHeader& target) = 0;
};

//! ChunkStore lasting as long as the process
class InMemoryChunkStore : public ChunkStore {
  public:
    void put(const snapshots::TrustedHeader& target, const ChunkResponse& response) override;
    std::vector<ChunkResponse> get_all(const snapshots::TrustedHeader& target) override;
    void remove_all(const snapshots::TrustedHeader& target) override;

  private:
    using TargetKey = std::pair<BlockNum, Bytes>;

    std::mutex mutex_;
    std::map<TargetKey, std::map<uint32_t, ChunkResponse>> chunks_;
};

//! \brief ChunkStore persisting chunks on disk across process restarts
//! \details Every chunk is kept in its own file <repository>/<block>-<state root>/<index>.chunk
class FileChunkStore : public ChunkStore {
  public:
    explicit FileChunkStore(std::filesystem::path repository_path);

    void put(const snapshots::TrustedHeader& target, const ChunkResponse& response) override;
    std::vector<ChunkResponse> get_all(const snapshots::TrustedHeader& target) override;
    void remove_all(const snapshots::TrustedHeader& target) override;

    std::filesystem::path target_path(const snapshots::TrustedHeader& target) const;

    static Bytes encode(const ChunkResponse& response);
    static tl::expected<ChunkResponse, DecodingError> decode(ByteView data);

    static constexpr const char* kChunkFileExtension{".chunk"};

  private:
    std::filesystem::path repository_path_;
    std::mutex mutex_;
};

}  // namespace snapsync::sync
