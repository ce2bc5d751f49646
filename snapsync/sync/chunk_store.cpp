// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chunk_store.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <snapsync/core/common/bytes_to_string.hpp>
#include <snapsync/core/common/util.hpp>
#include <snapsync/core/rlp/decode_vector.hpp>
#include <snapsync/core/rlp/encode.hpp>
#include <snapsync/core/types/evmc_bytes32.hpp>
#include <snapsync/infra/common/directories.hpp>
#include <snapsync/infra/common/log.hpp>

namespace snapsync::sync {

namespace fs = std::filesystem;
using snapshots::TrustedHeader;

void InMemoryChunkStore::put(const TrustedHeader& target, const ChunkResponse& response) {
    std::scoped_lock lock{mutex_};
    chunks_[{target.block_number, Bytes{target.state_root.bytes, kHashLength}}][response.chunk.index] = response;
}

std::vector<ChunkResponse> InMemoryChunkStore::get_all(const TrustedHeader& target) {
    std::scoped_lock lock{mutex_};
    std::vector<ChunkResponse> responses;
    const auto it{chunks_.find({target.block_number, Bytes{target.state_root.bytes, kHashLength}})};
    if (it != chunks_.end()) {
        for (const auto& [_, response] : it->second) {
            responses.push_back(response);
        }
    }
    return responses;
}

void InMemoryChunkStore::remove_all(const TrustedHeader& target) {
    std::scoped_lock lock{mutex_};
    chunks_.erase({target.block_number, Bytes{target.state_root.bytes, kHashLength}});
}

FileChunkStore::FileChunkStore(fs::path repository_path) : repository_path_{std::move(repository_path)} {
    Directory repository{repository_path_, /*must_create=*/true};
}

fs::path FileChunkStore::target_path(const TrustedHeader& target) const {
    return repository_path_ / (std::to_string(target.block_number) + "-" + to_hex(target.state_root));
}

Bytes FileChunkStore::encode(const ChunkResponse& response) {
    const auto& chunk{response.chunk};
    const auto& proof{response.proof};
    Bytes sibling_path;
    for (const auto& sibling : proof.sibling_path) {
        sibling_path.append(sibling.bytes, kHashLength);
    }

    Bytes payload;
    rlp::encode(payload, chunk.index);
    rlp::encode(payload, static_cast<uint8_t>(chunk.kind));
    rlp::encode(payload, chunk.payload);
    rlp::encode(payload, chunk.content_hash);
    rlp::encode(payload, proof.leaf_index);
    rlp::encode(payload, proof.leaf_hash);
    rlp::encode(payload, sibling_path);

    Bytes encoded;
    rlp::encode_header(encoded, {.list = true, .payload_length = payload.size()});
    encoded.append(payload);
    return encoded;
}

tl::expected<ChunkResponse, DecodingError> FileChunkStore::decode(ByteView data) {
    ChunkResponse response;
    auto& chunk{response.chunk};
    auto& proof{response.proof};
    uint8_t kind{0};
    Bytes sibling_path;
    if (DecodingResult res{rlp::decode(data, rlp::Leftover::kProhibit, chunk.index, kind, chunk.payload,
                                       chunk.content_hash.bytes, proof.leaf_index, proof.leaf_hash.bytes,
                                       sibling_path)};
        !res) {
        return tl::unexpected{res.error()};
    }
    if (kind > static_cast<uint8_t>(snapshots::RecordKind::kCode)) {
        return tl::unexpected{DecodingError::kInvalidFieldset};
    }
    if (sibling_path.size() % kHashLength != 0) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    chunk.kind = static_cast<snapshots::RecordKind>(kind);
    for (size_t offset{0}; offset < sibling_path.size(); offset += kHashLength) {
        proof.sibling_path.push_back(to_bytes32(ByteView{sibling_path}.substr(offset, kHashLength)));
    }
    return response;
}

void FileChunkStore::put(const TrustedHeader& target, const ChunkResponse& response) {
    std::scoped_lock lock{mutex_};
    Directory target_dir{target_path(target), /*must_create=*/true};
    const fs::path file_path{target_dir.path() / (std::to_string(response.chunk.index) + kChunkFileExtension)};
    const fs::path tmp_path{file_path.string() + ".tmp"};

    const Bytes encoded{encode(response)};
    {
        std::ofstream file{tmp_path, std::ios::binary | std::ios::trunc};
        file.write(byte_ptr_cast(encoded.data()), static_cast<std::streamsize>(encoded.size()));
        if (!file) {
            throw std::runtime_error{"FileChunkStore: cannot write " + tmp_path.string()};
        }
    }
    fs::rename(tmp_path, file_path);
}

std::vector<ChunkResponse> FileChunkStore::get_all(const TrustedHeader& target) {
    std::scoped_lock lock{mutex_};
    std::map<uint32_t, ChunkResponse> responses;
    const Directory target_dir{target_path(target)};
    if (!target_dir.exists()) return {};

    for (const auto& entry : fs::directory_iterator{target_dir.path()}) {
        if (!entry.is_regular_file() || entry.path().extension() != kChunkFileExtension) continue;

        std::ifstream file{entry.path(), std::ios::binary};
        const std::string content{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
        auto response{decode(string_view_to_byte_view(content))};
        if (!response) {
            SNAP_WARN << "FileChunkStore: discarding unreadable chunk file " << entry.path().string();
            fs::remove(entry.path());
            continue;
        }
        responses.emplace(response->chunk.index, std::move(*response));
    }

    std::vector<ChunkResponse> result;
    result.reserve(responses.size());
    for (auto& [_, response] : responses) {
        result.push_back(std::move(response));
    }
    return result;
}

void FileChunkStore::remove_all(const TrustedHeader& target) {
    std::scoped_lock lock{mutex_};
    fs::remove_all(target_path(target));
}

}  // namespace snapsync::sync
