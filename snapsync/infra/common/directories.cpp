// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace snapsync {

namespace fs = std::filesystem;

Directory::Directory(const fs::path& directory_path, bool must_create)
    : path_{directory_path.empty() ? fs::current_path() : directory_path} {
    if (must_create) {
        create();
    }
}

bool Directory::exists() const {
    return fs::is_directory(path_);
}

void Directory::create() {
    if (exists()) return;
    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec) {
        throw std::invalid_argument("Directory " + path_.string() + " does not exist and could not be created: " +
                                    ec.message());
    }
}

TemporaryDirectory::~TemporaryDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

fs::path TemporaryDirectory::unique_temporary_path() {
    static constexpr std::string_view kAlphabet{"0123456789abcdefghijklmnopqrstuvwxyz"};
    static constexpr size_t kNameLength{10};
    static constexpr int kMaxAttempts{1000};

    std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<size_t> distribution{0, kAlphabet.size() - 1};
    const fs::path base_path{fs::temp_directory_path()};
    for (int attempt{0}; attempt < kMaxAttempts; ++attempt) {
        std::string name(kNameLength, '\0');
        for (auto& ch : name) {
            ch = kAlphabet[distribution(generator)];
        }
        if (!fs::exists(base_path / name)) {
            return base_path / name;
        }
    }
    throw std::runtime_error("Unable to find a unique non-existent path under " + base_path.string());
}

}  // namespace snapsync
