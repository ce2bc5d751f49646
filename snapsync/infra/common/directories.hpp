// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

namespace snapsync {

//! \brief Filesystem directory handle, optionally created on construction
class Directory {
  public:
    //! \param directory_path the directory, the current path when empty
    //! \param must_create whether to create the directory (and its parents) when missing
    //! \throws std::invalid_argument if must_create and the directory could not be created
    explicit Directory(const std::filesystem::path& directory_path, bool must_create = false);
    virtual ~Directory() = default;

    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    bool exists() const;
    const std::filesystem::path& path() const { return path_; }

    void create();

  protected:
    std::filesystem::path path_;
};

//! \brief Uniquely named directory under the OS temporary path, deleted with its content on destruction
class TemporaryDirectory final : public Directory {
  public:
    TemporaryDirectory() : Directory(unique_temporary_path(), /*must_create=*/true) {}
    ~TemporaryDirectory() final;

  private:
    static std::filesystem::path unique_temporary_path();
};

}  // namespace snapsync
