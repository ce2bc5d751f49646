// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "snapshot_error.hpp"

#include <magic_enum.hpp>

namespace snapsync::snapshots {

std::string_view to_string(SnapshotError error) {
    return magic_enum::enum_name(error);
}

std::ostream& operator<<(std::ostream& out, SnapshotError error) {
    out << to_string(error);
    return out;
}

}  // namespace snapsync::snapshots
