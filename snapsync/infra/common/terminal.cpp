// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <unistd.h>

namespace snapsync {

bool is_terminal_stdout() {
    return isatty(STDOUT_FILENO) != 0;
}

bool is_terminal_stderr() {
    return isatty(STDERR_FILENO) != 0;
}

}  // namespace snapsync
