// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace snapsync {
[[noreturn]] void abort_due_to_assertion_failure(char const* expr, char const* file, int line);
}

#define SNAPSYNC_ASSERT(expr) \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::snapsync::abort_due_to_assertion_failure(#expr, __FILE__, __LINE__)
