// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "timeout.hpp"

#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <snapsync/infra/common/log.hpp>
#include <snapsync/infra/concurrency/sleep.hpp>

namespace snapsync::concurrency {

Task<void> timeout(std::chrono::milliseconds duration, const char* source_file_path, int source_file_line) {
    try {
        co_await sleep(duration);
    } catch (const boost::system::system_error& ex) {
        if (ex.code() == boost::system::errc::operation_canceled) {
            co_return;
        }
        throw;
    }

    if (source_file_path) {
        SNAP_TRACE << "Timeout of " << duration.count() << "ms expired at " << source_file_path << ":"
                   << source_file_line;
    }
    throw TimeoutExpiredError{};
}

}  // namespace snapsync::concurrency
