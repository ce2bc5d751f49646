// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace snapsync::log {

enum class Level {
    kNone,      // untagged lines, printed at any verbosity
    kCritical,  // unrecoverable
    kError,     // failed operation, the process goes on
    kWarning,   // degraded operation, e.g. a misbehaving peer
    kInfo,      // milestones of regular operations
    kDebug,     // per-request details
    kTrace      // per-chunk details
};

struct Settings {
    bool log_std_out{false};   // print to std::cout instead of std::cerr
    bool log_utc{true};        // UTC timestamps instead of local time
    bool log_timezone{true};   // append the timezone name to timestamps
    bool log_nocolor{false};   // strip ANSI colors (always stripped when not on a TTY)
    bool log_trim{false};      // 4-char level tags without padding
    bool log_threads{false};   // print the thread name or id
    Level log_verbosity{Level::kInfo};
    std::string log_file;            // tee log lines to this file if not empty
    char log_thousands_sep{'\''};    // digit grouping for numbers, 0 to disable
};

//! \brief Applies the settings, opening the tee file if any
//! \note Not thread safe: call once at startup (or from tests)
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe: call at startup or from tests
void set_verbosity(Level level);

//! \brief Whether a line at the given level would be printed
bool test_verbosity(Level level);

//! \brief Tees log lines to the given file (appending)
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! \brief Name printed for the calling thread when Settings::log_threads is on
std::string get_thread_name();

//! Alternating keys and values, printed as key=value
using Args = std::vector<std::string>;

//! \brief Accumulates one log line and prints it on destruction
class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    BufferBase& operator<<(const T& value) {
        if (should_print_) ss_ << value;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append("", args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args);
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

}  // namespace snapsync::log

#define SNAP_LOGBUFFER(level_, ...)               \
    if (!snapsync::log::test_verbosity(level_)) { \
    } else                                        \
        snapsync::log::LogBuffer<level_>(__VA_ARGS__)

#define SNAP_TRACE_M(...) SNAP_LOGBUFFER(snapsync::log::Level::kTrace, __VA_ARGS__)
#define SNAP_DEBUG_M(...) SNAP_LOGBUFFER(snapsync::log::Level::kDebug, __VA_ARGS__)
#define SNAP_INFO_M(...) SNAP_LOGBUFFER(snapsync::log::Level::kInfo, __VA_ARGS__)
#define SNAP_WARN_M(...) SNAP_LOGBUFFER(snapsync::log::Level::kWarning, __VA_ARGS__)
#define SNAP_ERROR_M(...) SNAP_LOGBUFFER(snapsync::log::Level::kError, __VA_ARGS__)
#define SNAP_CRIT_M(...) SNAP_LOGBUFFER(snapsync::log::Level::kCritical, __VA_ARGS__)
#define SNAP_LOG_M(...) SNAP_LOGBUFFER(snapsync::log::Level::kNone, __VA_ARGS__)

#define SNAP_TRACE SNAP_TRACE_M()
#define SNAP_DEBUG SNAP_DEBUG_M()
#define SNAP_INFO SNAP_INFO_M()
#define SNAP_WARN SNAP_WARN_M()
#define SNAP_ERROR SNAP_ERROR_M()
#define SNAP_CRIT SNAP_CRIT_M()
#define SNAP_LOG SNAP_LOG_M()
