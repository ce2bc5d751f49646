// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <locale>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "terminal.hpp"

namespace snapsync::log {

namespace {

    struct LevelTag {
        std::string_view name;
        std::string_view color;
    };

    struct DigitGrouping : std::numpunct<char> {
        explicit DigitGrouping(char sep) : separator{sep} {}
        char do_thousands_sep() const override { return separator; }
        std::string do_grouping() const override { return "\3"; }
        char separator;
    };

    struct Sink {
        Settings settings;
        bool on_terminal{false};
        std::unique_ptr<std::ofstream> file;
        std::mutex mutex;
    };

    Sink& sink() {
        static Sink instance;
        return instance;
    }

    thread_local std::string thread_name;

    LevelTag level_tag(Level level) {
        switch (level) {
            case Level::kTrace:
                return {"TRACE", kColorCoal};
            case Level::kDebug:
                return {"DEBUG", kBackgroundPurple};
            case Level::kInfo:
                return {" INFO", kColorGreen};
            case Level::kWarning:
                return {" WARN", kColorOrangeHigh};
            case Level::kError:
                return {"ERROR", kColorRed};
            case Level::kCritical:
                return {" CRIT", kBackgroundRed};
            case Level::kNone:
                break;
        }
        return {"     ", kColorReset};
    }

    std::string strip_colors(const std::string& line) {
        static const std::regex kAnsiEscape{"\x1b\\[[0-9;]+m"};
        return std::regex_replace(line, kAnsiEscape, "");
    }

}  // namespace

void init(const Settings& settings) {
    Sink& s = sink();
    s.settings = settings;
    if (!settings.log_file.empty()) {
        tee_file(settings.log_file);
    }
    s.on_terminal = settings.log_std_out ? is_terminal_stdout() : is_terminal_stderr();
    if (!s.on_terminal) {
        s.settings.log_nocolor = true;
    }
}

void tee_file(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!file->is_open()) {
        throw std::runtime_error{"cannot open log file " + path.string()};
    }
    sink().file = std::move(file);
}

Level get_verbosity() { return sink().settings.log_verbosity; }

void set_verbosity(Level level) { sink().settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= sink().settings.log_verbosity; }

std::string get_thread_name() {
    if (thread_name.empty()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        thread_name = id.str();
    }
    return thread_name;
}

BufferBase::BufferBase(Level level) : should_print_{test_verbosity(level)} {
    if (!should_print_) return;
    const Settings& settings = sink().settings;

    if (settings.log_thousands_sep != 0) {
        ss_.imbue(std::locale{ss_.getloc(), new DigitGrouping{settings.log_thousands_sep}});
    }

    const auto [name, color] = level_tag(level);
    if (settings.log_trim) {
        ss_ << "[" << color << absl::StripAsciiWhitespace(name).substr(0, 4) << kColorReset << "] ";
    } else {
        ss_ << kColorReset << " " << color << name << kColorReset << " ";
    }

    static const absl::TimeZone kTimeZone{settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kTimeZone);
    if (settings.log_timezone) {
        ss_ << " " << kTimeZone.name();
    }
    ss_ << "] " << kColorReset;

    if (settings.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::append(std::string_view msg, const Args& args) {
    if (!should_print_) return;
    if (!msg.empty()) {
        ss_ << msg;
        if (msg.size() < 32) ss_ << std::string(32 - msg.size(), ' ');
    }
    for (size_t i{0}; i + 1 < args.size(); i += 2) {
        ss_ << " " << kColorGreen << args[i] << kColorReset << "=" << args[i + 1];
    }
}

void BufferBase::flush() {
    if (!should_print_) return;
    Sink& s = sink();

    const std::string line{ss_.str()};
    const std::string plain{strip_colors(line)};

    std::scoped_lock lock{s.mutex};
    std::ostream& out = s.settings.log_std_out ? std::cout : std::cerr;
    out << (s.settings.log_nocolor ? plain : line) << '\n';
    if (s.file) {
        *s.file << plain << '\n';
    }
}

}  // namespace snapsync::log
