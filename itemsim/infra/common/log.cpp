// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <itemsim/infra/common/terminal.hpp>

namespace itemsim::log {

//! The fixed size for thread name in log lines ("main" or "pool-N")
static constexpr size_t kThreadNameFixedSize = 8;

//! Column where key=value pairs start
static constexpr int kMessageWidth = 36;

static Settings settings_{};
static bool colorize_{false};
static std::mutex out_mtx{};
static std::unique_ptr<std::ofstream> file_{nullptr};
thread_local std::string thread_name_{};

static void open_tee_file(const std::string& path) {
    file_ = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!file_->is_open()) {
        file_.reset();
        throw std::runtime_error("Could not open log file " + path);
    }
}

void init(const Settings& settings) {
    settings_ = settings;
    file_.reset();
    if (!settings_.log_file.empty()) {
        open_tee_file(settings_.log_file);
    }
    init_terminal();
    const bool is_terminal{settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
    // Escape sequences must never reach a pipe or the tee file
    colorize_ = is_terminal && !settings_.log_nocolor && !file_;
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = std::string(name);
    thread_name_.resize(kThreadNameFixedSize, ' ');
}

static const std::string& thread_name() {
    if (thread_name_.empty()) {
        std::ostringstream ss;
        ss << std::this_thread::get_id();
        thread_name_ = ss.str();
    }
    return thread_name_;
}

static std::string_view paint(std::string_view color) { return colorize_ ? color : std::string_view{}; }

static std::pair<std::string_view, std::string_view> level_tag(Level level) {
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
        default:
            return {"     ", kColorReset};
    }
}

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    const auto [tag, color] = level_tag(level);
    ss_ << " " << paint(color) << tag << paint(kColorReset) << " ";

    static const absl::TimeZone kTz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << paint(kColorWhite) << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kTz) << "] "
        << paint(kColorReset);

    if (settings_.log_threads) {
        ss_ << "[" << thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::append(std::string_view msg, const Args& args) {
    if (!should_print_) return;
    ss_ << std::left << std::setw(kMessageWidth) << std::setfill(' ') << msg;
    for (size_t i{0}; i + 1 < args.size(); i += 2) {
        ss_ << paint(kColorGreen) << args[i] << paint(kColorReset) << "=" << args[i + 1] << " ";
    }
    if (args.size() % 2) {
        ss_ << args.back();
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (file_) {
        *file_ << line << '\n';
    }
}

}  // namespace itemsim::log
