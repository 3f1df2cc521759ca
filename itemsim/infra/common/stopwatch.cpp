// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stopwatch.hpp"

#include <iomanip>
#include <sstream>

namespace itemsim {

StopWatch::TimePoint StopWatch::start() noexcept {
    if (started_) {
        return start_time_;
    }
    started_ = true;
    start_time_ = std::chrono::steady_clock::now();
    return start_time_;
}

StopWatch::Duration StopWatch::since_start() const noexcept {
    if (!started_) {
        return {};
    }
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_time_);
}

std::string StopWatch::format(Duration duration) {
    using namespace std::chrono_literals;

    std::ostringstream os;
    os.fill('0');
    if (duration >= 60s) {
        bool need_space{false};
        if (auto h = std::chrono::duration_cast<std::chrono::hours>(duration); h.count()) {
            os << h.count() << "h";
            duration -= h;
            need_space = true;
        }
        if (auto m = std::chrono::duration_cast<std::chrono::minutes>(duration); m.count()) {
            os << (need_space ? " " : "") << m.count() << "m";
            duration -= m;
            need_space = true;
        }
        if (auto s = std::chrono::duration_cast<std::chrono::seconds>(duration); s.count()) {
            os << (need_space ? " " : "") << s.count() << "s";
        }
    } else if (duration >= 1s) {
        auto s = std::chrono::duration_cast<std::chrono::seconds>(duration);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration - s);
        os << s.count();
        if (ms.count()) {
            os << "." << std::setw(3) << ms.count();
        }
        os << "s";
    } else if (duration >= 1ms) {
        os << std::chrono::duration_cast<std::chrono::milliseconds>(duration).count() << "ms";
    } else if (duration >= 1us) {
        os << std::chrono::duration_cast<std::chrono::microseconds>(duration).count() << "us";
    } else {
        os << duration.count() << "ns";
    }
    return os.str();
}

}  // namespace itemsim
