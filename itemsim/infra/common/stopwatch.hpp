// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

namespace itemsim {

//! \brief This class mimics the behavior of a stopwatch to measure timings of pipeline stages
class StopWatch {
  public:
    using TimePoint = std::chrono::time_point<std::chrono::steady_clock>;
    using Duration = std::chrono::nanoseconds;

    static constexpr bool kStart = true;

    explicit StopWatch(bool auto_start = false) {
        if (auto_start) start();
    }

    //! \brief Starts the clock
    //! \return The TimePoint it was started on
    TimePoint start() noexcept;

    //! \brief Computes the duration amongst now and the start time
    Duration since_start() const noexcept;

    //! \brief Returns a human readable duration
    static std::string format(Duration duration);

  private:
    bool started_{false};
    TimePoint start_time_{};
};

}  // namespace itemsim
