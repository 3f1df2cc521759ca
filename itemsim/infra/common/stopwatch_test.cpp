// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stopwatch.hpp"

#include <thread>

#include <catch2/catch.hpp>

namespace itemsim {

TEST_CASE("StopWatch") {
    using namespace std::chrono_literals;

    StopWatch sw{};
    CHECK(sw.since_start() == StopWatch::Duration::zero());

    const auto started{sw.start()};
    std::this_thread::sleep_for(5ms);
    CHECK(sw.since_start() >= 5ms);
    CHECK(sw.start() == started);  // restarting a running watch is a no-op

    StopWatch running{StopWatch::kStart};
    std::this_thread::sleep_for(1ms);
    CHECK(running.since_start() >= 1ms);
}

TEST_CASE("StopWatch::format") {
    using namespace std::chrono_literals;
    CHECK(StopWatch::format(500ns) == "500ns");
    CHECK(StopWatch::format(12us) == "12us");
    CHECK(StopWatch::format(250ms) == "250ms");
    CHECK(StopWatch::format(1500ms) == "1.500s");
    CHECK(StopWatch::format(2s) == "2s");
    CHECK(StopWatch::format(3723s) == "1h 2m 3s");
}

}  // namespace itemsim
