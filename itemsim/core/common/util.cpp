// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <cstdio>
#include <cstdlib>
#include <regex>

#include <absl/strings/match.h>

#include <itemsim/core/common/base.hpp>

namespace itemsim {

std::optional<uint64_t> parse_size(const std::string& size_string) {
    if (size_string.empty()) {
        return 0ull;
    }

    static const std::regex kPattern{R"(^(\d+)(\.\d{1,3})?\ *?(B|KB|MB|GB|TB)?$)", std::regex_constants::icase};
    std::smatch matches;
    if (!std::regex_search(size_string, matches, kPattern)) {
        return std::nullopt;
    }

    uint64_t multiplier{1};
    const std::string suffix{matches[3].str()};
    if (absl::EqualsIgnoreCase(suffix, "KB")) {
        multiplier = kKibi;
    } else if (absl::EqualsIgnoreCase(suffix, "MB")) {
        multiplier = kMebi;
    } else if (absl::EqualsIgnoreCase(suffix, "GB")) {
        multiplier = kGibi;
    } else if (absl::EqualsIgnoreCase(suffix, "TB")) {
        multiplier = kTebi;
    }

    uint64_t number{std::strtoull(matches[1].str().c_str(), nullptr, 10) * multiplier};
    if (matches[2].matched) {
        // Decimals as integers: "1.5" is 1 + 5 / 10
        const std::string decimals{matches[2].str().substr(1)};
        uint64_t base{1};
        for (size_t i{0}; i < decimals.size(); ++i) {
            base *= 10;
        }
        number += multiplier * std::strtoull(decimals.c_str(), nullptr, 10) / base;
    }
    return number;
}

std::string human_size(uint64_t bytes, const char* unit) {
    static const char* suffix[]{"", "K", "M", "G", "T"};
    static const uint32_t items{sizeof(suffix) / sizeof(suffix[0])};
    uint32_t index{0};
    double value{static_cast<double>(bytes)};
    while (value >= kKibi) {
        value /= kKibi;
        if (++index == (items - 1)) {
            break;
        }
    }
    static constexpr size_t kBufferSize{64};
    char output[kBufferSize];
    const int written{std::snprintf(output, kBufferSize, "%.02lf %s%s", value, suffix[index], unit)};
    if (written <= 0) {
        return std::to_string(bytes) + " " + unit;
    }
    return output;
}

}  // namespace itemsim
