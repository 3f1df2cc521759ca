// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "settings.hpp"

#include <itemsim/infra/common/ensure.hpp>

namespace itemsim::similarity {

void Settings::validate() const {
    ensure_pre_condition(rounds > 0, [] { return "rounds must be greater than zero"; });
    ensure_pre_condition(top_k > 0, [] { return "top_k must be greater than zero"; });
    ensure_pre_condition(max_interactions_per_user > 0,
                         [] { return "max_interactions_per_user must be greater than zero"; });
    ensure_pre_condition(!work_dir.empty(), [] { return "work_dir must not be empty"; });
    ensure_pre_condition(sort_buffer_size > 0, [] { return "sort_buffer_size must be greater than zero"; });
    ensure_pre_condition(num_workers > 0, [] { return "num_workers must be greater than zero"; });
    ensure_pre_condition(output_name.empty() || (std::filesystem::path{output_name}.filename() == output_name &&
                                                 output_name != "." && output_name != ".."),
                         [&] { return "output_name must be a plain file name: " + output_name; });
}

std::string_view to_string(ScoringStrategy strategy) {
    switch (strategy) {
        case ScoringStrategy::kAdjacentPairs:
            return "adjacent";
        case ScoringStrategy::kBucketAllPairs:
            return "bucket";
    }
    return "unknown";
}

std::optional<ScoringStrategy> scoring_strategy_from_string(std::string_view name) {
    if (name == "adjacent") return ScoringStrategy::kAdjacentPairs;
    if (name == "bucket") return ScoringStrategy::kBucketAllPairs;
    return std::nullopt;
}

}  // namespace itemsim::similarity
