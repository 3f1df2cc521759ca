// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <itemsim/core/common/base.hpp>
#include <itemsim/similarity/types.hpp>

namespace itemsim::similarity {

struct Settings {
    uint32_t rounds{10};                                 // Independent MinHash passes
    uint32_t top_k{5};                                   // Candidates retained per item
    uint64_t max_interactions_per_user{1000};            // Users above this many distinct items are dropped
    std::filesystem::path work_dir{std::filesystem::temp_directory_path()};  // Stash backing location
    std::optional<uint64_t> random_seed;                 // Seed of the entropy source (random when empty)
    ScoringStrategy scoring{ScoringStrategy::kAdjacentPairs};
    bool verify_sort_order{true};                        // Checked lock-step key compaction
    size_t sort_buffer_size{256_Mebi};                   // In-memory run size of the external sort
    uint32_t num_workers{1};                             // Rounds scored in parallel when > 1
    std::string output_name;                             // Persist output records as work_dir/output_name

    //! \brief Throws std::invalid_argument on the first invalid value
    void validate() const;
};

std::string_view to_string(ScoringStrategy strategy);

//! \brief Parses "adjacent" or "bucket"
std::optional<ScoringStrategy> scoring_strategy_from_string(std::string_view name);

}  // namespace itemsim::similarity
