// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <itemsim/stash/stash_context.hpp>

namespace itemsim::similarity {

struct BotFilterStats {
    uint64_t users_kept{0};
    uint64_t users_filtered{0};
    uint64_t edges_kept{0};
    uint64_t edges_dropped{0};
};

//! \brief Drops every edge of users interacting with more than a given number of distinct items
class BotFilter {
  public:
    BotFilter(stash::StashContext& context, uint64_t max_interactions_per_user)
        : context_{context}, max_interactions_per_user_{max_interactions_per_user} {}

    //! \param raw_edges : rows of (user_key, item_key), any order, duplicates allowed
    //! \return a stash of (item_key, user_key) rows for retained users, ordered by user
    stash::Stash& apply(const stash::Stash& raw_edges);

    const BotFilterStats& stats() const noexcept { return stats_; }

  private:
    stash::StashContext& context_;
    uint64_t max_interactions_per_user_;
    BotFilterStats stats_;
};

}  // namespace itemsim::similarity
