// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <vector>

#include <itemsim/core/common/entropy.hpp>
#include <itemsim/similarity/types.hpp>
#include <itemsim/stash/stash.hpp>

namespace itemsim::similarity {

//! Randomness consumed by one round, drawn up front so that rounds can run in any order or in parallel
struct RoundSeeds {
    uint64_t hash_seed{0};
    uint64_t tiebreak_seed{0};
};

//! \brief Groups (item_id, user_id) rows sorted by item then user into one ItemUserSet per item.
//! Item ids must be dense: the set of item i is at position i
std::vector<ItemUserSet> load_item_user_sets(const stash::Stash& compact_edges);

//! \brief Finds candidate pairs of similar items by MinHash.
//! Each round hashes every user set to its minimum under a seeded hash, orders items by digest and scores
//! the selected pairs by exact Jaccard similarity. Item user sets are only read.
class SimilarityEngine {
  public:
    using CandidateSink = std::function<void(const ScoreCandidate&)>;

    SimilarityEngine(const std::vector<ItemUserSet>& items, ScoringStrategy strategy)
        : items_{items}, strategy_{strategy} {}

    //! Buckets larger than this are reported when scoring all pairs within buckets
    static constexpr size_t kLargeBucketWarning{1024};

    static RoundSeeds draw_seeds(EntropySource& entropy) {
        const uint64_t hash_seed{entropy.next_u64()};
        return {hash_seed, entropy.next_u64()};
    }

    //! \brief Seeded 64-bit hash of a user id
    static uint64_t hash_user(uint64_t seed, UserId user) noexcept;

    //! \brief Minimum of hash_user over all users (max uint64 for an empty set)
    static uint64_t min_hash(uint64_t seed, std::span<const UserId> users) noexcept;

    //! \brief Runs one round feeding each scored pair once (item_a, item_b) to sink
    //! \return the number of pairs scored
    uint64_t run_round(const RoundSeeds& seeds, const CandidateSink& sink) const;

    //! \brief Runs one round collecting the scored pairs
    std::vector<ScoreCandidate> run_round(const RoundSeeds& seeds) const;

    //! \brief Builds the sorted buckets of a round
    std::vector<Bucket> make_buckets(const RoundSeeds& seeds) const;

    ScoringStrategy strategy() const noexcept { return strategy_; }

  private:
    float score(ItemId a, ItemId b) const;

    const std::vector<ItemUserSet>& items_;
    ScoringStrategy strategy_;
};

}  // namespace itemsim::similarity
