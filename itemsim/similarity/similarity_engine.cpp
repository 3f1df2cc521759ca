// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "similarity_engine.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include <itemsim/core/common/util.hpp>
#include <itemsim/infra/common/ensure.hpp>
#include <itemsim/infra/common/log.hpp>
#include <itemsim/similarity/jaccard.hpp>
#include <itemsim/stash/row_codec.hpp>

namespace itemsim::similarity {

std::vector<ItemUserSet> load_item_user_sets(const stash::Stash& compact_edges) {
    std::vector<ItemUserSet> items;
    compact_edges.for_each([&items](ByteView row) {
        stash::RowReader reader{row};
        const ItemId item_id{reader.read_u32()};
        const UserId user_id{reader.read_u32()};
        if (items.empty() || items.back().item_id != item_id) {
            ensure_invariant(item_id == items.size(), "item ids must be dense and sorted");
            items.push_back({item_id, {}});
        }
        auto& users{items.back().users};
        ensure_invariant(users.empty() || users.back() < user_id, "user ids must be sorted and unique per item");
        users.push_back(user_id);
    });
    for (auto& item : items) {
        item.users.shrink_to_fit();
    }
    return items;
}

uint64_t SimilarityEngine::hash_user(uint64_t seed, UserId user) noexcept {
    return remix(seed + remix(static_cast<uint64_t>(user) ^ seed));
}

uint64_t SimilarityEngine::min_hash(uint64_t seed, std::span<const UserId> users) noexcept {
    uint64_t digest{std::numeric_limits<uint64_t>::max()};
    for (const UserId user : users) {
        digest = std::min(digest, hash_user(seed, user));
    }
    return digest;
}

std::vector<Bucket> SimilarityEngine::make_buckets(const RoundSeeds& seeds) const {
    // Tiebreaks avoid a bias towards items which are adjacent in id order sharing the same digest
    Mt19937EntropySource tiebreaks{seeds.tiebreak_seed};
    std::vector<Bucket> buckets;
    buckets.reserve(items_.size());
    for (const auto& item : items_) {
        buckets.push_back({min_hash(seeds.hash_seed, item.users), tiebreaks.next_unit(), item.item_id});
    }
    std::sort(buckets.begin(), buckets.end());
    return buckets;
}

float SimilarityEngine::score(ItemId a, ItemId b) const { return jaccard_similarity(items_[a].users, items_[b].users); }

uint64_t SimilarityEngine::run_round(const RoundSeeds& seeds, const CandidateSink& sink) const {
    const auto buckets{make_buckets(seeds)};
    uint64_t scored{0};

    if (strategy_ == ScoringStrategy::kAdjacentPairs) {
        for (size_t i{1}; i < buckets.size(); ++i) {
            const ItemId a{buckets[i - 1].item_id};
            const ItemId b{buckets[i].item_id};
            sink({a, b, score(a, b)});
            ++scored;
        }
        return scored;
    }

    // Exact digest groups: every pair within a group
    size_t begin{0};
    while (begin < buckets.size()) {
        size_t end{begin + 1};
        while (end < buckets.size() && buckets[end].digest == buckets[begin].digest) {
            ++end;
        }
        if (end - begin > kLargeBucketWarning) {
            log::Warning("Large MinHash bucket", {"items", std::to_string(end - begin), "pairs",
                                                  std::to_string((end - begin) * (end - begin - 1) / 2)});
        }
        for (size_t i{begin}; i < end; ++i) {
            for (size_t j{i + 1}; j < end; ++j) {
                const ItemId a{buckets[i].item_id};
                const ItemId b{buckets[j].item_id};
                sink({a, b, score(a, b)});
                ++scored;
            }
        }
        begin = end;
    }
    return scored;
}

std::vector<ScoreCandidate> SimilarityEngine::run_round(const RoundSeeds& seeds) const {
    std::vector<ScoreCandidate> candidates;
    candidates.reserve(strategy_ == ScoringStrategy::kAdjacentPairs && !items_.empty() ? items_.size() - 1 : 0);
    (void)run_round(seeds, [&candidates](const ScoreCandidate& candidate) { candidates.push_back(candidate); });
    return candidates;
}

}  // namespace itemsim::similarity
