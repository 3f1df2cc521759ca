// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace itemsim::similarity {

using UserId = uint32_t;
using ItemId = uint32_t;

inline constexpr ItemId kInvalidItemId{std::numeric_limits<ItemId>::max()};

//! An interaction as delivered by the log collaborator
struct RawEdge {
    std::string user_key;
    std::string item_key;

    friend bool operator==(const RawEdge&, const RawEdge&) = default;
};

//! An interaction with both keys replaced by their sorted rank in their own domain
struct CompactEdge {
    UserId user_id{0};
    ItemId item_id{0};

    friend bool operator==(const CompactEdge&, const CompactEdge&) = default;
};

//! Users of an item, sorted ascending without duplicates
struct ItemUserSet {
    ItemId item_id{0};
    std::vector<UserId> users;
};

//! Position of an item in the global order of one MinHash round.
//! The user set is not copied: it is looked up by item_id in the round's ItemUserSet vector
struct Bucket {
    uint64_t digest{0};
    double tiebreak{0.0};  // uniform in [0, 1)
    ItemId item_id{0};

    friend bool operator<(const Bucket& a, const Bucket& b) {
        if (a.digest != b.digest) return a.digest < b.digest;
        if (a.tiebreak != b.tiebreak) return a.tiebreak < b.tiebreak;
        return a.item_id < b.item_id;
    }
};

struct ScoreCandidate {
    ItemId item_a{0};
    ItemId item_b{0};
    float score{0.0f};

    friend bool operator==(const ScoreCandidate&, const ScoreCandidate&) = default;
};

struct RecommendationRecord {
    std::string item_key;
    std::vector<std::pair<std::string, float>> candidates;  // descending by score

    friend bool operator==(const RecommendationRecord&, const RecommendationRecord&) = default;
};

//! How pairs are selected for scoring within a round
enum class ScoringStrategy {
    kAdjacentPairs,   // global sort by (digest, tiebreak), score neighbours only: linear cost, lower recall
    kBucketAllPairs,  // group by exact digest, score every pair in a group: higher recall, quadratic in group size
};

}  // namespace itemsim::similarity
