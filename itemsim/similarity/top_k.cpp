// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "top_k.hpp"

#include <limits>
#include <stdexcept>
#include <string>

#include <itemsim/infra/common/ensure.hpp>

namespace itemsim::similarity {

TopKTable::TopKTable(size_t num_items, size_t k) : num_items_{num_items}, k_{k} {
    ensure_pre_condition(k_ > 0, [] { return "top k capacity must be greater than zero"; });
    ensure_pre_condition(num_items_ <= std::numeric_limits<size_t>::max() / k_,
                         [&] { return "top k table too large: " + std::to_string(num_items_) + " items"; });
    scores_.assign(num_items_ * k_, 0.0f);
    candidates_.assign(num_items_ * k_, kInvalidItemId);
}

bool TopKTable::insert(ItemId item, ItemId candidate, float score) {
    ensure(!drained_, "insert into a drained top k table");
    if (item >= num_items_) {
        throw std::out_of_range("item " + std::to_string(item) + " out of top k table range");
    }
    const size_t begin{static_cast<size_t>(item) * k_};
    const size_t end{begin + k_};

    for (size_t i{begin}; i < end; ++i) {
        if (candidates_[i] == candidate) {
            return false;
        }
        if (candidates_[i] == kInvalidItemId) {
            break;  // sentinels only follow
        }
    }

    // Insertion sort step: the displaced slot becomes the incoming value for the rest of the scan
    bool inserted{false};
    for (size_t i{begin}; i < end; ++i) {
        if (score > scores_[i]) {
            std::swap(scores_[i], score);
            std::swap(candidates_[i], candidate);
            inserted = true;
        }
    }
    return inserted;
}

std::vector<std::pair<ItemId, float>> TopKTable::candidates(ItemId item) const {
    if (item >= num_items_) {
        throw std::out_of_range("item " + std::to_string(item) + " out of top k table range");
    }
    std::vector<std::pair<ItemId, float>> result;
    const size_t begin{static_cast<size_t>(item) * k_};
    for (size_t i{begin}; i < begin + k_; ++i) {
        if (candidates_[i] != kInvalidItemId && scores_[i] > 0.0f) {
            result.emplace_back(candidates_[i], scores_[i]);
        }
    }
    return result;
}

void TopKTable::drain(const std::function<void(ItemId, ItemId, float)>& visitor) {
    drained_ = true;
    for (size_t item{0}; item < num_items_; ++item) {
        const size_t begin{item * k_};
        for (size_t i{begin}; i < begin + k_; ++i) {
            if (candidates_[i] != kInvalidItemId && scores_[i] > 0.0f) {
                visitor(static_cast<ItemId>(item), candidates_[i], scores_[i]);
            }
        }
    }
}

}  // namespace itemsim::similarity
