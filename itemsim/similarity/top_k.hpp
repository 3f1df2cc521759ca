// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include <itemsim/similarity/types.hpp>

namespace itemsim::similarity {

//! \brief Per item bounded list of the best scoring candidates.
//! Slots live in two flat arrays (scores and candidate ids) of num_items * k entries, initialized to
//! the sentinel (0, kInvalidItemId). For each item the slots are kept sorted by descending score and hold
//! no duplicate candidate. Candidates scoring 0 are never recorded.
//! Not thread safe: concurrent inserts for the same item must be serialized by the caller.
class TopKTable {
  public:
    TopKTable(size_t num_items, size_t k);

    // Not copyable
    TopKTable(const TopKTable&) = delete;
    TopKTable& operator=(const TopKTable&) = delete;

    //! \brief Offers a candidate to an item in O(k)
    //! \return true if the candidate entered the item's slots
    //! \remarks A candidate already present is left untouched, whatever the new score
    bool insert(ItemId item, ItemId candidate, float score);

    //! \brief Returns the recorded (candidate, score) pairs of an item by descending score
    std::vector<std::pair<ItemId, float>> candidates(ItemId item) const;

    //! \brief Visits every recorded (item, candidate, score) by item then descending score, skipping
    //! sentinel slots. The table is read only afterwards
    void drain(const std::function<void(ItemId, ItemId, float)>& visitor);

    bool drained() const noexcept { return drained_; }

  private:
    size_t num_items_;
    size_t k_;
    std::vector<float> scores_;
    std::vector<ItemId> candidates_;
    bool drained_{false};
};

}  // namespace itemsim::similarity
