// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <span>

#include <itemsim/similarity/types.hpp>

namespace itemsim::similarity {

//! \brief Jaccard similarity |A ∩ B| / |A ∪ B| of two sets given as sorted sequences without duplicates.
//! Linear merge of both sequences. Two empty sets have similarity 0
inline float jaccard_similarity(std::span<const UserId> users1, std::span<const UserId> users2) noexcept {
    size_t intersection{0};
    size_t difference{0};
    size_t i{0};
    size_t j{0};
    while (i < users1.size() && j < users2.size()) {
        if (users1[i] < users2[j]) {
            ++difference;
            ++i;
        } else if (users1[i] > users2[j]) {
            ++difference;
            ++j;
        } else {
            ++intersection;
            ++i;
            ++j;
        }
    }
    difference += (users1.size() - i) + (users2.size() - j);
    if (intersection + difference == 0) {
        return 0.0f;
    }
    return static_cast<float>(static_cast<double>(intersection) / static_cast<double>(intersection + difference));
}

}  // namespace itemsim::similarity
