// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "jaccard.hpp"

#include <vector>

#include <catch2/catch.hpp>

namespace itemsim::similarity {

TEST_CASE("jaccard_similarity") {
    const std::vector<UserId> a{1, 2, 3};
    const std::vector<UserId> b{1, 2};
    const std::vector<UserId> c{4, 5};
    const std::vector<UserId> d{2, 3, 4, 9};
    const std::vector<UserId> empty;

    CHECK(jaccard_similarity(a, a) == 1.0f);
    CHECK(jaccard_similarity(a, b) == Approx(2.0 / 3.0));
    CHECK(jaccard_similarity(a, c) == 0.0f);
    CHECK(jaccard_similarity(a, d) == Approx(2.0 / 5.0));
    CHECK(jaccard_similarity(a, empty) == 0.0f);
    CHECK(jaccard_similarity(empty, empty) == 0.0f);

    for (const auto* x : {&a, &b, &c, &d, &empty}) {
        for (const auto* y : {&a, &b, &c, &d, &empty}) {
            CHECK(jaccard_similarity(*x, *y) == jaccard_similarity(*y, *x));
        }
    }
}

}  // namespace itemsim::similarity
