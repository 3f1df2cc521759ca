// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bot_filter.hpp"

#include <string>
#include <utility>
#include <vector>

#include <catch2/catch.hpp>

#include <itemsim/infra/common/directories.hpp>
#include <itemsim/infra/test_util/log.hpp>
#include <itemsim/stash/row_codec.hpp>

namespace itemsim::similarity {

using stash::RowReader;
using stash::RowWriter;
using Edges = std::vector<std::pair<std::string, std::string>>;

static stash::Stash& make_raw_edges(stash::StashContext& context, const Edges& edges) {
    std::vector<Bytes> rows;
    for (const auto& [user, item] : edges) {
        rows.push_back(RowWriter{}.add_string(user).add_string(item).release());
    }
    return context.create(rows);
}

//! Returns the (item, user) output rows as (user, item) pairs
static Edges read_edges(const stash::Stash& stash) {
    Edges edges;
    stash.for_each([&edges](ByteView row) {
        RowReader reader{row};
        std::string item{reader.read_string()};
        std::string user{reader.read_string()};
        CHECK(reader.at_end());
        edges.emplace_back(std::move(user), std::move(item));
    });
    return edges;
}

TEST_CASE("BotFilter") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    stash::StashContext context{tmp_dir.path()};

    SECTION("user above threshold contributes nothing") {
        BotFilter filter{context, 1};
        stash::Stash& raw{make_raw_edges(context, {{"u1", "a"}, {"u1", "b"}, {"u2", "a"}})};
        const auto edges{read_edges(filter.apply(raw))};
        CHECK(edges == Edges{{"u2", "a"}});
        CHECK(filter.stats().users_kept == 1);
        CHECK(filter.stats().users_filtered == 1);
        CHECK(filter.stats().edges_kept == 1);
        CHECK(filter.stats().edges_dropped == 2);
    }

    SECTION("duplicates count once") {
        BotFilter filter{context, 2};
        stash::Stash& raw{make_raw_edges(
            context, {{"u1", "b"}, {"u1", "a"}, {"u1", "a"}, {"u1", "b"}, {"u2", "c"}, {"u2", "a"}, {"u2", "b"}})};
        const auto edges{read_edges(filter.apply(raw))};
        CHECK(edges == Edges{{"u1", "a"}, {"u1", "b"}});
        CHECK(filter.stats().users_kept == 1);
        CHECK(filter.stats().users_filtered == 1);
    }

    SECTION("user at threshold keeps every edge") {
        BotFilter filter{context, 3};
        stash::Stash& raw{make_raw_edges(context, {{"u3", "c"}, {"u1", "a"}, {"u3", "a"}, {"u3", "b"}})};
        const auto edges{read_edges(filter.apply(raw))};
        CHECK(edges == Edges{{"u1", "a"}, {"u3", "a"}, {"u3", "b"}, {"u3", "c"}});
        CHECK(filter.stats().users_filtered == 0);
        CHECK(filter.stats().edges_kept == 4);
    }

    SECTION("no edges") {
        BotFilter filter{context, 1};
        stash::Stash& raw{make_raw_edges(context, {})};
        CHECK(filter.apply(raw).length() == 0);
        CHECK(filter.stats().users_kept == 0);
    }
}

}  // namespace itemsim::similarity
