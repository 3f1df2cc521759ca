// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "pipeline.hpp"

#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <itemsim/infra/common/directories.hpp>
#include <itemsim/infra/test_util/log.hpp>
#include <itemsim/similarity/jaccard.hpp>
#include <itemsim/stash/util.hpp>

namespace itemsim::similarity {

namespace fs = std::filesystem;

//! Counts draws of a wrapped source
class CountingEntropySource final : public EntropySource {
  public:
    explicit CountingEntropySource(uint64_t seed) : source_{seed} {}
    uint64_t next_u64() override {
        ++draws_;
        return source_.next_u64();
    }
    uint64_t draws() const { return draws_; }

  private:
    Mt19937EntropySource source_;
    uint64_t draws_{0};
};

static Settings make_settings(const fs::path& work_dir) {
    Settings settings;
    settings.work_dir = work_dir;
    settings.random_seed = 1;
    return settings;
}

static std::vector<RawEdge> generate_edges(size_t count, uint32_t users, uint32_t items) {
    std::mt19937 rng{2024};
    std::uniform_int_distribution<uint32_t> user_dist{0, users - 1};
    // Skewed towards low item numbers to get popular items
    std::geometric_distribution<uint32_t> item_dist{0.08};
    std::vector<RawEdge> edges;
    edges.reserve(count);
    for (size_t i{0}; i < count; ++i) {
        edges.push_back({"user" + std::to_string(user_dist(rng)), "item" + std::to_string(item_dist(rng) % items)});
    }
    return edges;
}

TEST_CASE("Pipeline end to end") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    Settings settings{make_settings(tmp_dir.path())};
    settings.top_k = 2;
    settings.rounds = 3;

    VectorEdgeSource source{{{"u1", "a"}, {"u1", "b"}, {"u2", "a"}, {"u2", "b"}, {"u3", "a"}}};
    Pipeline pipeline{settings};
    std::vector<RecommendationRecord> records;
    const RunStats stats{pipeline.run(source, [&](const RecommendationRecord& r) { records.push_back(r); })};

    REQUIRE(records.size() == 2);
    CHECK(records[0].item_key == "a");
    REQUIRE(records[0].candidates.size() == 1);
    CHECK(records[0].candidates[0].first == "b");
    CHECK(records[0].candidates[0].second == Approx(2.0 / 3.0));
    CHECK(records[1].item_key == "b");
    REQUIRE(records[1].candidates.size() == 1);
    CHECK(records[1].candidates[0].first == "a");
    CHECK(records[1].candidates[0].second == Approx(2.0 / 3.0));

    CHECK(stats.raw_edges == 5);
    CHECK(stats.users_kept == 3);
    CHECK(stats.users_filtered == 0);
    CHECK(stats.distinct_users == 3);
    CHECK(stats.distinct_items == 2);
    CHECK(stats.unique_edges == 5);
    CHECK(stats.pairs_scored == 3);
    CHECK(stats.records_emitted == 2);
    CHECK(stats.seed == 1);
    CHECK_FALSE(stats.output_path.has_value());

    // Nothing but the (empty) work dir is left behind
    CHECK(Directory{tmp_dir.path()}.is_empty());
}

TEST_CASE("Pipeline bot filtering") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    Settings settings{make_settings(tmp_dir.path())};
    settings.max_interactions_per_user = 1;

    SECTION("bot edges are dropped") {
        VectorEdgeSource source{{{"u1", "a"}, {"u1", "b"}, {"u2", "a"}}};
        Pipeline pipeline{settings};
        const RunStats stats{pipeline.run(source, [](const RecommendationRecord&) {})};
        CHECK(stats.users_filtered == 1);
        CHECK(stats.users_kept == 1);
        CHECK(stats.distinct_items == 1);
        CHECK(stats.unique_edges == 1);
        CHECK(stats.records_emitted == 0);  // a single item has no neighbour
    }

    SECTION("duplicate interactions count once") {
        VectorEdgeSource source{{{"u1", "a"}, {"u1", "a"}, {"u2", "a"}, {"u2", "b"}, {"u3", "b"}}};
        settings.max_interactions_per_user = 1;
        Pipeline pipeline{settings};
        const RunStats stats{pipeline.run(source, [](const RecommendationRecord&) {})};
        CHECK(stats.raw_edges == 5);
        CHECK(stats.users_kept == 2);
        CHECK(stats.distinct_items == 2);
        CHECK(stats.records_emitted == 0);  // a and b share no user
    }
}

TEST_CASE("Pipeline output properties") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    Settings settings{make_settings(tmp_dir.path())};
    settings.top_k = 4;
    settings.rounds = 8;
    settings.max_interactions_per_user = 30;
    settings.sort_buffer_size = 4_Kibi;  // force multi-run external sorts

    const auto edges{generate_edges(3000, 150, 60)};

    // Reference user sets of the retained users
    std::map<std::string, std::set<std::string>> items_by_user;
    for (const auto& edge : edges) {
        items_by_user[edge.user_key].insert(edge.item_key);
    }
    std::map<std::string, std::set<std::string>> users_by_item;
    uint64_t filtered{0};
    for (const auto& [user, items] : items_by_user) {
        if (items.size() > settings.max_interactions_per_user) {
            ++filtered;
            continue;
        }
        for (const auto& item : items) {
            users_by_item[item].insert(user);
        }
    }
    auto reference_jaccard = [&](const std::string& a, const std::string& b) {
        // Map user keys to their sorted rank as ids
        std::map<std::string, UserId> ids;
        for (const auto& u : users_by_item[a]) ids.emplace(u, 0);
        for (const auto& u : users_by_item[b]) ids.emplace(u, 0);
        UserId next{0};
        for (auto& [key, id] : ids) id = next++;
        std::vector<UserId> ua, ub;
        for (const auto& u : users_by_item[a]) ua.push_back(ids[u]);
        for (const auto& u : users_by_item[b]) ub.push_back(ids[u]);
        return jaccard_similarity(ua, ub);
    };

    VectorEdgeSource source{edges};
    Pipeline pipeline{settings};
    std::vector<RecommendationRecord> records;
    const RunStats stats{pipeline.run(source, [&](const RecommendationRecord& r) { records.push_back(r); })};

    CHECK(stats.users_filtered == filtered);
    CHECK(stats.distinct_items == users_by_item.size());
    CHECK(stats.records_emitted == records.size());
    REQUIRE_FALSE(records.empty());

    for (size_t i{0}; i < records.size(); ++i) {
        const auto& record{records[i]};
        if (i > 0) {
            CHECK(records[i - 1].item_key < record.item_key);
        }
        REQUIRE_FALSE(record.candidates.empty());
        CHECK(record.candidates.size() <= settings.top_k);
        std::set<std::string> seen;
        for (size_t j{0}; j < record.candidates.size(); ++j) {
            const auto& [candidate, score] = record.candidates[j];
            CHECK(candidate != record.item_key);
            CHECK(seen.insert(candidate).second);
            CHECK(score > 0.0f);
            CHECK(score <= 1.0f);
            CHECK(score == Approx(reference_jaccard(record.item_key, candidate)));
            if (j > 0) {
                CHECK(record.candidates[j - 1].second >= score);
            }
        }
    }

    SECTION("same seed, same output") {
        VectorEdgeSource again{edges};
        CHECK(Pipeline{settings}.run(again) == records);
    }

    SECTION("parallel rounds match sequential rounds") {
        settings.num_workers = 3;
        VectorEdgeSource again{edges};
        CHECK(Pipeline{settings}.run(again) == records);
    }

    SECTION("unchecked compaction gives the same output on sorted streams") {
        settings.verify_sort_order = false;
        VectorEdgeSource again{edges};
        CHECK(Pipeline{settings}.run(again) == records);
    }

    SECTION("bucket strategy") {
        settings.scoring = ScoringStrategy::kBucketAllPairs;
        VectorEdgeSource again{edges};
        for (const auto& record : Pipeline{settings}.run(again)) {
            CHECK(record.candidates.size() <= settings.top_k);
            for (const auto& [candidate, score] : record.candidates) {
                CHECK(score == Approx(reference_jaccard(record.item_key, candidate)));
            }
        }
    }
}

TEST_CASE("Pipeline entropy injection") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    Settings settings{make_settings(tmp_dir.path())};
    settings.random_seed.reset();
    settings.rounds = 5;
    const auto edges{generate_edges(500, 40, 20)};

    CountingEntropySource first_source{77};
    VectorEdgeSource first_edges{edges};
    const auto first{Pipeline{settings, first_source}.run(first_edges)};
    CHECK(first_source.draws() == 2 * settings.rounds);

    CountingEntropySource second_source{77};
    VectorEdgeSource second_edges{edges};
    CHECK(Pipeline{settings, second_source}.run(second_edges) == first);
}

TEST_CASE("Pipeline persisted output") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    Settings settings{make_settings(tmp_dir.path())};
    settings.output_name = "recommendations.rows";

    VectorEdgeSource source{generate_edges(400, 30, 15)};
    const fs::path expected_path{fs::absolute(tmp_dir.path()) / "recommendations.rows"};
    std::vector<RecommendationRecord> records;
    Pipeline pipeline{settings};
    const RunStats stats{pipeline.run(source, [&](const RecommendationRecord& r) {
        CHECK(fs::exists(expected_path));  // persisted before any delivery
        records.push_back(r);
    })};
    REQUIRE_FALSE(records.empty());
    REQUIRE(stats.output_path.has_value());
    CHECK(*stats.output_path == expected_path);

    auto output{stash::Stash::adopt(*stats.output_path)};
    std::vector<RecommendationRecord> decoded;
    output->for_each([&decoded](ByteView row) { decoded.push_back(decode_record(row)); });
    CHECK(decoded == records);
}

TEST_CASE("Pipeline delivers nothing when persisting fails") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    Settings settings{make_settings(tmp_dir.path())};
    settings.output_name = "out";
    // A non-empty directory occupies the output name, so the final rename fails
    fs::create_directories(tmp_dir.path() / "out" / "x");

    VectorEdgeSource source{{{"u1", "a"}, {"u1", "b"}, {"u2", "a"}, {"u2", "b"}, {"u3", "a"}}};
    Pipeline pipeline{settings};
    std::vector<RecommendationRecord> delivered;
    CHECK_THROWS_AS(pipeline.run(source, [&](const RecommendationRecord& r) { delivered.push_back(r); }),
                    stash::stash_error);
    CHECK(delivered.empty());
    CHECK(fs::is_directory(tmp_dir.path() / "out" / "x"));
    CHECK_FALSE(fs::exists(tmp_dir.path() / "out.partial"));
}

TEST_CASE("Pipeline rejects bad input") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;

    SECTION("invalid settings before any stash") {
        Settings settings{make_settings(tmp_dir.path() / "work")};
        settings.top_k = 0;
        CHECK_THROWS_AS(Pipeline{settings}, std::invalid_argument);
        settings.top_k = 5;
        settings.rounds = 0;
        Mt19937EntropySource entropy{1};
        CHECK_THROWS_AS(Pipeline(settings, entropy), std::invalid_argument);
        CHECK_FALSE(fs::exists(tmp_dir.path() / "work"));
    }

    SECTION("incomplete edge") {
        Settings settings{make_settings(tmp_dir.path())};
        VectorEdgeSource source{{{"u1", "a"}, {"", "b"}}};
        Pipeline pipeline{settings};
        CHECK_THROWS_AS(pipeline.run(source), std::invalid_argument);
        CHECK(Directory{tmp_dir.path()}.is_empty());
    }

    SECTION("empty input") {
        Settings settings{make_settings(tmp_dir.path())};
        VectorEdgeSource source{std::vector<RawEdge>{}};
        Pipeline pipeline{settings};
        CHECK(pipeline.run(source).empty());
    }
}

}  // namespace itemsim::similarity
