// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "pipeline.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>

#include <itemsim/core/common/util.hpp>
#include <itemsim/infra/common/ensure.hpp>
#include <itemsim/infra/common/log.hpp>
#include <itemsim/infra/common/stopwatch.hpp>
#include <itemsim/infra/concurrency/thread_pool.hpp>
#include <itemsim/similarity/bot_filter.hpp>
#include <itemsim/similarity/key_compactor.hpp>
#include <itemsim/stash/row_codec.hpp>

namespace itemsim::similarity {

using stash::RowReader;
using stash::RowWriter;
using stash::Stash;
using stash::StashContext;

namespace {

    //! Writes fn(row) for every row of input into a new sealed stash
    Stash& transform(StashContext& context, const Stash& input, const std::function<Bytes(ByteView)>& fn) {
        Stash& output{context.create()};
        input.for_each([&](ByteView row) { output.append(fn(row)); });
        output.seal();
        return output;
    }

    void log_stage(std::string_view stage, const StopWatch& sw, const Stash& result) {
        log::Info(stage, {"size", human_size(result.file_size()), "elapsed", StopWatch::format(sw.since_start())});
    }

}  // namespace

Bytes encode_record(const RecommendationRecord& record) {
    RowWriter writer;
    writer.add_string(record.item_key).add_u32(static_cast<uint32_t>(record.candidates.size()));
    for (const auto& [candidate_key, score] : record.candidates) {
        writer.add_string(candidate_key).add_u32(stash::score_to_u32(score));
    }
    return writer.release();
}

RecommendationRecord decode_record(ByteView row) {
    RowReader reader{row};
    RecommendationRecord record;
    record.item_key = reader.read_string();
    const uint32_t count{reader.read_u32()};
    record.candidates.reserve(count);
    for (uint32_t i{0}; i < count; ++i) {
        std::string candidate_key{reader.read_string()};
        record.candidates.emplace_back(std::move(candidate_key), stash::score_from_u32(reader.read_u32()));
    }
    return record;
}

Pipeline::Pipeline(Settings settings) : settings_{std::move(settings)} {
    settings_.validate();
    owned_entropy_ = std::make_unique<Mt19937EntropySource>(settings_.random_seed);
    entropy_ = owned_entropy_.get();
}

Pipeline::Pipeline(Settings settings, EntropySource& entropy) : settings_{std::move(settings)}, entropy_{&entropy} {
    settings_.validate();
}

Stash& Pipeline::ingest(StashContext& context, EdgeSource& source, RunStats& stats) {
    StopWatch sw{StopWatch::kStart};
    Stash& raw_edges{context.create()};
    while (auto edge = source.next()) {
        if (edge->user_key.empty() || edge->item_key.empty()) {
            throw std::invalid_argument("Incomplete edge at position " + std::to_string(stats.raw_edges));
        }
        raw_edges.append(RowWriter{}.add_string(edge->user_key).add_string(edge->item_key).row());
        ++stats.raw_edges;
    }
    raw_edges.seal();
    log::Info("Ingested edges", {"edges", std::to_string(stats.raw_edges)});
    log_stage("Ingest done", sw, raw_edges);
    return raw_edges;
}

Stash& Pipeline::compact(StashContext& context, const Stash& edges, const Stash& user_labels,
                         const Stash& item_labels) {
    StopWatch sw{StopWatch::kStart};
    KeyCompactor compactor{context, settings_.verify_sort_order};

    // (item_key, user_key) -> (user_key, item_key) sorted by user
    Stash& by_user_unsorted{transform(context, edges, [](ByteView row) {
        RowReader reader{row};
        const ByteView item{reader.skip_string()};
        return RowWriter{}.add_raw(reader.remainder()).add_raw(item).release();
    })};
    Stash& by_user{context.sort_dedup(by_user_unsorted)};
    context.release(by_user_unsorted);

    // -> (user_id, item_key)
    Stash& user_numbered{compactor.compact(by_user, user_labels)};
    context.release(by_user);

    // -> (item_key, user_id) sorted by item
    Stash& by_item_unsorted{transform(context, user_numbered, [](ByteView row) {
        RowReader reader{row};
        const uint32_t user_id{reader.read_u32()};
        return RowWriter{}.add_raw(reader.remainder()).add_u32(user_id).release();
    })};
    context.release(user_numbered);
    Stash& by_item{context.sort_dedup(by_item_unsorted)};
    context.release(by_item_unsorted);

    // -> (item_id, user_id), still sorted since ids follow key order
    Stash& compact_edges{compactor.compact(by_item, item_labels)};
    context.release(by_item);

    log_stage("Keys compacted", sw, compact_edges);
    return compact_edges;
}

void Pipeline::score(const std::vector<ItemUserSet>& items, TopKTable& table, RunStats& stats) {
    StopWatch sw{StopWatch::kStart};
    SimilarityEngine engine{items, settings_.scoring};

    auto merge = [&table](const ScoreCandidate& candidate) {
        (void)table.insert(candidate.item_a, candidate.item_b, candidate.score);
        (void)table.insert(candidate.item_b, candidate.item_a, candidate.score);
    };

    // Seeds are drawn in round order whatever the number of workers: same seed, same result
    std::vector<RoundSeeds> seeds;
    seeds.reserve(settings_.rounds);
    for (uint32_t round{0}; round < settings_.rounds; ++round) {
        seeds.push_back(SimilarityEngine::draw_seeds(*entropy_));
    }

    if (settings_.num_workers == 1) {
        for (uint32_t round{0}; round < settings_.rounds; ++round) {
            const auto scored{engine.run_round(seeds[round], merge)};
            stats.pairs_scored += scored;
            ITEMSIM_TRACE_M("MinHash round", {"round", std::to_string(round), "pairs", std::to_string(scored)});
        }
    } else {
        // Workers only read item sets; this thread is the single writer of the table
        ThreadPool pool{settings_.num_workers};
        for (uint32_t first{0}; first < settings_.rounds; first += settings_.num_workers) {
            const uint32_t last{std::min(settings_.rounds, first + settings_.num_workers)};
            std::vector<std::future<std::vector<ScoreCandidate>>> rounds;
            for (uint32_t round{first}; round < last; ++round) {
                rounds.push_back(pool.submit([&engine, round_seeds = seeds[round]] {
                    return engine.run_round(round_seeds);
                }));
            }
            for (uint32_t round{first}; round < last; ++round) {
                const auto candidates{rounds[round - first].get()};
                for (const auto& candidate : candidates) {
                    merge(candidate);
                }
                stats.pairs_scored += candidates.size();
                ITEMSIM_TRACE_M("MinHash round", {"round", std::to_string(round), "pairs",
                                                  std::to_string(candidates.size())});
            }
        }
    }

    log::Info("MinHash rounds done", {"rounds", std::to_string(settings_.rounds), "pairs",
                                      std::to_string(stats.pairs_scored), "elapsed",
                                      StopWatch::format(sw.since_start())});
}

Stash& Pipeline::emit(StashContext& context, TopKTable& table, const Stash& item_labels, RunStats& stats) {
    StopWatch sw{StopWatch::kStart};
    KeyCompactor compactor{context, settings_.verify_sort_order};

    // (candidate_id, item_id, score)
    Stash& drained{context.create()};
    table.drain([&drained](ItemId item, ItemId candidate, float score) {
        drained.append(RowWriter{}.add_u32(candidate).add_u32(item).add_u32(stash::score_to_u32(score)).row());
    });
    drained.seal();
    Stash& by_candidate{context.sort_dedup(drained)};
    context.release(drained);

    // -> (candidate_key, item_id, score)
    Stash& candidate_restored{compactor.restore(by_candidate, item_labels)};
    context.release(by_candidate);

    // -> (item_id, ~score, candidate_key): descending score within an item
    Stash& by_item_unsorted{transform(context, candidate_restored, [](ByteView row) {
        RowReader reader{row};
        const ByteView candidate_key{reader.skip_string()};
        const uint32_t item_id{reader.read_u32()};
        const uint32_t score_bits{reader.read_u32()};
        return RowWriter{}.add_u32(item_id).add_u32(~score_bits).add_raw(candidate_key).release();
    })};
    context.release(candidate_restored);
    Stash& by_item{context.sort_dedup(by_item_unsorted)};
    context.release(by_item_unsorted);

    // -> (item_key, ~score, candidate_key)
    Stash& restored{compactor.restore(by_item, item_labels)};
    context.release(by_item);

    Stash& output{context.create()};
    std::optional<RecommendationRecord> record;
    auto flush_record = [&]() {
        if (!record) return;
        output.append(encode_record(*record));
        ++stats.records_emitted;
        record.reset();
    };
    restored.for_each([&](ByteView row) {
        RowReader reader{row};
        std::string item_key{reader.read_string()};
        const float score{stash::score_from_u32(~reader.read_u32())};
        std::string candidate_key{reader.read_string()};
        if (!record || record->item_key != item_key) {
            flush_record();
            record = RecommendationRecord{std::move(item_key), {}};
        }
        record->candidates.emplace_back(std::move(candidate_key), score);
    });
    flush_record();
    output.seal();
    context.release(restored);

    log::Info("Recommendations emitted", {"records", std::to_string(stats.records_emitted)});
    log_stage("Emit done", sw, output);
    return output;
}

RunStats Pipeline::run(EdgeSource& source, const RecordSink& sink) {
    StopWatch sw{StopWatch::kStart};
    RunStats stats;
    stats.seed = owned_entropy_ ? owned_entropy_->seed() : 0;
    log::Info("Similarity run started",
              {"rounds", std::to_string(settings_.rounds), "top_k", std::to_string(settings_.top_k),
               "max_interactions", std::to_string(settings_.max_interactions_per_user), "scoring",
               std::string{to_string(settings_.scoring)}, "workers", std::to_string(settings_.num_workers), "seed",
               owned_entropy_ ? std::to_string(stats.seed) : "injected"});
    if (settings_.scoring == ScoringStrategy::kBucketAllPairs) {
        log::Warning("Scoring all pairs within exact digest buckets: cost is quadratic in bucket size");
    } else {
        ITEMSIM_DEBUG_M("Scoring adjacent pairs only: cost is linear in item count per round");
    }

    StashContext context{settings_.work_dir, settings_.sort_buffer_size};

    Stash& raw_edges{ingest(context, source, stats)};

    BotFilter filter{context, settings_.max_interactions_per_user};
    Stash& edges{filter.apply(raw_edges)};
    context.release(raw_edges);
    stats.users_kept = filter.stats().users_kept;
    stats.users_filtered = filter.stats().users_filtered;

    KeyCompactor compactor{context, settings_.verify_sort_order};
    Stash& user_labels{compactor.collate(edges, 1)};
    Stash& item_labels{compactor.collate(edges, 0)};
    stats.distinct_users = user_labels.length();
    stats.distinct_items = item_labels.length();
    log::Info("Keys collated", {"users", std::to_string(stats.distinct_users), "items",
                                std::to_string(stats.distinct_items)});

    Stash& compact_edges{compact(context, edges, user_labels, item_labels)};
    context.release(edges);
    context.release(user_labels);
    stats.unique_edges = compact_edges.length();
    log::Info("Unique edges", {"edges", std::to_string(stats.unique_edges)});

    TopKTable table{static_cast<size_t>(stats.distinct_items), settings_.top_k};
    {
        auto items{load_item_user_sets(compact_edges)};
        context.release(compact_edges);
        ensure_invariant(items.size() == stats.distinct_items, "every collated item must have users");
        score(items, table, stats);
    }  // item user sets are released before draining

    const Stash& output{emit(context, table, item_labels, stats)};
    if (!settings_.output_name.empty()) {
        stats.output_path = context.persist(output, settings_.output_name);
    }

    // Records reach the sink only once nothing else can fail
    output.for_each([&sink](ByteView row) { sink(decode_record(row)); });

    log::Info("Similarity run done", {"records", std::to_string(stats.records_emitted), "elapsed",
                                      StopWatch::format(sw.since_start())});
    return stats;
}

std::vector<RecommendationRecord> Pipeline::run(EdgeSource& source) {
    std::vector<RecommendationRecord> records;
    (void)run(source, [&records](const RecommendationRecord& record) { records.push_back(record); });
    return records;
}

}  // namespace itemsim::similarity
