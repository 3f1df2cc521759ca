// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <itemsim/core/common/entropy.hpp>
#include <itemsim/similarity/edge_source.hpp>
#include <itemsim/similarity/settings.hpp>
#include <itemsim/similarity/similarity_engine.hpp>
#include <itemsim/similarity/top_k.hpp>
#include <itemsim/similarity/types.hpp>
#include <itemsim/stash/stash_context.hpp>

namespace itemsim::similarity {

using RecordSink = std::function<void(const RecommendationRecord&)>;

struct RunStats {
    uint64_t raw_edges{0};
    uint64_t users_kept{0};
    uint64_t users_filtered{0};
    uint64_t distinct_users{0};
    uint64_t distinct_items{0};
    uint64_t unique_edges{0};
    uint64_t pairs_scored{0};
    uint64_t records_emitted{0};
    uint64_t seed{0};                                 // Seed of the owned entropy source (0 when injected)
    std::optional<std::filesystem::path> output_path;  // Set when output was persisted
};

//! \brief Encodes a record as an output stash row
Bytes encode_record(const RecommendationRecord& record);

//! \brief Decodes an output stash row (e.g. from a persisted output adopted by a later process)
RecommendationRecord decode_record(ByteView row);

//! \brief One batch run computing, for every item, the most similar items by approximated Jaccard similarity.
//! Stages run strictly in sequence: ingest, bot filter, key compaction, grouping, MinHash rounds into a shared
//! top k table, drain and key restoration. Every intermediate stash lives in a StashContext scoped to run(),
//! so temporary storage is reclaimed when run() returns or throws.
class Pipeline {
  public:
    //! \brief Uses an entropy source seeded from settings.random_seed
    explicit Pipeline(Settings settings);

    //! \brief Uses the injected entropy source, which must outlive the pipeline
    Pipeline(Settings settings, EntropySource& entropy);

    //! \brief Executes the whole batch, emitting records ordered by item key to sink.
    //! \remarks Records are delivered only after the output is complete (and persisted when requested):
    //! a run failing at any stage delivers nothing
    RunStats run(EdgeSource& source, const RecordSink& sink);

    //! \brief Convenience overload collecting records in memory
    std::vector<RecommendationRecord> run(EdgeSource& source);

    const Settings& settings() const noexcept { return settings_; }

  private:
    stash::Stash& ingest(stash::StashContext& context, EdgeSource& source, RunStats& stats);
    stash::Stash& compact(stash::StashContext& context, const stash::Stash& edges, const stash::Stash& user_labels,
                          const stash::Stash& item_labels);
    void score(const std::vector<ItemUserSet>& items, TopKTable& table, RunStats& stats);
    stash::Stash& emit(stash::StashContext& context, TopKTable& table, const stash::Stash& item_labels,
                       RunStats& stats);

    Settings settings_;
    std::unique_ptr<Mt19937EntropySource> owned_entropy_;
    EntropySource* entropy_;
};

}  // namespace itemsim::similarity
