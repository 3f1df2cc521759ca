// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

#include <itemsim/core/common/base.hpp>
#include <itemsim/core/common/util.hpp>

namespace itemsim::cmd::common {

HumanSizeParserValidator::HumanSizeParserValidator(uint64_t min, uint64_t max) {
    description(" in [" + human_size(min) + " - " + human_size(max) + "]");
    func_ = [min, max](const std::string& value) -> std::string {
        const auto parsed_size{parse_size(value)};
        if (!parsed_size) {
            return "Value " + value + " is not a parseable size";
        }
        if (*parsed_size < min || *parsed_size > max) {
            return "Value " + value + " not in range " + human_size(min) + " to " + human_size(max);
        }
        return {};
    };
}

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->capture_default_str()
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log_settings.log_verbosity);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread names (main, pool-N)");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_work_dir(CLI::App& cli, std::filesystem::path& work_dir) {
    cli.add_option("--work-dir", work_dir, "Directory backing intermediate stashes and persisted output")
        ->default_val(work_dir.string());
}

void add_similarity_options(CLI::App& cli, similarity::Settings& settings, std::string& sort_buffer_size) {
    std::map<std::string, similarity::ScoringStrategy> scoring_mapping{
        {"adjacent", similarity::ScoringStrategy::kAdjacentPairs},
        {"bucket", similarity::ScoringStrategy::kBucketAllPairs},
    };

    cli.add_option("--rounds", settings.rounds, "Independent MinHash rounds: more rounds, better recall")
        ->capture_default_str()
        ->check(CLI::Range(1u, 10'000u));
    cli.add_option("--top-k", settings.top_k, "Candidates retained per item")
        ->capture_default_str()
        ->check(CLI::Range(1u, 1'000u));
    cli.add_option("--max-interactions", settings.max_interactions_per_user,
                   "Users interacting with more distinct items are dropped as bots")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    add_option_work_dir(cli, settings.work_dir);
    cli.add_option("--seed", settings.random_seed, "Seed of the random rounds (random when not set)");
    cli.add_option("--scoring", settings.scoring,
                   "Pairs scored per round: adjacent (linear cost) or bucket (all pairs within a digest, "
                   "quadratic in bucket size)")
        ->capture_default_str()
        ->transform(CLI::Transformer(scoring_mapping, CLI::ignore_case))
        ->default_val(similarity::ScoringStrategy::kAdjacentPairs);
    cli.add_flag("--unchecked-compaction", "Skip sort order verification while compacting keys")
        ->each([&settings](const std::string&) { settings.verify_sort_order = false; });
    cli.add_option("--workers", settings.num_workers, "Rounds scored in parallel")
        ->capture_default_str()
        ->check(CLI::Range(1u, 256u));
    cli.add_option("--output-name", settings.output_name, "Persist output records as <work-dir>/<name>");
    cli.add_option("--sort-buffer", sort_buffer_size, "In memory buffer of each external sort")
        ->default_val(human_size(settings.sort_buffer_size))
        ->check(HumanSizeParserValidator{4_Kibi, 64 * kGibi});
}

}  // namespace itemsim::cmd::common
