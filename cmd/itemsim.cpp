// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include <itemsim/core/common/util.hpp>
#include <itemsim/infra/common/log.hpp>
#include <itemsim/infra/common/stopwatch.hpp>
#include <itemsim/similarity/pipeline.hpp>
#include <itemsim/similarity/tsv_io.hpp>

#include "common/common.hpp"

using namespace itemsim;

struct ItemSimSettings {
    log::Settings log_settings;
    similarity::Settings settings;
    std::vector<std::filesystem::path> edge_files;
};

//! Parses command line arguments, falling back to edge file names read from stdin (one per line)
void parse_command_line(int argc, char* argv[], CLI::App& app, ItemSimSettings& settings) {
    cmd::common::add_logging_options(app, settings.log_settings);

    std::string sort_buffer_size;
    cmd::common::add_similarity_options(app, settings.settings, sort_buffer_size);
    app.add_option("files", settings.edge_files, "Tab separated user<TAB>item edge files (read from stdin if none)")
        ->check(CLI::ExistingFile);

    app.parse(argc, argv);

    const auto parsed_size{parse_size(sort_buffer_size)};
    if (!parsed_size) {
        throw std::invalid_argument("Invalid sort buffer size: " + sort_buffer_size);
    }
    settings.settings.sort_buffer_size = static_cast<size_t>(*parsed_size);

    if (settings.edge_files.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty()) settings.edge_files.emplace_back(line);
        }
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"Item to item recommendations by MinHash Jaccard similarity"};

    try {
        ItemSimSettings settings;
        parse_command_line(argc, argv, app, settings);
        log::init(settings.log_settings);
        log::set_thread_name("main");

        StopWatch sw{StopWatch::kStart};
        similarity::TsvEdgeSource source{settings.edge_files};
        similarity::Pipeline pipeline{settings.settings};
        const auto stats{pipeline.run(source, [](const similarity::RecommendationRecord& record) {
            std::cout << similarity::format_record(record) << '\n';
        })};
        std::cout.flush();
        if (!std::cout) {
            throw std::runtime_error("Unable to write recommendations to stdout");
        }

        log::Info("Recommendations written",
                  {"records", std::to_string(stats.records_emitted), "skipped_lines",
                   std::to_string(source.lines_skipped()), "seed", std::to_string(stats.seed), "elapsed",
                   StopWatch::format(sw.since_start())});
        if (stats.output_path) {
            log::Info("Output persisted", {"path", stats.output_path->string()});
        }
        return 0;
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const std::exception& e) {
        log::Critical("Exiting due to exception", {"what", e.what()});
        return -2;
    }
}
