// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>

#include <CLI/CLI.hpp>

#include <itemsim/infra/common/log.hpp>
#include <itemsim/similarity/settings.hpp>

namespace itemsim::cmd::common {

//! CLI11 validator accepting human readable sizes (e.g. "64MB") in a range
struct HumanSizeParserValidator : public CLI::Validator {
    explicit HumanSizeParserValidator(uint64_t min, uint64_t max);
};

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the stash backing directory
void add_option_work_dir(CLI::App& cli, std::filesystem::path& work_dir);

//! \brief Set up options to populate similarity settings after cli.parse()
//! \remarks The sort buffer size is captured as a human readable string, to be converted with parse_size()
void add_similarity_options(CLI::App& cli, similarity::Settings& settings, std::string& sort_buffer_size);

}  // namespace itemsim::cmd::common
