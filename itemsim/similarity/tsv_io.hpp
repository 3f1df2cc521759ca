// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <itemsim/similarity/edge_source.hpp>
#include <itemsim/similarity/types.hpp>

namespace itemsim::similarity {

//! \brief EdgeSource reading `user<TAB>item` lines from a list of files, one after the other.
//! Lines missing either key are skipped and counted; fields after the second are ignored
class TsvEdgeSource final : public EdgeSource {
  public:
    explicit TsvEdgeSource(std::vector<std::filesystem::path> files);

    std::optional<RawEdge> next() override;

    uint64_t lines_read() const noexcept { return lines_read_; }
    uint64_t lines_skipped() const noexcept { return lines_skipped_; }

  private:
    bool open_next_file();

    std::vector<std::filesystem::path> files_;
    size_t next_file_{0};
    std::ifstream current_;
    std::string line_;
    uint64_t lines_read_{0};
    uint64_t lines_skipped_{0};
};

//! \brief Formats a record as `item<TAB>candidate:score,candidate:score,...` with scores in fixed point, 3 decimals
std::string format_record(const RecommendationRecord& record);

}  // namespace itemsim::similarity
