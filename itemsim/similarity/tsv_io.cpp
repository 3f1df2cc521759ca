// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "tsv_io.hpp"

#include <cerrno>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <absl/strings/str_format.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include <itemsim/infra/common/log.hpp>
#include <itemsim/infra/common/safe_strerror.hpp>

namespace itemsim::similarity {

TsvEdgeSource::TsvEdgeSource(std::vector<std::filesystem::path> files) : files_{std::move(files)} {}

bool TsvEdgeSource::open_next_file() {
    if (current_.is_open()) {
        current_.close();
    }
    if (next_file_ == files_.size()) {
        return false;
    }
    const auto& path{files_[next_file_++]};
    current_.open(path);
    if (!current_.is_open()) {
        throw std::runtime_error("Unable to open edge file " + path.string() + ": " + safe_strerror(errno));
    }
    log::Info("Reading edges", {"file", path.string()});
    return true;
}

std::optional<RawEdge> TsvEdgeSource::next() {
    while (true) {
        if (!current_.is_open() && !open_next_file()) {
            return std::nullopt;
        }
        if (!std::getline(current_, line_)) {
            if (current_.bad()) {
                throw std::runtime_error("Unable to read edge file " + files_[next_file_ - 1].string());
            }
            current_.close();
            continue;
        }
        ++lines_read_;
        absl::string_view line{line_};
        absl::ConsumeSuffix(&line, "\r");
        const std::vector<absl::string_view> fields{absl::StrSplit(line, absl::MaxSplits('\t', 2))};
        if (fields.size() < 2 || fields[0].empty() || fields[1].empty()) {
            ++lines_skipped_;
            ITEMSIM_TRACE_M("Skipped edge line", {"line", std::to_string(lines_read_)});
            continue;
        }
        return RawEdge{std::string{fields[0]}, std::string{fields[1]}};
    }
}

std::string format_record(const RecommendationRecord& record) {
    std::string line{record.item_key};
    line.push_back('\t');
    bool first{true};
    for (const auto& [candidate_key, score] : record.candidates) {
        absl::StrAppendFormat(&line, "%s%s:%.3f", first ? "" : ",", candidate_key, score);
        first = false;
    }
    return line;
}

}  // namespace itemsim::similarity
