// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stash_context.hpp"

#include <algorithm>
#include <string>
#include <system_error>

#include <itemsim/core/common/util.hpp>
#include <itemsim/infra/common/log.hpp>
#include <itemsim/infra/common/stopwatch.hpp>
#include <itemsim/stash/util.hpp>

namespace itemsim::stash {

namespace fs = std::filesystem;

static fs::path ensure_work_dir(const fs::path& work_dir) {
    Directory directory{work_dir, /*must_create=*/true};
    return fs::absolute(directory.path());
}

StashContext::StashContext(const fs::path& work_dir, size_t sort_buffer_size)
    : work_dir_{ensure_work_dir(work_dir)}, temp_dir_{work_dir_}, sort_buffer_size_{sort_buffer_size} {
    log::Debug("Stash context opened", {"path", temp_dir_.path().string()});
}

StashContext::~StashContext() {
    const auto count{stashes_.size()};
    stashes_.clear();
    log::Debug("Stash context closed", {"reclaimed", std::to_string(count)});
}

Stash& StashContext::create() {
    fs::path path{temp_dir_.path() / ("stash-" + std::to_string(next_id_++) + ".rows")};
    stashes_.push_back(std::make_unique<Stash>(path));
    return *stashes_.back();
}

Stash& StashContext::create(const std::vector<Bytes>& rows) {
    Stash& stash{create()};
    for (const auto& row : rows) {
        stash.append(row);
    }
    stash.seal();
    return stash;
}

Stash& StashContext::adopt(const fs::path& file) {
    stashes_.push_back(Stash::adopt(file));
    return *stashes_.back();
}

Stash& StashContext::sort_dedup(const Stash& source, bool reverse) {
    StopWatch sw{StopWatch::kStart};
    ExternalSorter sorter{temp_dir_.path() / "sort", sort_buffer_size_, reverse};
    source.for_each([&sorter](ByteView row) { sorter.collect(row); });

    const auto collected{sorter.size()};
    const auto runs{sorter.runs()};
    Stash& target{create()};
    const auto loaded{sorter.load(target)};
    target.seal();

    log::Trace("Stash sorted", {"in", std::to_string(collected), "out", std::to_string(loaded), "runs",
                                std::to_string(runs), "reverse", reverse ? "true" : "false", "elapsed",
                                StopWatch::format(sw.since_start())});
    return target;
}

Stash& StashContext::sorted(const std::vector<Bytes>& rows, bool reverse) {
    Stash& unsorted{create(rows)};
    Stash& result{sort_dedup(unsorted, reverse)};
    release(unsorted);
    return result;
}

fs::path StashContext::persist(const Stash& stash, std::string_view name) const {
    const fs::path destination{work_dir_ / fs::path{name}};
    fs::path staging{destination};
    staging += ".partial";
    auto remove_staging = [&staging]() {
        std::error_code ec;
        if (fs::is_regular_file(staging, ec)) {
            fs::remove(staging, ec);
        }
    };

    // A previous result at destination stays untouched unless the full copy succeeds
    try {
        stash.copy_to(staging);
    } catch (const stash_error&) {
        remove_staging();
        throw;
    }
    std::error_code ec;
    fs::rename(staging, destination, ec);
    if (ec) {
        remove_staging();
        throw stash_error("Unable to persist stash to " + destination.string() + ": " + ec.message());
    }
    log::Info("Stash persisted", {"path", destination.string(), "size", human_size(fs::file_size(destination))});
    return destination;
}

void StashContext::release(Stash& stash) {
    auto it{std::find_if(stashes_.begin(), stashes_.end(), [&stash](const auto& s) { return s.get() == &stash; })};
    if (it == stashes_.end()) {
        throw stash_error("Releasing a stash not owned by this context: " + stash.path().string());
    }
    stashes_.erase(it);
}

}  // namespace itemsim::stash
