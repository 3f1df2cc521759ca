// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sorter.hpp"

#include <queue>
#include <string>
#include <utility>

#include <itemsim/core/common/util.hpp>
#include <itemsim/infra/common/log.hpp>

namespace itemsim::stash {

namespace fs = std::filesystem;

ExternalSorter::ExternalSorter(fs::path work_path, size_t optimal_size, bool reverse)
    : work_path_{std::move(work_path)}, buffer_{optimal_size}, reverse_{reverse} {
    if (fs::exists(work_path_) && !fs::is_directory(work_path_)) {
        throw stash_error("Invalid sort directory " + work_path_.string());
    }
    fs::create_directories(work_path_);
}

ExternalSorter::~ExternalSorter() {
    file_providers_.clear();  // Will ensure all run files (if any) have been closed and deleted
}

void ExternalSorter::flush_buffer() {
    if (buffer_.empty()) {
        return;
    }
    buffer_.sort_unique(reverse_);

    fs::path run_path{work_path_ /
                      fs::path(std::to_string(unique_id_) + "-" + std::to_string(file_providers_.size()) + ".run")};

    file_providers_.emplace_back(std::make_unique<FileProvider>(run_path.string(), file_providers_.size()));
    file_providers_.back()->flush(buffer_);
    buffer_.clear();
    log::Trace("Sort run spilled", {"path", file_providers_.back()->get_file_name(), "size",
                                    human_size(file_providers_.back()->get_file_size())});
}

void ExternalSorter::collect(ByteView row) {
    buffer_.put(row);
    ++size_;
    if (buffer_.overflows()) {
        flush_buffer();
    }
}

void ExternalSorter::collect(Bytes&& row) {
    buffer_.put(std::move(row));
    ++size_;
    if (buffer_.overflows()) {
        flush_buffer();
    }
}

uint64_t ExternalSorter::load(Stash& target) {
    uint64_t loaded{0};

    // Everything fits in memory: no merge needed
    if (file_providers_.empty()) {
        buffer_.sort_unique(reverse_);
        for (const auto& row : buffer_.rows()) {
            target.append(row);
            ++loaded;
        }
        buffer_.clear();
        size_ = 0;
        return loaded;
    }

    // Spill the not overflown tail too
    flush_buffer();

    // Top of the queue is the smallest row (largest when reverse)
    const bool reverse{reverse_};
    auto row_comparer = [reverse](const std::pair<Bytes, size_t>& left, const std::pair<Bytes, size_t>& right) {
        return reverse ? left.first < right.first : right.first < left.first;
    };
    std::priority_queue<std::pair<Bytes, size_t>, std::vector<std::pair<Bytes, size_t>>, decltype(row_comparer)>
        queue(row_comparer);

    // Read one row from each run and let the queue order them
    for (auto& file_provider : file_providers_) {
        auto item{file_provider->read_row()};
        if (item.has_value()) {
            queue.push(std::move(*item));
        }
    }

    Bytes last_row;
    bool has_last{false};
    while (!queue.empty()) {
        auto [row, provider_index]{queue.top()};
        queue.pop();

        // Runs are unique on their own; duplicates can only come from different runs
        if (!has_last || row != last_row) {
            target.append(row);
            ++loaded;
            last_row = std::move(row);
            has_last = true;
        }

        auto& file_provider{file_providers_.at(provider_index)};
        auto next{file_provider->read_row()};
        if (next.has_value()) {
            queue.push(std::move(*next));
        } else {
            file_provider->reset();
        }
    }

    file_providers_.clear();
    size_ = 0;
    return loaded;
}

}  // namespace itemsim::stash
