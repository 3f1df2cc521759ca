// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include <itemsim/core/common/base.hpp>
#include <itemsim/stash/buffer.hpp>
#include <itemsim/stash/file_provider.hpp>
#include <itemsim/stash/stash.hpp>

namespace itemsim::stash {

inline constexpr size_t kOptimalSortBufferSize = 256_Mebi;

//! \brief External merge sort removing exact duplicate rows.
//! Rows are collected in memory up to the optimal size, then each run is sorted, deduped and spilled
//! to a file in the work path; load() k-way merges the runs into the target stash.
class ExternalSorter {
  public:
    // Not copyable nor movable
    ExternalSorter(const ExternalSorter&) = delete;
    ExternalSorter& operator=(const ExternalSorter&) = delete;

    explicit ExternalSorter(std::filesystem::path work_path, size_t optimal_size = kOptimalSortBufferSize,
                            bool reverse = false);
    ~ExternalSorter();

    void collect(ByteView row);
    void collect(Bytes&& row);

    //! \brief Appends the sorted unique rows to target, consuming all collected rows
    //! \return the number of rows appended
    uint64_t load(Stash& target);

    //! \brief Returns the number of collected rows (duplicates included)
    [[nodiscard]] uint64_t size() const { return size_; }

    //! \brief Returns the number of runs spilled to disk so far
    [[nodiscard]] size_t runs() const { return file_providers_.size(); }

  private:
    void flush_buffer();  // Spill buffer to a run file

    std::filesystem::path work_path_;
    Buffer buffer_;
    bool reverse_;

    // Run file names derive from the instance address: no two live sorters share it
    uintptr_t unique_id_{reinterpret_cast<uintptr_t>(this)};

    std::vector<std::unique_ptr<FileProvider>> file_providers_;
    uint64_t size_{0};
};

}  // namespace itemsim::stash
