// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include <itemsim/core/common/bytes.hpp>
#include <itemsim/infra/common/directories.hpp>
#include <itemsim/stash/sorter.hpp>
#include <itemsim/stash/stash.hpp>

namespace itemsim::stash {

//! \brief Scoped owner of every stash created during a run.
//! Backing files live in a unique temporary directory below the work directory; when the context is
//! destroyed (normal end or exception unwinding) all of them are removed. Only persist() moves data
//! out of the temporary area.
class StashContext {
  public:
    explicit StashContext(const std::filesystem::path& work_dir, size_t sort_buffer_size = kOptimalSortBufferSize);
    ~StashContext();

    // Not copyable nor movable
    StashContext(const StashContext&) = delete;
    StashContext& operator=(const StashContext&) = delete;

    //! \brief Creates a fresh empty stash open for appending
    Stash& create();

    //! \brief Creates a sealed stash holding the given rows
    Stash& create(const std::vector<Bytes>& rows);

    //! \brief Wraps an already existing row file. The file is never removed by the context
    Stash& adopt(const std::filesystem::path& file);

    //! \brief Sorts the source rows by byte order (descending when reverse) removing exact duplicates
    //! \return a new sealed stash
    Stash& sort_dedup(const Stash& source, bool reverse = false);

    //! \brief Shortcut to sort_dedup rows which are not in a stash yet
    Stash& sorted(const std::vector<Bytes>& rows, bool reverse = false);

    //! \brief Copies the stash to work_dir/name, outside the temporary area.
    //! The copy is staged beside the destination and renamed over it, so a failure leaves any previous file intact
    //! \return the path of the persisted file
    std::filesystem::path persist(const Stash& stash, std::string_view name) const;

    //! \brief Reclaims the backing storage of a stash before the end of the run
    //! \remarks The reference is invalid afterwards
    void release(Stash& stash);

    //! \brief Returns the number of stashes currently tracked
    size_t size() const noexcept { return stashes_.size(); }

    const std::filesystem::path& work_dir() const noexcept { return work_dir_; }
    const std::filesystem::path& temp_path() const noexcept { return temp_dir_.path(); }

  private:
    std::filesystem::path work_dir_;
    TemporaryDirectory temp_dir_;
    size_t sort_buffer_size_;
    uint64_t next_id_{0};
    std::vector<std::unique_ptr<Stash>> stashes_;  // destroyed before temp_dir_
};

}  // namespace itemsim::stash
