// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <functional>
#include <vector>

#include <itemsim/core/common/bytes.hpp>
#include <itemsim/stash/util.hpp>

namespace itemsim::stash {

inline constexpr size_t kInitialBufferCapacity = 32768;

// Holds a run of rows in memory, sorts and dedups them before they are spilled to a run file
class Buffer {
  public:
    // Not copyable nor movable
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    explicit Buffer(size_t optimal_size) : optimal_size_(optimal_size) { rows_.reserve(kInitialBufferCapacity); }

    void put(ByteView row) {
        size_ += row.size() + sizeof(head_t);
        rows_.emplace_back(row);
    }

    void put(Bytes&& row) {
        size_ += row.size() + sizeof(head_t);
        rows_.push_back(std::move(row));
    }

    void clear() noexcept {
        rows_.clear();
        size_ = 0;
    }

    [[nodiscard]] bool overflows() const noexcept {
        // Whether accounted size overflows optimal_size_ (i.e. time to spill)
        return size_ >= optimal_size_;
    }

    //! \brief Sorts rows (descending when reverse) and drops exact duplicates
    void sort_unique(bool reverse) {
        if (reverse) {
            std::sort(rows_.begin(), rows_.end(), std::greater<>{});
        } else {
            std::sort(rows_.begin(), rows_.end());
        }
        rows_.erase(std::unique(rows_.begin(), rows_.end()), rows_.end());
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }

    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    [[nodiscard]] const std::vector<Bytes>& rows() const noexcept { return rows_; }

  private:
    size_t optimal_size_;
    size_t size_ = 0;

    std::vector<Bytes> rows_;
};

}  // namespace itemsim::stash
