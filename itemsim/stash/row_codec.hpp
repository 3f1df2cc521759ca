// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <itemsim/core/common/bytes.hpp>

namespace itemsim::stash {

// Rows are byte strings whose lexicographic (unsigned) order is the logical order of their fields:
// - strings are written with every 0x00 escaped as 0x00 0xFF and terminated by 0x00 0x01, so a
//   string sorts before any of its extensions and embedded zeros keep their rank
// - integers are written fixed width big endian

//! \brief Appends fields to a row
class RowWriter {
  public:
    RowWriter() = default;

    RowWriter& add_string(std::string_view value);
    RowWriter& add_u32(uint32_t value);
    RowWriter& add_u64(uint64_t value);

    //! \brief Appends already encoded fields (e.g. the tail of another row)
    RowWriter& add_raw(ByteView encoded);

    const Bytes& row() const noexcept { return row_; }
    Bytes release() noexcept { return std::move(row_); }

  private:
    Bytes row_;
};

//! \brief Reads fields from a row in the order they were written
//! \remarks Throws stash_error on truncated or malformed rows
class RowReader {
  public:
    explicit RowReader(ByteView row) : row_{row} {}

    std::string read_string();
    uint32_t read_u32();
    uint64_t read_u64();

    //! \brief Skips a string field returning its encoded form (terminator included)
    ByteView skip_string();

    //! \brief Returns the not yet consumed encoded fields
    ByteView remainder() const noexcept { return row_.substr(pos_); }

    bool at_end() const noexcept { return pos_ == row_.size(); }

  private:
    ByteView row_;
    size_t pos_{0};
};

//! \brief Encodes a float score into a u32 preserving order for non-negative values
uint32_t score_to_u32(float score) noexcept;

//! \brief Inverse of score_to_u32
float score_from_u32(uint32_t bits) noexcept;

}  // namespace itemsim::stash
