// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <stdexcept>

#include <itemsim/stash/stash_context.hpp>

namespace itemsim::similarity {

//! \brief Raised when a lock-step walk meets a key which is not in the label list or out of order
class compaction_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! \brief Maps string keys to dense zero based ids (their rank among the distinct sorted keys) and back.
//! Both directions walk the row stream and the label stash in lock-step, hence rows must be sorted by
//! the translated field. With verify_sort_order rows are checked to be ordered (one comparison per row)
//! and a violation raises compaction_error; without it, out of order rows go undetected until the
//! label list is exhausted.
class KeyCompactor {
  public:
    KeyCompactor(stash::StashContext& context, bool verify_sort_order)
        : context_{context}, verify_sort_order_{verify_sort_order} {}

    //! \brief Builds the sorted list of distinct values of a string field
    //! \param rows : rows whose fields up to and including `column` are strings
    //! \param column : zero based index of the field
    //! \return a stash of encoded strings, one per row, in ascending order
    stash::Stash& collate(const stash::Stash& rows, size_t column);

    //! \brief Replaces the leading string field of every row by its rank in labels
    //! \param sorted_rows : rows sorted by their leading string field
    //! \param labels : output of collate() for the same field
    stash::Stash& compact(const stash::Stash& sorted_rows, const stash::Stash& labels);

    //! \brief Replaces the leading u32 id of every row by the label at that rank
    //! \param sorted_rows : rows sorted by their leading id
    //! \param labels : the label stash the ids were computed against
    stash::Stash& restore(const stash::Stash& sorted_rows, const stash::Stash& labels);

  private:
    stash::StashContext& context_;
    bool verify_sort_order_;
};

}  // namespace itemsim::similarity
