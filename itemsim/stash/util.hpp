// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <stdexcept>

namespace itemsim::stash {

//! \brief Raised on any I/O failure of a stash, a sort run or a relocation. Always fatal for the run
class stash_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Head of each row on file
union head_t {
    uint32_t length;
    uint8_t bytes[4];
};

}  // namespace itemsim::stash
