// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace itemsim {

//! \brief Parses a size such as "256MB", "1.5 GB" or "4096" (bytes) into a number of bytes
//! \return nullopt when the string is not a size
std::optional<uint64_t> parse_size(const std::string& size_string);

//! \brief Returns a human readable representation of a byte size (e.g. "1.50 MB")
std::string human_size(uint64_t bytes, const char* unit = "B");

//! 13th variant of the 64-bit finalizer function in Austin Appleby's MurmurHash3 (https://github.com/aappleby/smhasher)
//! @param z a 64-bit integer
//! @return a 64-bit integer obtained by mixing the bits of `z`
inline uint64_t remix(uint64_t z) noexcept {
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9;
    z = (z ^ (z >> 27)) * 0x94d049bb133111eb;
    return z ^ (z >> 31);
}

}  // namespace itemsim
