// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Facilities to deal with byte order/endianness
Big endian is used for every integer field stored in stash rows so that
lexicographic order of the encoded bytes matches numeric order
*/

#include <cstdint>

#include <boost/endian/conversion.hpp>

namespace itemsim::endian {

inline uint32_t load_big_u32(const uint8_t* src) noexcept { return boost::endian::load_big_u32(src); }

inline uint64_t load_big_u64(const uint8_t* src) noexcept { return boost::endian::load_big_u64(src); }

inline void store_big_u32(uint8_t* dst, uint32_t value) noexcept { boost::endian::store_big_u32(dst, value); }

inline void store_big_u64(uint8_t* dst, uint64_t value) noexcept { boost::endian::store_big_u64(dst, value); }

}  // namespace itemsim::endian
