// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace itemsim {

//! \brief Source of randomness for round seeds and tiebreaks. Injectable so that runs can be reproduced
class EntropySource {
  public:
    virtual ~EntropySource() = default;

    //! \brief Returns 64 uniformly distributed random bits
    virtual uint64_t next_u64() = 0;

    //! \brief Returns a real uniformly distributed in [0, 1)
    double next_unit() {
        // 53 significant bits fit exactly in a double mantissa
        return static_cast<double>(next_u64() >> 11) * 0x1.0p-53;
    }
};

//! \brief EntropySource backed by a 64-bit Mersenne twister
class Mt19937EntropySource final : public EntropySource {
  public:
    //! \param seed : when empty the generator is seeded from std::random_device
    explicit Mt19937EntropySource(std::optional<uint64_t> seed = std::nullopt)
        : seed_{seed ? *seed : draw_seed()}, generator_{seed_} {}

    uint64_t next_u64() override { return generator_(); }

    //! \brief The seed actually used (log it to reproduce a run)
    uint64_t seed() const noexcept { return seed_; }

  private:
    static uint64_t draw_seed() {
        std::random_device device;
        return (static_cast<uint64_t>(device()) << 32) | device();
    }

    uint64_t seed_;
    std::mt19937_64 generator_;
};

}  // namespace itemsim
