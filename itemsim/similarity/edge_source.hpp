// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include <itemsim/similarity/types.hpp>

namespace itemsim::similarity {

//! \brief Pull interface to the interaction log collaborator.
//! Implementations own decoding of their raw format and skip records missing a key
class EdgeSource {
  public:
    virtual ~EdgeSource() = default;

    //! \return the next edge or nullopt at end of input
    virtual std::optional<RawEdge> next() = 0;
};

//! \brief EdgeSource over edges already in memory
class VectorEdgeSource final : public EdgeSource {
  public:
    explicit VectorEdgeSource(std::vector<RawEdge> edges) : edges_{std::move(edges)} {}

    std::optional<RawEdge> next() override {
        if (position_ == edges_.size()) {
            return std::nullopt;
        }
        return edges_[position_++];
    }

  private:
    std::vector<RawEdge> edges_;
    size_t position_{0};
};

}  // namespace itemsim::similarity
