// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bot_filter.hpp"

#include <string>
#include <vector>

#include <itemsim/infra/common/log.hpp>
#include <itemsim/stash/row_codec.hpp>

namespace itemsim::similarity {

using stash::RowReader;
using stash::RowWriter;

stash::Stash& BotFilter::apply(const stash::Stash& raw_edges) {
    stats_ = {};
    stash::Stash& sorted_edges{context_.sort_dedup(raw_edges)};
    stash::Stash& output{context_.create()};

    // Items of the current user are held only up to the threshold: a bot never costs more memory than that
    Bytes current_user;
    std::vector<Bytes> items;
    uint64_t item_count{0};
    bool has_user{false};

    auto close_user = [&]() {
        if (!has_user) return;
        if (item_count > max_interactions_per_user_) {
            ++stats_.users_filtered;
            stats_.edges_dropped += item_count;
            ITEMSIM_DEBUG_M("Filtered user", {"user", RowReader{current_user}.read_string(), "items",
                                              std::to_string(item_count)});
        } else {
            ++stats_.users_kept;
            stats_.edges_kept += item_count;
            for (const auto& item : items) {
                output.append(RowWriter{}.add_raw(item).add_raw(current_user).row());
            }
        }
        items.clear();
        item_count = 0;
    };

    sorted_edges.for_each([&](ByteView row) {
        RowReader reader{row};
        const ByteView user{reader.skip_string()};
        const ByteView item{reader.skip_string()};
        if (!has_user || user != current_user) {
            close_user();
            current_user.assign(user);
            has_user = true;
        }
        ++item_count;  // rows are unique so every row of a user is a distinct item
        if (item_count <= max_interactions_per_user_) {
            items.emplace_back(item);
        } else {
            items.clear();
        }
    });
    close_user();
    output.seal();
    context_.release(sorted_edges);

    log::Info("Bot filter applied", {"users_kept", std::to_string(stats_.users_kept), "users_filtered",
                                     std::to_string(stats_.users_filtered), "edges_kept",
                                     std::to_string(stats_.edges_kept), "edges_dropped",
                                     std::to_string(stats_.edges_dropped)});
    return output;
}

}  // namespace itemsim::similarity
