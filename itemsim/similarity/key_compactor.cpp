// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "key_compactor.hpp"

#include <cstdint>
#include <string>

#include <itemsim/infra/common/log.hpp>
#include <itemsim/stash/row_codec.hpp>

namespace itemsim::similarity {

using stash::RowReader;
using stash::RowWriter;

stash::Stash& KeyCompactor::collate(const stash::Stash& rows, size_t column) {
    stash::Stash& keys{context_.create()};
    rows.for_each([&](ByteView row) {
        RowReader reader{row};
        for (size_t i{0}; i < column; ++i) {
            (void)reader.skip_string();
        }
        keys.append(reader.skip_string());
    });
    keys.seal();
    stash::Stash& labels{context_.sort_dedup(keys)};
    context_.release(keys);
    return labels;
}

stash::Stash& KeyCompactor::compact(const stash::Stash& sorted_rows, const stash::Stash& labels) {
    stash::Stash& output{context_.create()};
    auto label_reader{labels.reader()};
    Bytes label;
    bool has_label{label_reader.next(label)};
    uint32_t index{0};
    Bytes previous_key;
    bool has_previous{false};

    sorted_rows.for_each([&](ByteView row) {
        RowReader reader{row};
        const ByteView key{reader.skip_string()};
        if (verify_sort_order_) {
            if (has_previous && key < ByteView{previous_key}) {
                throw compaction_error("Rows not sorted by key at label index " + std::to_string(index));
            }
            previous_key.assign(key);
            has_previous = true;
        }
        while (has_label && ByteView{label} != key) {
            if (verify_sort_order_ && key < ByteView{label}) {
                throw compaction_error("Key missing from labels at label index " + std::to_string(index));
            }
            has_label = label_reader.next(label);
            ++index;
        }
        if (!has_label) {
            throw compaction_error("Labels exhausted while compacting keys");
        }
        output.append(RowWriter{}.add_u32(index).add_raw(reader.remainder()).row());
    });
    output.seal();
    return output;
}

stash::Stash& KeyCompactor::restore(const stash::Stash& sorted_rows, const stash::Stash& labels) {
    stash::Stash& output{context_.create()};
    auto label_reader{labels.reader()};
    Bytes label;
    bool has_label{label_reader.next(label)};
    uint32_t index{0};
    uint32_t previous_id{0};

    sorted_rows.for_each([&](ByteView row) {
        RowReader reader{row};
        const uint32_t id{reader.read_u32()};
        if (verify_sort_order_ && id < previous_id) {
            throw compaction_error("Rows not sorted by id: " + std::to_string(id) + " after " +
                                   std::to_string(previous_id));
        }
        previous_id = id;
        while (has_label && index != id) {
            has_label = label_reader.next(label);
            ++index;
        }
        if (!has_label) {
            throw compaction_error("Labels exhausted while restoring id " + std::to_string(id));
        }
        output.append(RowWriter{}.add_raw(label).add_raw(reader.remainder()).row());
    });
    output.seal();
    return output;
}

}  // namespace itemsim::similarity
