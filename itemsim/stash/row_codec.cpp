// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "row_codec.hpp"

#include <bit>

#include <itemsim/core/common/endian.hpp>
#include <itemsim/stash/util.hpp>

namespace itemsim::stash {

static constexpr uint8_t kEscape{0x00};
static constexpr uint8_t kEscapedZero{0xFF};
static constexpr uint8_t kTerminator{0x01};

RowWriter& RowWriter::add_string(std::string_view value) {
    row_.reserve(row_.size() + value.size() + 2);
    if (value.find('\0') == std::string_view::npos) {
        row_.append(string_view_to_byte_view(value));
    } else {
        for (const char c : value) {
            const auto byte{static_cast<uint8_t>(c)};
            row_.push_back(byte);
            if (byte == kEscape) {
                row_.push_back(kEscapedZero);
            }
        }
    }
    row_.push_back(kEscape);
    row_.push_back(kTerminator);
    return *this;
}

RowWriter& RowWriter::add_u32(uint32_t value) {
    uint8_t buffer[sizeof(uint32_t)];
    endian::store_big_u32(buffer, value);
    row_.append(buffer, sizeof(buffer));
    return *this;
}

RowWriter& RowWriter::add_u64(uint64_t value) {
    uint8_t buffer[sizeof(uint64_t)];
    endian::store_big_u64(buffer, value);
    row_.append(buffer, sizeof(buffer));
    return *this;
}

RowWriter& RowWriter::add_raw(ByteView encoded) {
    row_.append(encoded);
    return *this;
}

ByteView RowReader::skip_string() {
    const size_t start{pos_};
    while (pos_ + 1 < row_.size()) {
        if (row_[pos_] != kEscape) {
            ++pos_;
            continue;
        }
        const uint8_t next{row_[pos_ + 1]};
        pos_ += 2;
        if (next == kTerminator) {
            return row_.substr(start, pos_ - start);
        }
        if (next != kEscapedZero) {
            throw stash_error("Malformed string field in row");
        }
    }
    throw stash_error("Unterminated string field in row");
}

std::string RowReader::read_string() {
    const ByteView encoded{skip_string()};
    const size_t body_size{encoded.size() - 2};  // strip terminator
    const ByteView body{encoded.substr(0, body_size)};
    if (body.find(kEscape) == ByteView::npos) {
        return std::string{byte_view_to_string_view(body)};
    }
    std::string value;
    value.reserve(body_size);
    for (size_t i{0}; i < body_size; ++i) {
        value.push_back(static_cast<char>(encoded[i]));
        if (encoded[i] == kEscape) {
            ++i;  // skip escaped marker
        }
    }
    return value;
}

uint32_t RowReader::read_u32() {
    if (row_.size() - pos_ < sizeof(uint32_t)) {
        throw stash_error("Truncated u32 field in row");
    }
    const uint32_t value{endian::load_big_u32(&row_[pos_])};
    pos_ += sizeof(uint32_t);
    return value;
}

uint64_t RowReader::read_u64() {
    if (row_.size() - pos_ < sizeof(uint64_t)) {
        throw stash_error("Truncated u64 field in row");
    }
    const uint64_t value{endian::load_big_u64(&row_[pos_])};
    pos_ += sizeof(uint64_t);
    return value;
}

uint32_t score_to_u32(float score) noexcept { return std::bit_cast<uint32_t>(score); }

float score_from_u32(uint32_t bits) noexcept { return std::bit_cast<float>(bits); }

}  // namespace itemsim::stash
