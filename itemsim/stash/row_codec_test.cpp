// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "row_codec.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <itemsim/stash/util.hpp>

namespace itemsim::stash {

using namespace std::string_literals;

static Bytes encode(const std::string& first, const std::string& second) {
    return RowWriter{}.add_string(first).add_string(second).release();
}

TEST_CASE("RowWriter and RowReader") {
    SECTION("mixed fields") {
        const Bytes row{RowWriter{}.add_string("user").add_u32(42).add_u64(0x0102030405060708).add_string("").row()};
        RowReader reader{row};
        CHECK(reader.read_string() == "user");
        CHECK(reader.read_u32() == 42);
        CHECK(reader.read_u64() == 0x0102030405060708);
        CHECK(reader.read_string().empty());
        CHECK(reader.at_end());
    }

    SECTION("embedded zeros") {
        const std::string value{"a\0b\0"s};
        const Bytes row{RowWriter{}.add_string(value).add_u32(7).row()};
        RowReader reader{row};
        CHECK(reader.read_string() == value);
        CHECK(reader.read_u32() == 7);
    }

    SECTION("skip and remainder") {
        const Bytes row{encode("item", "user")};
        RowReader reader{row};
        const ByteView item{reader.skip_string()};
        CHECK(item == RowWriter{}.add_string("item").row());
        CHECK(reader.remainder() == RowWriter{}.add_string("user").row());
    }

    SECTION("malformed rows") {
        const Bytes unterminated{'a', 'b'};
        CHECK_THROWS_AS(RowReader{unterminated}.read_string(), stash_error);
        const Bytes bad_escape{'a', 0x00, 0x05};
        CHECK_THROWS_AS(RowReader{bad_escape}.read_string(), stash_error);
        const Bytes short_u32{0x00, 0x01};
        CHECK_THROWS_AS(RowReader{short_u32}.read_u32(), stash_error);
    }

    SECTION("scores") {
        for (const float score : {0.0f, 0.25f, 2.0f / 3.0f, 1.0f}) {
            CHECK(score_from_u32(score_to_u32(score)) == score);
        }
        // Non negative floats order like their bit patterns
        CHECK(score_to_u32(0.25f) < score_to_u32(0.5f));
        CHECK(~score_to_u32(0.5f) < ~score_to_u32(0.25f));
    }
}

TEST_CASE("Row byte order matches field order") {
    const std::vector<std::pair<std::string, std::string>> keys{
        {"a", "z"}, {"ab", "a"}, {"a\0"s, "b"}, {"", "x"}, {"b", ""}, {"a", "y"}, {"a\0\0"s, ""}, {"\xff", "q"},
    };
    std::vector<Bytes> rows;
    for (const auto& [first, second] : keys) {
        rows.push_back(encode(first, second));
    }

    auto expected{keys};
    std::sort(expected.begin(), expected.end());
    std::sort(rows.begin(), rows.end());

    REQUIRE(rows.size() == expected.size());
    for (size_t i{0}; i < rows.size(); ++i) {
        RowReader reader{rows[i]};
        CHECK(reader.read_string() == expected[i].first);
        CHECK(reader.read_string() == expected[i].second);
    }
}

}  // namespace itemsim::stash
