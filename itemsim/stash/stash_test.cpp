// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stash.hpp"

#include <vector>

#include <catch2/catch.hpp>

#include <itemsim/infra/common/directories.hpp>
#include <itemsim/stash/row_codec.hpp>
#include <itemsim/stash/util.hpp>

namespace itemsim::stash {

namespace fs = std::filesystem;

static std::vector<Bytes> read_all(const Stash& stash) {
    std::vector<Bytes> rows;
    stash.for_each([&rows](ByteView row) { rows.emplace_back(row); });
    return rows;
}

TEST_CASE("Stash") {
    TemporaryDirectory tmp_dir;
    const fs::path path{tmp_dir.path() / "edges.rows"};
    const std::vector<Bytes> rows{
        RowWriter{}.add_string("u1").add_string("a").release(),
        Bytes{},
        RowWriter{}.add_string("u2").add_u32(3).release(),
    };

    SECTION("replays the full sequence") {
        Stash stash{path};
        for (const auto& row : rows) {
            stash.append(row);
        }
        CHECK_THROWS_AS(stash.length(), stash_error);  // not sealed yet
        stash.seal();
        CHECK(stash.sealed());
        CHECK_THROWS_AS(stash.append(rows[0]), stash_error);

        CHECK(read_all(stash) == rows);
        CHECK(read_all(stash) == rows);
        CHECK(stash.length() == 3);
        CHECK(stash.file_size() > 0);

        auto reader{stash.reader()};
        Bytes row;
        REQUIRE(reader.next(row));
        CHECK(row == rows[0]);
    }

    SECTION("owned file is removed") {
        {
            Stash stash{path};
            stash.seal();
            CHECK(fs::exists(path));
            CHECK(stash.length() == 0);
        }
        CHECK_FALSE(fs::exists(path));
    }

    SECTION("copy and adopt") {
        const fs::path copy_path{tmp_dir.path() / "copy.rows"};
        {
            Stash stash{path};
            for (const auto& row : rows) {
                stash.append(row);
            }
            stash.seal();
            stash.copy_to(copy_path);
        }
        REQUIRE(fs::exists(copy_path));
        {
            auto adopted{Stash::adopt(copy_path)};
            CHECK(adopted->sealed());
            CHECK(read_all(*adopted) == rows);
            CHECK_THROWS_AS(adopted->append(rows[0]), stash_error);
        }
        CHECK(fs::exists(copy_path));  // adopted files are never removed
        CHECK_THROWS_AS(Stash::adopt(tmp_dir.path() / "missing.rows"), stash_error);
    }

    SECTION("truncated file") {
        {
            std::ofstream f{path, std::ios_base::binary};
            f << "\x05";
        }
        auto adopted{Stash::adopt(path)};
        CHECK_THROWS_AS(adopted->length(), stash_error);
    }
}

}  // namespace itemsim::stash
