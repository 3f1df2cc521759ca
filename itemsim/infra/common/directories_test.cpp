// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <fstream>
#include <stdexcept>

#include <catch2/catch.hpp>

namespace itemsim {

namespace fs = std::filesystem;

TEST_CASE("Directory") {
    TemporaryDirectory tmp_dir;
    const fs::path sub_path{tmp_dir.path() / "work"};

    SECTION("not created") {
        Directory directory{sub_path};
        CHECK_FALSE(fs::exists(sub_path));
        CHECK_FALSE(directory.is_empty());
        directory.create();
        CHECK(fs::is_directory(sub_path));
        CHECK(directory.is_empty());
    }

    SECTION("nested work dir") {
        Directory directory{sub_path / "a" / "b", /*must_create=*/true};
        CHECK(directory.is_empty());
        {
            std::ofstream f{directory.path() / "fake.txt"};
            f << "Some fake text" << std::flush;
        }
        CHECK_FALSE(directory.is_empty());
        directory.create();  // already there
        CHECK(fs::exists(directory.path() / "fake.txt"));
    }

    SECTION("not creatable") {
        {
            std::ofstream f{sub_path};
            f << "a file in the way" << std::flush;
        }
        CHECK_THROWS_AS(Directory(sub_path / "child", /*must_create=*/true), std::invalid_argument);
    }
}

TEST_CASE("TemporaryDirectory") {
    fs::path path;
    {
        TemporaryDirectory tmp_dir;
        path = tmp_dir.path();
        REQUIRE(fs::is_directory(path));
        {
            std::ofstream f{path / "fake.txt"};
            f << "Some fake text" << std::flush;
        }
        TemporaryDirectory nested{path};
        CHECK(nested.path().parent_path() == path);
    }
    CHECK_FALSE(fs::exists(path));
}

}  // namespace itemsim
