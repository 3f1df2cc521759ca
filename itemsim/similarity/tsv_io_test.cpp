// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "tsv_io.hpp"

#include <fstream>
#include <stdexcept>

#include <catch2/catch.hpp>

#include <itemsim/infra/common/directories.hpp>
#include <itemsim/infra/test_util/log.hpp>

namespace itemsim::similarity {

namespace fs = std::filesystem;

static fs::path write_file(const fs::path& path, const std::string& content) {
    std::ofstream f{path, std::ios_base::binary};
    f << content;
    return path;
}

TEST_CASE("TsvEdgeSource") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;

    SECTION("edges from several files") {
        const auto first{write_file(tmp_dir.path() / "a.tsv", "u1\ta\nu1\tb\textra\tcolumns\r\n\tc\nu3\t\nmalformed\n")};
        const auto empty{write_file(tmp_dir.path() / "b.tsv", "")};
        const auto last{write_file(tmp_dir.path() / "c.tsv", "u2\ta")};
        TsvEdgeSource source{std::vector<fs::path>{first, empty, last}};

        std::vector<RawEdge> edges;
        while (auto edge = source.next()) {
            edges.push_back(*edge);
        }
        CHECK(edges == std::vector<RawEdge>{{"u1", "a"}, {"u1", "b"}, {"u2", "a"}});
        CHECK(source.lines_read() == 6);
        CHECK(source.lines_skipped() == 3);
        CHECK_FALSE(source.next().has_value());
    }

    SECTION("missing file") {
        TsvEdgeSource source{std::vector<fs::path>{tmp_dir.path() / "missing.tsv"}};
        CHECK_THROWS_AS(source.next(), std::runtime_error);
    }
}

TEST_CASE("format_record") {
    CHECK(format_record({"a", {{"b", 0.5f}, {"c", 0.25f}}}) == "a\tb:0.500,c:0.250");
    CHECK(format_record({"x", {{"y", 2.0f / 3.0f}, {"z", 1.0f}}}) == "x\ty:0.667,z:1.000");
    CHECK(format_record({"a", {}}) == "a\t");
}

}  // namespace itemsim::similarity
