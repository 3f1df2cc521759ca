// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "file_provider.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>

#include <itemsim/infra/common/safe_strerror.hpp>

namespace itemsim::stash {

namespace fs = std::filesystem;

FileProvider::FileProvider(std::string file_name, size_t id) : id_{id}, file_name_{std::move(file_name)} {}

FileProvider::~FileProvider() { reset(); }

void FileProvider::flush(const Buffer& buffer) {
    head_t head{};

    // Check we have enough space to store all data
    const auto& rows{buffer.rows()};
    file_size_ = buffer.size();
    fs::path workdir(fs::path(file_name_).parent_path());
    if (fs::space(workdir).available < file_size_) {
        file_size_ = 0;
        throw stash_error("Insufficient disk space for sort run in " + workdir.string());
    }

    file_.open(file_name_, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (!file_.is_open()) {
        const auto err{errno};
        reset();
        throw stash_error("Unable to create sort run " + file_name_ + ": " + safe_strerror(err));
    }

    for (const auto& row : rows) {
        head.length = static_cast<uint32_t>(row.size());
        if (!file_.write(byte_ptr_cast(head.bytes), sizeof(head_t)) ||
            !file_.write(byte_ptr_cast(row.data()), static_cast<std::streamsize>(row.size()))) {
            const auto err{errno};
            reset();
            throw stash_error("Unable to write sort run " + file_name_ + ": " + safe_strerror(err));
        }
    }

    // Close file in output mode and reopen for input mode
    file_.close();
    file_.open(file_name_, std::ios_base::in | std::ios_base::binary);
    if (!file_.is_open()) {
        const auto err{errno};
        reset();
        throw stash_error("Unable to reopen sort run " + file_name_ + ": " + safe_strerror(err));
    }
}

std::optional<std::pair<Bytes, size_t>> FileProvider::read_row() {
    head_t head{};

    if (!file_.is_open() || !file_size_) {
        throw stash_error("Invalid sort run handle");
    }

    if (!file_.read(byte_ptr_cast(head.bytes), sizeof(head_t))) {
        reset();
        return std::nullopt;
    }

    Bytes row(head.length, '\0');
    if (!file_.read(byte_ptr_cast(row.data()), head.length)) {
        const auto err{errno};
        reset();
        throw stash_error("Truncated sort run " + file_name_ + ": " + safe_strerror(err));
    }

    return std::make_pair(std::move(row), id_);
}

void FileProvider::reset() {
    file_size_ = 0;
    if (file_.is_open()) {
        file_.close();
    }
    std::error_code ec;
    fs::remove(file_name_, ec);
}

}  // namespace itemsim::stash
