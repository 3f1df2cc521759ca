// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stash.hpp"

#include <cerrno>
#include <system_error>

#include <itemsim/infra/common/safe_strerror.hpp>
#include <itemsim/stash/util.hpp>

namespace itemsim::stash {

namespace fs = std::filesystem;

StashReader::StashReader(const fs::path& path) : path_{path}, file_{path, std::ios_base::in | std::ios_base::binary} {
    if (!file_.is_open()) {
        throw stash_error("Unable to open stash " + path_.string() + ": " + safe_strerror(errno));
    }
}

bool StashReader::next(Bytes& row) {
    head_t head{};
    if (!file_.read(byte_ptr_cast(head.bytes), sizeof(head_t))) {
        if (file_.eof() && file_.gcount() == 0) {
            return false;
        }
        throw stash_error("Truncated row header in stash " + path_.string());
    }
    row.resize(head.length);
    if (head.length && !file_.read(byte_ptr_cast(row.data()), head.length)) {
        throw stash_error("Truncated row in stash " + path_.string());
    }
    return true;
}

Stash::Stash(fs::path path) : path_{std::move(path)}, owned_{true} {
    writer_.open(path_, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (!writer_.is_open()) {
        throw stash_error("Unable to create stash " + path_.string() + ": " + safe_strerror(errno));
    }
}

Stash::Stash(fs::path path, AdoptTag) : path_{std::move(path)}, owned_{false}, sealed_{true} {}

std::unique_ptr<Stash> Stash::adopt(fs::path path) {
    if (!fs::is_regular_file(path)) {
        throw stash_error("Not a stash file: " + path.string());
    }
    return std::make_unique<Stash>(std::move(path), AdoptTag{});
}

Stash::~Stash() { discard(); }

void Stash::append(ByteView row) {
    if (sealed_) {
        throw stash_error("Append to sealed stash " + path_.string());
    }
    head_t head{};
    head.length = static_cast<uint32_t>(row.size());
    if (!writer_.write(byte_ptr_cast(head.bytes), sizeof(head_t)) ||
        !writer_.write(byte_ptr_cast(row.data()), static_cast<std::streamsize>(row.size()))) {
        throw stash_error("Unable to write stash " + path_.string() + ": " + safe_strerror(errno));
    }
}

void Stash::seal() {
    if (sealed_) {
        return;
    }
    writer_.flush();
    if (!writer_) {
        throw stash_error("Unable to flush stash " + path_.string() + ": " + safe_strerror(errno));
    }
    writer_.close();
    sealed_ = true;
}

void Stash::ensure_sealed() const {
    if (!sealed_) {
        throw stash_error("Stash " + path_.string() + " read before being sealed");
    }
}

StashReader Stash::reader() const {
    ensure_sealed();
    return StashReader{path_};
}

void Stash::for_each(const std::function<void(ByteView)>& visitor) const {
    auto rows{reader()};
    Bytes row;
    while (rows.next(row)) {
        visitor(row);
    }
}

uint64_t Stash::length() const {
    auto rows{reader()};
    Bytes row;
    uint64_t count{0};
    while (rows.next(row)) {
        ++count;
    }
    return count;
}

uint64_t Stash::file_size() const { return fs::file_size(path_); }

void Stash::copy_to(const fs::path& destination) const {
    ensure_sealed();
    std::error_code ec;
    fs::copy_file(path_, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw stash_error("Unable to persist stash to " + destination.string() + ": " + ec.message());
    }
}

void Stash::discard() noexcept {
    if (writer_.is_open()) {
        writer_.close();
    }
    if (owned_) {
        std::error_code ec;
        fs::remove(path_, ec);
        owned_ = false;
    }
    sealed_ = true;
}

}  // namespace itemsim::stash
