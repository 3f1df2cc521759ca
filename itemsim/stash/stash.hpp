// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>

#include <itemsim/core/common/bytes.hpp>

namespace itemsim::stash {

//! \brief Sequential reader over the rows of a stash file, always starting from the first row
class StashReader {
  public:
    explicit StashReader(const std::filesystem::path& path);

    //! \brief Reads the next row into the provided buffer
    //! \return false once all rows have been read
    bool next(Bytes& row);

  private:
    std::filesystem::path path_;
    std::ifstream file_;
};

//! \brief A disk backed, re-iterable sequence of rows.
//! A stash is written once (append then seal) and may then be read any number of times.
//! Instances are owned by a StashContext which reclaims their backing files.
class Stash {
    // Restricts the read-only constructor to adopt()
    struct AdoptTag {
        explicit AdoptTag() = default;
    };

  public:
    //! \brief Creates a new empty stash backed by the given file, open for appending
    explicit Stash(std::filesystem::path path);

    Stash(std::filesystem::path path, AdoptTag);

    //! \brief Wraps an existing row file read-only. The file is never removed by this instance
    static std::unique_ptr<Stash> adopt(std::filesystem::path path);

    ~Stash();

    // Not copyable nor movable
    Stash(const Stash&) = delete;
    Stash& operator=(const Stash&) = delete;

    void append(ByteView row);

    //! \brief Ends the write phase. Further appends throw
    void seal();

    bool sealed() const noexcept { return sealed_; }

    //! \brief Returns a reader replaying the full sequence from the start
    StashReader reader() const;

    //! \brief Visits every row in order
    void for_each(const std::function<void(ByteView)>& visitor) const;

    //! \brief Counts rows by scanning the backing file
    uint64_t length() const;

    //! \brief Size in bytes of the backing file
    uint64_t file_size() const;

    const std::filesystem::path& path() const noexcept { return path_; }

    //! \brief Copies the backing file to destination, outside the lifetime management of the owning context
    void copy_to(const std::filesystem::path& destination) const;

    //! \brief Closes and removes the backing file (if owned)
    void discard() noexcept;

  private:
    void ensure_sealed() const;

    std::filesystem::path path_;
    bool owned_;
    bool sealed_{false};
    std::ofstream writer_;
};

}  // namespace itemsim::stash
