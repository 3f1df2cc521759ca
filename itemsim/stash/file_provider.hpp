// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <fstream>
#include <optional>
#include <string>
#include <utility>

#include <itemsim/stash/buffer.hpp>

namespace itemsim::stash {

/**
 * Provides an abstraction to spill a sorted run to disk
 * and re-read spilled rows sequentially
 */
class FileProvider {
  public:
    FileProvider(std::string file_name, size_t id);
    ~FileProvider();

    FileProvider(const FileProvider&) = delete;
    FileProvider& operator=(const FileProvider&) = delete;

    void flush(const Buffer& buffer);                     // Write buffer's rows to disk
    std::optional<std::pair<Bytes, size_t>> read_row();  // Read next row from file starting from position 0
    void reset();                                         // Close and remove the file

    const std::string& get_file_name() const { return file_name_; }
    size_t get_file_size() const { return file_size_; }

  private:
    size_t id_;
    std::fstream file_;
    std::string file_name_;
    size_t file_size_{0};
};

}  // namespace itemsim::stash
