// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

namespace itemsim {

//! \brief Directory class acts as a wrapper around common functions and properties of a filesystem directory object
class Directory {
  public:
    //! Creates an instance of a Directory object provided the path
    //! \param [in] directory_path : the path of the directory
    //! \param [in] must_create : whether the directory must be created on filesystem should not exist
    explicit Directory(const std::filesystem::path& directory_path, bool must_create = false);
    virtual ~Directory() = default;

    // Not copyable nor movable
    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    //! \brief Returns whether this Directory is empty
    bool is_empty() const;

    const std::filesystem::path& path() const;

    //! \brief Creates the directory on filesystem should not exist
    void create();

  protected:
    std::filesystem::path path_;
};

//! \brief TemporaryDirectory is a Directory which is automatically deleted on destructor of the instance.
//! The full path of the directory starts from a given path plus the discovery of a unique non-existent sub-path.
//! Should no initial path be given, TemporaryDirectory is built from the OS temporary storage location
class TemporaryDirectory final : public Directory {
  public:
    explicit TemporaryDirectory(const std::filesystem::path& base_path)
        : Directory(TemporaryDirectory::get_unique_temporary_path(base_path), true) {}

    explicit TemporaryDirectory() : Directory(TemporaryDirectory::get_unique_temporary_path(), true) {}

    ~TemporaryDirectory() final;

    //! \brief Returns the path to OS provided temporary storage location
    static std::filesystem::path get_os_temporary_path();
    //! \brief Builds a unique non-existent path below OS provided temporary storage location
    static std::filesystem::path get_unique_temporary_path();
    //! \brief Builds a unique non-existent path below user provided storage location
    static std::filesystem::path get_unique_temporary_path(const std::filesystem::path& base_path);
};

}  // namespace itemsim
