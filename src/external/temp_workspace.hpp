/**
 * @file    temp_workspace.hpp
 * @brief   Scoped temporary files and directories for external tool calls
 * @license MIT
 *
 * @details
 * Every handle owns a uniquely named path created atomically on disk and
 * removes it in its destructor, so no exit path (success, tool failure,
 * exception) leaves files behind. Handles are move-only.
 */

#pragma once

#include "core/types.hpp"

#include <filesystem>
#include <string_view>

namespace nxc::external {

/**
 * A temporary regular file, removed on destruction
 */
class ScopedTempFile {
public:
    ScopedTempFile() = default;
    explicit ScopedTempFile(std::filesystem::path path) noexcept;
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;
    ScopedTempFile(ScopedTempFile&& other) noexcept;
    ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool valid() const noexcept { return !path_.empty(); }

    // Replace the file content
    void write(const Bytes& data) const;

    // Read the whole file
    [[nodiscard]] Bytes read() const;

private:
    void remove() noexcept;

    std::filesystem::path path_;
};

/**
 * A temporary directory, removed recursively on destruction
 */
class ScopedTempDir {
public:
    ScopedTempDir() = default;
    explicit ScopedTempDir(std::filesystem::path path) noexcept;
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool valid() const noexcept { return !path_.empty(); }

private:
    void remove() noexcept;

    std::filesystem::path path_;
};

/**
 * Allocator of scoped temporaries under one root directory
 */
class TempWorkspace {
public:
    /**
     * @param root  Parent directory (created if missing)
     * @throws PipelineError(ExternalTool) if root cannot be created
     */
    explicit TempWorkspace(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /**
     * Create a unique empty file
     * @param suffix  File name suffix, e.g. ".mp4" (may be empty)
     */
    [[nodiscard]] ScopedTempFile acquire_file(std::string_view suffix = {}) const;

    // Create a unique empty directory
    [[nodiscard]] ScopedTempDir acquire_dir() const;

private:
    std::filesystem::path root_;
};

// Read a whole file into memory
[[nodiscard]] Bytes read_file(const std::filesystem::path& path);

// Write a buffer to a file, replacing it
void write_file(const std::filesystem::path& path, const Bytes& data);

}  // namespace nxc::external
