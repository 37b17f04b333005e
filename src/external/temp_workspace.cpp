/**
 * @file    temp_workspace.cpp
 * @brief   Scoped temporary files and directories implementation
 * @license MIT
 */

#include "external/temp_workspace.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace nxc::external {

namespace {

constexpr const char* kNamePrefix = "nxc_";

std::vector<char> make_template(const fs::path& root, std::string_view suffix) {
    const std::string pattern = (root / (std::string(kNamePrefix) + "XXXXXX")).string()
                                + std::string(suffix);
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');
    return name;
}

}  // anonymous namespace

// =============================================================================
// ScopedTempFile
// =============================================================================

ScopedTempFile::ScopedTempFile(fs::path path) noexcept
    : path_(std::move(path)) {}

ScopedTempFile::~ScopedTempFile() {
    remove();
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

void ScopedTempFile::write(const Bytes& data) const {
    write_file(path_, data);
}

Bytes ScopedTempFile::read() const {
    return read_file(path_);
}

void ScopedTempFile::remove() noexcept {
    if (path_.empty()) return;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temp file {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

// =============================================================================
// ScopedTempDir
// =============================================================================

ScopedTempDir::ScopedTempDir(fs::path path) noexcept
    : path_(std::move(path)) {}

ScopedTempDir::~ScopedTempDir() {
    remove();
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

void ScopedTempDir::remove() noexcept {
    if (path_.empty()) return;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temp dir {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

// =============================================================================
// TempWorkspace
// =============================================================================

TempWorkspace::TempWorkspace(fs::path root)
    : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec || !fs::is_directory(root_)) {
        throw PipelineError(ErrorKind::ExternalTool,
                            "Temporary directory is not usable",
                            fmt::format("{}: {}", root_.string(), ec.message()));
    }
}

ScopedTempFile TempWorkspace::acquire_file(std::string_view suffix) const {
    std::vector<char> name = make_template(root_, suffix);

    const int fd = ::mkstemps(name.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw PipelineError(ErrorKind::ExternalTool, "Failed to create temporary file",
                            std::strerror(errno));
    }
    ::close(fd);

    spdlog::debug("Temp file: {}", name.data());
    return ScopedTempFile(fs::path(name.data()));
}

ScopedTempDir TempWorkspace::acquire_dir() const {
    std::vector<char> name = make_template(root_, {});

    if (::mkdtemp(name.data()) == nullptr) {
        throw PipelineError(ErrorKind::ExternalTool, "Failed to create temporary directory",
                            std::strerror(errno));
    }

    spdlog::debug("Temp dir: {}", name.data());
    return ScopedTempDir(fs::path(name.data()));
}

// =============================================================================
// File helpers
// =============================================================================

Bytes read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PipelineError(ErrorKind::ExternalTool, "Failed to read file", path.string());
    }
    return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const fs::path& path, const Bytes& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw PipelineError(ErrorKind::ExternalTool, "Failed to write file", path.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw PipelineError(ErrorKind::ExternalTool, "Failed to write file", path.string());
    }
}

}  // namespace nxc::external
