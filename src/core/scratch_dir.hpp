/**
 * @file scratch_dir.hpp
 * @brief Uniquely named temporary directories.
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <string>

namespace agent_exec {

/**
 * @brief Create a fresh directory "<base>/<prefix>XXXXXX" with mode 0700.
 *
 * The random suffix comes from mkdtemp(3), so two calls never return the
 * same path while the first directory exists. An empty @p base means the
 * system temp directory.
 */
Result<std::filesystem::path> make_scratch_dir(const std::filesystem::path& base,
                                               const std::string& prefix);

/// Recursively delete @p path, ignoring errors. Returns true if nothing is left.
bool remove_tree(const std::filesystem::path& path) noexcept;

/**
 * @brief Owning handle for a scratch directory; removes it on destruction.
 */
class ScratchDir {
public:
    ScratchDir() = default;
    explicit ScratchDir(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScratchDir() { reset(); }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }

    ScratchDir& operator=(ScratchDir&& other) noexcept {
        if (this != &other) {
            reset();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool empty() const noexcept { return path_.empty(); }

    /// Give up ownership; the directory is no longer removed by this handle.
    std::filesystem::path release() noexcept {
        std::filesystem::path released = std::move(path_);
        path_.clear();
        return released;
    }

    /// Delete the directory now.
    void reset() noexcept {
        if (!path_.empty()) {
            remove_tree(path_);
            path_.clear();
        }
    }

private:
    std::filesystem::path path_;
};

}  // namespace agent_exec
