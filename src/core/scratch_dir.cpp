/**
 * @file scratch_dir.cpp
 * @brief mkdtemp-backed scratch directories.
 */

#include "core/scratch_dir.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

namespace agent_exec {

Result<std::filesystem::path> make_scratch_dir(const std::filesystem::path& base,
                                               const std::string& prefix) {
    std::error_code ec;
    std::filesystem::path root = base;
    if (root.empty()) {
        root = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return Error{ErrorCode::Resource, "No temp directory: " + ec.message()};
        }
    }

    std::filesystem::create_directories(root, ec);
    if (ec) {
        return Error{ErrorCode::Resource,
                     "Cannot create " + root.string() + ": " + ec.message()};
    }

    std::string pattern = (root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        return Error{ErrorCode::Resource,
                     "mkdtemp failed for " + pattern + ": " + std::strerror(errno)};
    }
    return std::filesystem::path(buffer.data());
}

bool remove_tree(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    return !std::filesystem::exists(path, ec);
}

}  // namespace agent_exec
