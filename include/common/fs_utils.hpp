//! # Filesystem Helpers
//!
//! Small wrappers over `std::filesystem` used by several stages. All of them
//! report failures through return values, never exceptions.

#ifndef RELPACK_COMMON_FS_UTILS_HPP
#define RELPACK_COMMON_FS_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace relpack {

/// Reads an entire file in binary mode.
std::optional<std::string> read_file(const fs::path& path);

/// Writes `content` to `path`, creating parent directories. Returns false on failure.
bool write_file(const fs::path& path, const std::string& content);

/// Recursively copies `from` to `to`, preserving symlinks as symlinks.
/// Returns an error description, or an empty string on success.
std::string copy_tree(const fs::path& from, const fs::path& to);

/// Removes `path` recursively if it exists. Returns false on failure.
bool remove_tree(const fs::path& path);

/// Sum of regular file sizes below `root` (symlinks are not followed).
uint64_t directory_size(const fs::path& root);

/// Adds the execute bits matching the existing read bits.
bool make_executable(const fs::path& path);

/// Replaces characters that do not belong in a file name (spaces included) with '_'.
std::string sanitize_file_name(const std::string& name);

/// Removes the registered files and directories when it goes out of scope,
/// whichever way the scope is left. `dismiss()` keeps them.
class ScratchPaths {
public:
    ScratchPaths() = default;
    ~ScratchPaths();

    ScratchPaths(const ScratchPaths&) = delete;
    ScratchPaths& operator=(const ScratchPaths&) = delete;

    void add(fs::path path) {
        paths_.push_back(std::move(path));
    }

    void dismiss() {
        paths_.clear();
    }

private:
    std::vector<fs::path> paths_;
};

} // namespace relpack

#endif // RELPACK_COMMON_FS_UTILS_HPP
