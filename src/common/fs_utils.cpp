#include "common/fs_utils.hpp"

#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace relpack {

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool write_file(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec)
            return false;
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file)
        return false;
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(file);
}

std::string copy_tree(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
        if (ec)
            return "cannot create " + to.parent_path().string() + ": " + ec.message();
    }
    fs::copy(from, to,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks |
                 fs::copy_options::overwrite_existing,
             ec);
    if (ec)
        return "cannot copy " + from.string() + " to " + to.string() + ": " + ec.message();
    return {};
}

bool remove_tree(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

ScratchPaths::~ScratchPaths() {
    for (const auto& path : paths_) {
        if (!remove_tree(path))
            RELPACK_LOG_WARN("fs", "Cannot remove " << path.string());
    }
}

uint64_t directory_size(const fs::path& root) {
    std::error_code ec;
    uint64_t total = 0;
    if (fs::is_regular_file(fs::symlink_status(root, ec))) {
        auto size = fs::file_size(root, ec);
        return ec ? 0 : size;
    }
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code st_ec;
        if (fs::is_regular_file(it->symlink_status(st_ec))) {
            auto size = it->file_size(st_ec);
            if (!st_ec)
                total += size;
        }
    }
    return total;
}

bool make_executable(const fs::path& path) {
    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec |
                        fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::add, ec);
    return !ec;
}

std::string sanitize_file_name(const std::string& name) {
    std::string out = name;
    for (char& c : out) {
        if (c == ' ' || c == '/' || c == '\\' || c == ':' || c == '\t')
            c = '_';
    }
    return out;
}

} // namespace relpack
