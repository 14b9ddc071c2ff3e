#include "tools/tool_cache.hpp"

#include "common/fs_utils.hpp"
#include "common/sha256.hpp"
#include "log/log.hpp"
#include "process/subprocess.hpp"

#include <fstream>
#include <sstream>

namespace relpack::tools {

namespace {

constexpr const char* INDEX_FILE = "tools.idx";
constexpr int SMOKE_TIMEOUT_SECONDS = 60;

std::string index_key(const std::string& name, const std::string& version) {
    return name + "@" + version;
}

} // namespace

// ============================================================================
// CommandFetcher
// ============================================================================

std::string CommandFetcher::fetch(const std::string& url, const fs::path& destination) {
    std::vector<std::string> argv;
    if (process::find_program("curl")) {
        argv = {"curl", "-fsSL", "-o", destination.string(), url};
    } else if (process::find_program("wget")) {
        argv = {"wget", "-q", "-O", destination.string(), url};
    } else {
        return "neither curl nor wget is available";
    }

    process::ProcessOptions options;
    options.timeout_seconds = timeout_seconds_;
    auto result = process::run_process(argv, options);
    if (result.timed_out)
        return "download timed out after " + std::to_string(timeout_seconds_) + "s";
    if (!result.ok()) {
        std::string detail = result.stderr_output.empty() ? result.stdout_output
                                                          : result.stderr_output;
        return argv.front() + " exited with code " + std::to_string(result.exit_code) +
               (detail.empty() ? std::string() : ": " + detail);
    }
    return {};
}

// ============================================================================
// ToolCache
// ============================================================================

ToolCache::ToolCache(fs::path cache_dir, Box<Fetcher> fetcher)
    : cache_dir_(std::move(cache_dir)), fetcher_(std::move(fetcher)) {
    if (!fetcher_)
        fetcher_ = make_box<CommandFetcher>();
}

std::optional<fs::path> ToolCache::lookup(const std::string& name,
                                          const std::string& version) const {
    fs::path path = tool_path(name, version);
    if (process::is_executable(path))
        return path;
    return std::nullopt;
}

Result<fs::path> ToolCache::acquire(const std::string& name, const std::string& version,
                                    const std::string& url,
                                    const std::vector<std::string>& smoke_args) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto cached = lookup(name, version)) {
        RELPACK_LOG_DEBUG("tools", "Cache hit for " << name << " " << version);
        return *cached;
    }

    if (url.empty()) {
        return make_error(ErrorKind::FetchError, "no download URL for tool '" + name + "'",
                          "add a [tool." + name + "] section with a url to relpack.toml");
    }

    fs::path target = tool_path(name, version);
    fs::path partial = target;
    partial += ".part";

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return make_error(ErrorKind::FetchError,
                          "cannot create " + target.parent_path().string() + ": " + ec.message(),
                          "check that the cache directory is writable");
    }

    RELPACK_LOG_INFO("tools", "Downloading " << name << " " << version << " from " << url);
    ++fetch_count_;
    std::string fetch_error = fetcher_->fetch(url, partial);
    if (!fetch_error.empty()) {
        fs::remove(partial, ec);
        return make_error(ErrorKind::FetchError,
                          "download of " + name + " failed: " + fetch_error,
                          "check network access and the url in [tool." + name + "]");
    }
    if (!fs::exists(partial) || fs::file_size(partial, ec) == 0) {
        fs::remove(partial, ec);
        return make_error(ErrorKind::FetchError, "download of " + name + " produced no data",
                          "check the url in [tool." + name + "]");
    }

    fs::rename(partial, target, ec);
    if (ec) {
        fs::remove(partial, ec);
        return make_error(ErrorKind::FetchError, "cannot move " + name + " into the cache");
    }
    make_executable(target);

    // A tool that does not start is worse than no tool.
    std::vector<std::string> argv{target.string()};
    argv.insert(argv.end(), smoke_args.begin(), smoke_args.end());
    process::ProcessOptions options;
    options.timeout_seconds = SMOKE_TIMEOUT_SECONDS;
    auto smoke = process::run_process(argv, options);
    if (!smoke.ok()) {
        fs::remove(target, ec);
        return make_error(ErrorKind::FetchError,
                          name + " failed its smoke test (`" + process::format_command(argv) +
                              "` exited with " + std::to_string(smoke.exit_code) + ")",
                          "the download may be corrupt or built for another architecture");
    }

    CacheEntry entry;
    entry.name = name;
    entry.version = version;
    entry.path = target;
    entry.sha256 = sha256_file(target).value_or("");
    entry.size = fs::file_size(target, ec);
    record(entry);

    RELPACK_LOG_INFO("tools", "Cached " << name << " " << version << " at " << target.string());
    return target;
}

std::vector<CacheEntry> ToolCache::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CacheEntry> result;
    for (auto& [_, entry] : load_index()) {
        result.push_back(entry);
    }
    return result;
}

bool ToolCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    RELPACK_LOG_INFO("tools", "Clearing tool cache " << cache_dir_.string());
    return remove_tree(cache_dir_);
}

/// Index format (pipe-delimited): `name|version|sha256|size`
std::map<std::string, CacheEntry> ToolCache::load_index() const {
    std::map<std::string, CacheEntry> index;
    std::ifstream file(cache_dir_ / INDEX_FILE);
    if (!file)
        return index;

    std::string line;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        std::string name, version, digest, size_str;
        if (std::getline(iss, name, '|') && std::getline(iss, version, '|') &&
            std::getline(iss, digest, '|') && std::getline(iss, size_str)) {
            CacheEntry entry;
            entry.name = name;
            entry.version = version;
            entry.path = tool_path(name, version);
            entry.sha256 = digest;
            try {
                entry.size = std::stoull(size_str);
            } catch (const std::exception&) {
                RELPACK_LOG_WARN("tools", "Skipping malformed index line: " << line);
                continue;
            }
            index[index_key(name, version)] = entry;
        }
    }
    return index;
}

void ToolCache::save_index(const std::map<std::string, CacheEntry>& index) const {
    std::ostringstream out;
    for (const auto& [_, entry] : index) {
        out << entry.name << "|" << entry.version << "|" << entry.sha256 << "|" << entry.size
            << "\n";
    }
    if (!write_file(cache_dir_ / INDEX_FILE, out.str())) {
        RELPACK_LOG_WARN("tools", "Cannot write " << (cache_dir_ / INDEX_FILE).string());
    }
}

void ToolCache::record(const CacheEntry& entry) {
    auto index = load_index();
    index[index_key(entry.name, entry.version)] = entry;
    save_index(index);
}

} // namespace relpack::tools
