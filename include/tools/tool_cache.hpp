//! # Tool Cache
//!
//! Downloads external build tools (for example `appimagetool`) once and keeps
//! them in a per-user cache directory.
//!
//! ## Layout
//!
//! ```text
//! <cache>/
//! ├── tools.idx                      # name|version|sha256|size per line
//! └── <name>/<version>/<name>        # the executable
//! ```
//!
//! ## Acquisition
//!
//! 1. If `<cache>/<name>/<version>/<name>` exists and is executable, it is
//!    returned with no network access.
//! 2. Otherwise the `Fetcher` downloads into `<name>.part`, the file is renamed
//!    into place, marked executable and smoke-tested.
//! 3. Any failure removes the partial or invalid file and yields `FetchError`.

#ifndef RELPACK_TOOLS_TOOL_CACHE_HPP
#define RELPACK_TOOLS_TOOL_CACHE_HPP

#include "common.hpp"
#include "config/build_config.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace relpack::tools {

/// Transfers a URL to a local file.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    /// Downloads `url` to `destination`. Returns an error description, or an
    /// empty string on success.
    virtual std::string fetch(const std::string& url, const fs::path& destination) = 0;
};

/// Fetcher backed by `curl -fsSL` or `wget -q`, whichever is on PATH.
class CommandFetcher : public Fetcher {
public:
    explicit CommandFetcher(int timeout_seconds = 600) : timeout_seconds_(timeout_seconds) {}

    std::string fetch(const std::string& url, const fs::path& destination) override;

private:
    int timeout_seconds_;
};

/// Metadata recorded for each cached tool.
struct CacheEntry {
    std::string name;
    std::string version;
    fs::path path;
    std::string sha256;
    uint64_t size = 0;
};

class ToolCache {
public:
    /// `fetcher` may be null, in which case a `CommandFetcher` is used.
    explicit ToolCache(fs::path cache_dir, Box<Fetcher> fetcher = nullptr);

    /// Returns the path of an executable `name` at `version`, downloading it
    /// from `url` if it is not cached yet.
    Result<fs::path> acquire(const std::string& name, const std::string& version,
                             const std::string& url,
                             const std::vector<std::string>& smoke_args = {"--version"});

    /// Convenience overload for a configured tool.
    Result<fs::path> acquire(const config::ToolSpec& spec) {
        return acquire(spec.name, spec.version, spec.url, spec.smoke_args);
    }

    /// Cached path for (name, version) without fetching.
    std::optional<fs::path> lookup(const std::string& name, const std::string& version) const;

    /// All entries recorded in the index.
    std::vector<CacheEntry> entries() const;

    /// Removes every cached tool and the index.
    bool clear();

    fs::path tool_path(const std::string& name, const std::string& version) const {
        return cache_dir_ / name / version / name;
    }

    const fs::path& cache_dir() const {
        return cache_dir_;
    }

    /// Number of downloads performed by this instance.
    size_t fetch_count() const {
        return fetch_count_;
    }

private:
    fs::path cache_dir_;
    Box<Fetcher> fetcher_;
    size_t fetch_count_ = 0;
    mutable std::mutex mutex_;

    std::map<std::string, CacheEntry> load_index() const;
    void save_index(const std::map<std::string, CacheEntry>& index) const;
    void record(const CacheEntry& entry);
};

} // namespace relpack::tools

#endif // RELPACK_TOOLS_TOOL_CACHE_HPP
