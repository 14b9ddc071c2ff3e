#include "merge/universal_merger.hpp"

#include "common/fs_utils.hpp"
#include "common/sha256.hpp"
#include "log/log.hpp"
#include "macho/fat_binary.hpp"

#include <algorithm>
#include <set>

namespace relpack::merge {

namespace {

PackError merge_error(std::string message, std::string hint = {}) {
    return make_error(ErrorKind::MergeError, std::move(message), std::move(hint));
}

/// Relative paths of all regular files below `root`. Symlinks are skipped;
/// they are carried over with the template copy.
std::set<fs::path> regular_files(const fs::path& root) {
    std::set<fs::path> files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code st_ec;
        if (fs::is_regular_file(it->symlink_status(st_ec))) {
            files.insert(it->path().lexically_relative(root));
        }
    }
    return files;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty())
            out += ", ";
        out += item;
    }
    return out;
}

} // namespace

UniversalMerger::UniversalMerger(const config::BuildConfig& config) : config_(config) {}

Result<MergedArtifact> UniversalMerger::merge(const std::vector<build::Artifact>& artifacts) {
    if (artifacts.size() < 2) {
        return merge_error("merging needs at least two architectures, got " +
                               std::to_string(artifacts.size()),
                           "single-architecture builds are promoted without merging");
    }

    std::vector<std::string> arches;
    for (const auto& artifact : artifacts) {
        if (std::find(arches.begin(), arches.end(), artifact.arch) != arches.end()) {
            return merge_error("architecture " + artifact.arch + " given more than once");
        }
        arches.push_back(artifact.arch);
        if (!fs::exists(artifact.executable_path)) {
            return merge_error("missing executable " + artifact.executable_path.string(),
                               "rebuild the " + artifact.arch + " bundle");
        }
    }

    const auto& templ = artifacts.front();
    fs::path merged_root = config_.merged_bundle_path();
    RELPACK_LOG_INFO("merge", "Merging " << join(arches) << " into " << merged_root.string());

    remove_tree(merged_root);
    std::string copy_error = copy_tree(templ.bundle_path, merged_root);
    if (!copy_error.empty()) {
        return merge_error(copy_error);
    }

    MergedArtifact merged;
    merged.bundle_path = merged_root;
    merged.executable_path = merged_root / config_.executable_relpath();

    std::vector<fs::path> executables;
    for (const auto& artifact : artifacts) {
        executables.push_back(artifact.executable_path);
    }
    auto fused = macho::create_universal(executables, merged.executable_path);
    if (is_err(fused)) {
        auto error = unwrap_err(fused);
        error.hint = "check that every bundle's executable is a Mach-O binary for its architecture";
        return error;
    }

    auto reconciled = reconcile(artifacts, merged_root, merged);
    if (is_err(reconciled))
        return unwrap_err(reconciled);

    // The fused executable must report exactly the union of the inputs.
    auto info = macho::inspect(merged.executable_path);
    if (!info) {
        return merge_error("merged executable is not a Mach-O file");
    }
    auto reported = info->architectures();
    std::set<std::string> expected(arches.begin(), arches.end());
    std::set<std::string> actual(reported.begin(), reported.end());
    if (expected != actual) {
        return merge_error("merged executable reports {" + join(reported) + "}, expected {" +
                           join(arches) + "}");
    }
    merged.architectures = arches;

    for (const auto& artifact : artifacts) {
        if (!remove_tree(artifact.bundle_path)) {
            RELPACK_LOG_WARN("merge", "Cannot remove " << artifact.bundle_path.string());
        }
    }

    RELPACK_LOG_INFO("merge", "Merged bundle carries " << join(merged.architectures) << " ("
                                                       << merged.fused_files.size()
                                                       << " secondary binaries fused)");
    return merged;
}

Result<Unit> UniversalMerger::reconcile(const std::vector<build::Artifact>& artifacts,
                                        const fs::path& merged_root, MergedArtifact& merged) {
    bool strict = config_.build.resources == config::ResourcePolicy::Strict;
    const fs::path exe_rel = config_.executable_relpath();

    std::set<fs::path> all_files;
    for (const auto& artifact : artifacts) {
        auto files = regular_files(artifact.bundle_path);
        all_files.insert(files.begin(), files.end());
    }

    auto conflict = [&](const fs::path& rel, const std::string& what) -> Result<Unit> {
        std::string message = rel.string() + " " + what;
        if (strict) {
            return merge_error(message, "make the file identical across architectures or set "
                                        "[build] resources = \"first-wins\"");
        }
        RELPACK_LOG_WARN("merge", message << "; keeping the first copy");
        merged.warnings.push_back(message);
        return Unit{};
    };

    for (const auto& rel : all_files) {
        if (rel == exe_rel)
            continue;

        std::vector<fs::path> present;
        std::vector<std::string> missing_in;
        for (const auto& artifact : artifacts) {
            fs::path candidate = artifact.bundle_path / rel;
            std::error_code ec;
            if (fs::is_regular_file(fs::symlink_status(candidate, ec))) {
                present.push_back(candidate);
            } else {
                missing_in.push_back(artifact.arch);
            }
        }

        if (!missing_in.empty()) {
            auto result = conflict(rel, "is missing from " + join(missing_in));
            if (is_err(result))
                return result;
            // First wins: bring over the first copy if the template lacked it.
            fs::path target = merged_root / rel;
            if (!fs::exists(target)) {
                std::string error = copy_tree(present.front(), target);
                if (!error.empty())
                    return merge_error(error);
            }
            continue;
        }

        std::set<std::string> digests;
        for (const auto& path : present) {
            auto digest = sha256_file(path);
            if (!digest)
                return merge_error("cannot read " + path.string());
            digests.insert(*digest);
        }
        if (digests.size() == 1)
            continue;

        bool all_macho = std::all_of(present.begin(), present.end(),
                                     [](const fs::path& p) { return macho::is_macho(p); });
        if (all_macho) {
            RELPACK_LOG_DEBUG("merge", "Fusing " << rel.string());
            auto fused = macho::create_universal(present, merged_root / rel);
            if (is_err(fused))
                return unwrap_err(fused);
            merged.fused_files.push_back(rel);
            continue;
        }

        auto result = conflict(rel, "differs between architectures");
        if (is_err(result))
            return result;
    }
    return Unit{};
}

Result<MergedArtifact> UniversalMerger::promote(const build::Artifact& artifact) {
    fs::path merged_root = config_.merged_bundle_path();
    RELPACK_LOG_INFO("merge", "Single architecture " << artifact.arch << ", skipping merge");

    if (artifact.bundle_path != merged_root) {
        remove_tree(merged_root);
        std::error_code ec;
        fs::rename(artifact.bundle_path, merged_root, ec);
        if (ec) {
            std::string error = copy_tree(artifact.bundle_path, merged_root);
            if (!error.empty())
                return merge_error(error);
            remove_tree(artifact.bundle_path);
        }
    }

    MergedArtifact merged;
    merged.bundle_path = merged_root;
    merged.executable_path = merged_root / config_.executable_relpath();
    merged.architectures = {artifact.arch};
    return merged;
}

std::optional<MergedArtifact> UniversalMerger::locate(const config::BuildConfig& config) {
    MergedArtifact merged;
    merged.bundle_path = config.merged_bundle_path();
    merged.executable_path = merged.bundle_path / config.executable_relpath();
    if (!fs::exists(merged.executable_path))
        return std::nullopt;
    if (auto info = macho::inspect(merged.executable_path)) {
        merged.architectures = info->architectures();
    } else {
        merged.architectures = config.architectures;
    }
    return merged;
}

} // namespace relpack::merge
