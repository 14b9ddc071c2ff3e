#include "build/arch_builder.hpp"

#include "build/build_queue.hpp"
#include "common/fs_utils.hpp"
#include "log/log.hpp"
#include "macho/fat_binary.hpp"
#include "process/subprocess.hpp"

#include <algorithm>
#include <sstream>

namespace relpack::build {

namespace {

/// Last `max_lines` lines of the bundler's output, for error messages.
std::string output_tail(const process::ProcessResult& result, size_t max_lines = 15) {
    std::string text = result.stderr_output.empty() ? result.stdout_output
                                                    : result.stderr_output;
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty())
            lines.push_back(line);
    }
    size_t start = lines.size() > max_lines ? lines.size() - max_lines : 0;
    std::string tail;
    for (size_t i = start; i < lines.size(); ++i) {
        tail += "\n    " + lines[i];
    }
    return tail;
}

} // namespace

ArchitectureBuilder::ArchitectureBuilder(const config::BuildConfig& config) : config_(config) {}

void ArchitectureBuilder::warn(const std::string& message) {
    RELPACK_LOG_WARN("build", message);
    std::lock_guard<std::mutex> lock(warnings_mutex_);
    warnings_.push_back(message);
}

std::vector<std::string> ArchitectureBuilder::warnings() const {
    std::lock_guard<std::mutex> lock(warnings_mutex_);
    return warnings_;
}

Result<Unit> ArchitectureBuilder::clean() {
    if (cleaned_) {
        RELPACK_LOG_DEBUG("build", "Already cleaned in this run");
        return Unit{};
    }

    const auto& paths = config_.paths;
    RELPACK_LOG_INFO("build", "Cleaning " << paths.work_dir.string());
    if (!remove_tree(paths.work_dir)) {
        return make_error(ErrorKind::CompileError,
                          "cannot remove previous build directory " + paths.work_dir.string(),
                          "check permissions or remove the directory by hand");
    }

    std::error_code ec;
    fs::remove(config_.package_path(), ec);

    fs::create_directories(paths.work_dir, ec);
    if (!ec)
        fs::create_directories(paths.dist_dir, ec);
    if (ec) {
        return make_error(ErrorKind::CompileError,
                          "cannot create output directories: " + ec.message());
    }

    cleaned_ = true;
    return Unit{};
}

std::map<std::string, std::string> ArchitectureBuilder::placeholders(const std::string& arch) const {
    fs::path arch_dir = config_.arch_work_dir(arch);
    return {
        {"arch", arch},
        {"dist", (arch_dir / "dist").string()},
        {"work", (arch_dir / "build").string()},
        {"entry", config_.paths.entry_point.string()},
        {"source", config_.paths.source_dir.string()},
        {"name", config_.package.name},
        {"identifier", config_.package.identifier},
        {"version", config_.package.version},
        {"min_os", config_.package.minimum_os},
        {"icon", config_.paths.icon.string()},
    };
}

std::vector<std::string> ArchitectureBuilder::command_for(const std::string& arch) const {
    auto values = placeholders(arch);
    std::vector<std::string> argv;
    for (const auto& token : config_.build.command) {
        argv.push_back(config::expand_placeholders(token, values));
    }
    return argv;
}

Result<Artifact> ArchitectureBuilder::build(const std::string& arch) {
    fs::path arch_dir = config_.arch_work_dir(arch);
    fs::path dist_dir = arch_dir / "dist";
    fs::path scratch_dir = arch_dir / "build";

    std::error_code ec;
    remove_tree(arch_dir);
    fs::create_directories(dist_dir, ec);
    if (!ec)
        fs::create_directories(scratch_dir, ec);
    if (ec) {
        return make_error(ErrorKind::CompileError,
                          "cannot create build directory " + arch_dir.string() + ": " +
                              ec.message());
    }

    auto argv = command_for(arch);

    process::ProcessOptions options;
    options.cwd = config_.project_dir;
    options.env["TARGET_ARCH"] = arch;
    options.env["MACOSX_DEPLOYMENT_TARGET"] = config_.package.minimum_os;

    RELPACK_LOG_INFO("build", "Building " << config_.package.name << " for " << arch);
    RELPACK_LOG_DEBUG("build", "Command: " << process::format_command(argv));

    auto result = process::run_process(argv, options);
    if (!result.launched) {
        return make_error(ErrorKind::CompileError,
                          "cannot run bundler '" + argv.front() + "' for " + arch,
                          "install the bundler or adjust [build] command in relpack.toml");
    }
    RELPACK_LOG_DEBUG("build", "[" << arch << "] bundler exited with " << result.exit_code
                                   << " after " << result.duration_us / 1000 << "ms");

    // The bundle's presence decides success, not the exit code.
    fs::path produced = dist_dir / config_.bundle_dir_name();
    fs::path produced_exe = produced / config_.executable_relpath();
    if (!fs::is_directory(produced) || !fs::exists(produced_exe)) {
        std::string missing = fs::is_directory(produced) ? produced_exe.string()
                                                         : produced.string();
        return make_error(ErrorKind::CompileError,
                          "build for " + arch + " produced no bundle (missing " + missing +
                              ", exit code " + std::to_string(result.exit_code) + ")" +
                              output_tail(result),
                          "run the bundler command by hand to see the full output");
    }

    if (result.exit_code != 0) {
        warn("bundler exited with code " + std::to_string(result.exit_code) + " for " + arch +
             " but produced a bundle");
    }

    if (auto info = macho::inspect(produced_exe)) {
        auto arches = info->architectures();
        if (std::find(arches.begin(), arches.end(), arch) == arches.end()) {
            warn("executable built for " + arch + " does not contain a " + arch + " slice");
        }
    }

    Artifact artifact;
    artifact.arch = arch;
    artifact.bundle_path = config_.artifact_path(arch);
    artifact.executable_path = artifact.bundle_path / config_.executable_relpath();

    remove_tree(artifact.bundle_path);
    fs::create_directories(artifact.bundle_path.parent_path(), ec);
    fs::rename(produced, artifact.bundle_path, ec);
    if (ec) {
        std::string copy_error = copy_tree(produced, artifact.bundle_path);
        if (!copy_error.empty()) {
            return make_error(ErrorKind::CompileError, "cannot collect artifact: " + copy_error);
        }
    }
    remove_tree(dist_dir);

    RELPACK_LOG_INFO("build", "Built " << arch << " -> " << artifact.bundle_path.string());
    return artifact;
}

Result<std::vector<Artifact>> ArchitectureBuilder::build_all() {
    const auto& arches = config_.architectures;
    std::vector<std::optional<Result<Artifact>>> results(arches.size());

    if (config_.build.jobs <= 1 || arches.size() == 1) {
        for (size_t i = 0; i < arches.size(); ++i) {
            results[i] = build(arches[i]);
            if (is_err(*results[i]))
                return unwrap_err(*results[i]);
        }
    } else {
        std::vector<std::shared_ptr<BuildJob>> jobs;
        for (size_t i = 0; i < arches.size(); ++i) {
            auto job = std::make_shared<BuildJob>();
            job->index = i;
            job->label = arches[i];
            jobs.push_back(job);
        }

        ParallelRunner runner(config_.build.jobs);
        runner.run(jobs, [&](BuildJob& job) {
            auto result = build(arches[job.index]);
            bool ok = is_ok(result);
            results[job.index] = std::move(result);
            return ok;
        });

        // Report the first failure in configured order.
        for (const auto& result : results) {
            if (result && is_err(*result))
                return unwrap_err(*result);
        }
    }

    std::vector<Artifact> artifacts;
    for (size_t i = 0; i < results.size(); ++i) {
        if (!results[i]) {
            return make_error(ErrorKind::CompileError, "build for " + arches[i] + " did not run");
        }
        artifacts.push_back(unwrap(*results[i]));
    }
    return artifacts;
}

std::optional<Artifact> ArchitectureBuilder::locate(const config::BuildConfig& config,
                                                    const std::string& arch) {
    Artifact artifact;
    artifact.arch = arch;
    artifact.bundle_path = config.artifact_path(arch);
    artifact.executable_path = artifact.bundle_path / config.executable_relpath();
    if (!fs::exists(artifact.executable_path))
        return std::nullopt;
    return artifact;
}

} // namespace relpack::build
