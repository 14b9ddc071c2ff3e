#include "pipeline/driver.hpp"

#include "assemble/appimage_assembler.hpp"
#include "common/fs_utils.hpp"
#include "log/log.hpp"
#include "process/subprocess.hpp"

#include <algorithm>
#include <set>

namespace relpack::pipeline {

const char* state_name(State state) {
    switch (state) {
    case State::Init:
        return "Init";
    case State::PrereqChecked:
        return "PrereqChecked";
    case State::Cleaned:
        return "Cleaned";
    case State::Built:
        return "Built";
    case State::Merged:
        return "Merged";
    case State::IconReady:
        return "IconReady";
    case State::Assembled:
        return "Assembled";
    case State::Verified:
        return "Verified";
    case State::Done:
        return "Done";
    case State::Failed:
        return "Failed";
    }
    return "Unknown";
}

PipelineDriver::PipelineDriver(const config::BuildConfig& config, PipelineServices services)
    : config_(config), services_(std::move(services)),
      tool_cache_(config.paths.cache_dir, std::move(services_.fetcher)), builder_(config) {
    if (!services_.image_backend)
        services_.image_backend = make_box<assemble::HdiutilBackend>();
    if (!services_.presentation)
        services_.presentation = make_box<assemble::OsascriptPresentation>();
    if (!services_.converters)
        services_.converters = [] { return icon::IconPipeline::default_converters(); };
}

void PipelineDriver::warn(const PackError& warning) {
    warnings_.push_back(warning.to_string());
}

// ============================================================================
// Stages
// ============================================================================

Result<Unit> PipelineDriver::check_prerequisites() {
    const auto& paths = config_.paths;
    if (!fs::is_regular_file(paths.entry_point)) {
        return make_error(ErrorKind::PrereqMissing,
                          "entry point " + paths.entry_point.string() + " not found",
                          "set [paths] entry_point in relpack.toml");
    }
    if (!fs::is_directory(paths.source_dir)) {
        return make_error(ErrorKind::PrereqMissing,
                          "source tree " + paths.source_dir.string() + " not found",
                          "set [paths] source_dir in relpack.toml");
    }

    std::vector<std::string> tools = config_.build.required_tools;
    if (config_.assembly.format == config::ImageFormat::Dmg) {
        auto backend_tools = services_.image_backend->required_tools();
        tools.insert(tools.end(), backend_tools.begin(), backend_tools.end());
    }

    std::vector<std::string> missing;
    for (const auto& tool : tools) {
        if (!process::find_program(tool) &&
            std::find(missing.begin(), missing.end(), tool) == missing.end()) {
            missing.push_back(tool);
        }
    }
    if (!missing.empty()) {
        std::string list;
        for (const auto& tool : missing) {
            if (!list.empty())
                list += ", ";
            list += tool;
        }
        return make_error(ErrorKind::PrereqMissing, "required tools not found: " + list,
                          "install " + list + " and make sure it is on PATH");
    }

    RELPACK_LOG_INFO("pipeline", "Prerequisites satisfied");
    return Unit{};
}

Result<Unit> PipelineDriver::clean() {
    return builder_.clean();
}

Result<std::vector<build::Artifact>> PipelineDriver::build() {
    auto artifacts = builder_.build_all();
    for (const auto& warning : builder_.warnings()) {
        warnings_.push_back(warning);
    }
    return artifacts;
}

Result<merge::MergedArtifact> PipelineDriver::merge(const std::vector<build::Artifact>& artifacts) {
    merge::UniversalMerger merger(config_);
    if (artifacts.size() == 1)
        return merger.promote(artifacts.front());

    auto merged = merger.merge(artifacts);
    if (is_ok(merged)) {
        for (const auto& warning : unwrap(merged).warnings)
            warnings_.push_back("MergeWarning: " + warning);
    }
    return merged;
}

Result<merge::MergedArtifact> PipelineDriver::merge_existing() {
    std::vector<build::Artifact> artifacts;
    for (const auto& arch : config_.architectures) {
        auto artifact = build::ArchitectureBuilder::locate(config_, arch);
        if (!artifact) {
            // A previous merge may already have consumed the artifacts.
            if (auto merged = merge::UniversalMerger::locate(config_)) {
                RELPACK_LOG_INFO("pipeline", "Using existing merged bundle "
                                                 << merged->bundle_path.string());
                return *merged;
            }
            return make_error(ErrorKind::MergeError,
                              "no " + arch + " bundle at " + config_.artifact_path(arch).string(),
                              "run `relpack build` first");
        }
        artifacts.push_back(*artifact);
    }
    return merge(artifacts);
}

Result<icon::IconOutcome> PipelineDriver::icon() {
    icon::IconPipeline pipeline(config_, services_.converters());
    auto outcome = pipeline.build(config_.paths.icon);
    if (is_ok(outcome) && unwrap(outcome).warning) {
        warn(*unwrap(outcome).warning);
    }
    return outcome;
}

Result<assemble::PackageImage> PipelineDriver::assemble(
    const merge::MergedArtifact& merged, const std::optional<icon::IconSet>& icons) {
    Result<assemble::PackageImage> result = make_error(ErrorKind::AssemblyError, "not assembled");
    if (config_.assembly.format == config::ImageFormat::Dmg) {
        assemble::BundleAssembler assembler(config_, *services_.image_backend,
                                            services_.presentation.get());
        result = assembler.assemble(merged, icons);
    } else {
        assemble::AppImageAssembler assembler(config_, tool_cache_);
        result = assembler.assemble(merged, icons);
    }
    if (is_ok(result)) {
        for (const auto& warning : unwrap(result).warnings)
            warn(warning);
    }
    return result;
}

Result<assemble::PackageImage> PipelineDriver::assemble_existing() {
    auto merged = merge::UniversalMerger::locate(config_);
    if (!merged) {
        return make_error(ErrorKind::AssemblyError,
                          "no merged bundle at " + config_.merged_bundle_path().string(),
                          "run `relpack merge` first");
    }
    auto icons = icon::IconPipeline::locate(config_);
    if (!icons)
        RELPACK_LOG_INFO("pipeline", "No icon set found, using the default icon");
    return assemble(*merged, icons);
}

Result<verify::Report> PipelineDriver::verify(const merge::MergedArtifact& merged,
                                              const assemble::PackageImage& package) {
    verify::Verifier verifier(services_.verifier);
    auto report = verifier.inspect(merged.bundle_path);

    if (!report.executable_present || !report.executable_runnable) {
        std::string problem = report.problems.empty() ? "executable check failed"
                                                      : report.problems.front();
        return make_error(ErrorKind::AssemblyError, "verification failed: " + problem,
                          "inspect the bundle with `relpack debug`");
    }

    if (!report.architectures.empty()) {
        std::set<std::string> expected(config_.architectures.begin(), config_.architectures.end());
        std::set<std::string> actual(report.architectures.begin(), report.architectures.end());
        if (expected != actual) {
            std::string got;
            for (const auto& arch : report.architectures)
                got += (got.empty() ? "" : ", ") + arch;
            return make_error(ErrorKind::MergeError,
                              "bundle executable reports {" + got + "}, expected " +
                                  config_.arch_label(),
                              "rebuild with `relpack all`");
        }
    }

    auto checked = assemble::check_package(package.path, package.format);
    if (is_err(checked))
        return unwrap_err(checked);

    for (const auto& crash : report.crash_reports) {
        warnings_.push_back("recent crash report: " + crash.string());
    }
    RELPACK_LOG_INFO("pipeline", "Verified " << merged.bundle_path.filename().string());
    return report;
}

void PipelineDriver::cleanup() {
    if (config_.assembly.keep_intermediates) {
        RELPACK_LOG_INFO("pipeline", "Keeping intermediates in " << config_.paths.work_dir.string());
        return;
    }
    if (!remove_tree(config_.paths.work_dir)) {
        RELPACK_LOG_WARN("pipeline", "Cannot remove " << config_.paths.work_dir.string());
    }
}

// ============================================================================
// Full Run
// ============================================================================

PipelineReport PipelineDriver::run() {
    PipelineReport report;
    report.states.push_back(State::Init);

    auto fail = [&](const std::string& stage, const PackError& error) {
        RELPACK_LOG_ERROR("pipeline", "Stage '" << stage << "' failed: " << error.to_string());
        report.error = error;
        report.failed_stage = stage;
        report.states.push_back(State::Failed);
        report.warnings = warnings_;
        return report;
    };
    auto enter = [&](State state) {
        RELPACK_LOG_DEBUG("pipeline", "-> " << state_name(state));
        report.states.push_back(state);
    };

    RELPACK_LOG_INFO("pipeline", "Packaging " << config_.package.name << " "
                                              << config_.package.version << " ("
                                              << config_.arch_label() << ", "
                                              << config::format_name(config_.assembly.format)
                                              << ")");

    auto prereq = check_prerequisites();
    if (is_err(prereq))
        return fail("prerequisites", unwrap_err(prereq));
    enter(State::PrereqChecked);

    auto cleaned = clean();
    if (is_err(cleaned))
        return fail("clean", unwrap_err(cleaned));
    enter(State::Cleaned);

    auto artifacts = build();
    if (is_err(artifacts))
        return fail("build", unwrap_err(artifacts));
    for (const auto& artifact : unwrap(artifacts))
        report.built_arches.push_back(artifact.arch);
    enter(State::Built);

    auto merged = merge(unwrap(artifacts));
    if (is_err(merged))
        return fail("merge", unwrap_err(merged));
    report.merged = unwrap(merged);
    enter(State::Merged);

    auto icons = icon();
    if (is_err(icons))
        return fail("icon", unwrap_err(icons));
    enter(State::IconReady);

    auto package = assemble(unwrap(merged), unwrap(icons).icon_set);
    if (is_err(package))
        return fail("assemble", unwrap_err(package));
    report.package = unwrap(package);
    enter(State::Assembled);

    auto verified = verify(unwrap(merged), unwrap(package));
    if (is_err(verified))
        return fail("verify", unwrap_err(verified));
    report.verification = unwrap(verified);
    enter(State::Verified);

    cleanup();
    enter(State::Done);

    report.warnings = warnings_;
    RELPACK_LOG_INFO("pipeline", "Done: " << unwrap(package).path.string());
    return report;
}

} // namespace relpack::pipeline
