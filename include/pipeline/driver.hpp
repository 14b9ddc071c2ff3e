//! # Pipeline Driver
//!
//! Runs the packaging stages in order and stops at the first fatal error.
//!
//! ## States
//!
//! ```text
//! Init → PrereqChecked → Cleaned → Built → Merged → IconReady
//!      → Assembled → Verified → Done
//!
//! any stage ──fatal error──→ Failed(stage, cause)
//! ```
//!
//! Non-fatal problems (`IconUnavailable`, `PresentationWarning`, bundler
//! warnings) are collected in the report and never stop the run.
//!
//! ## Standalone Stages
//!
//! Every stage is also callable on its own. Inputs are located at their
//! well-known paths under `<work>`, so `relpack merge` after `relpack build`
//! works without re-running the build.

#ifndef RELPACK_PIPELINE_DRIVER_HPP
#define RELPACK_PIPELINE_DRIVER_HPP

#include "assemble/bundle_assembler.hpp"
#include "assemble/image_backend.hpp"
#include "assemble/presentation.hpp"
#include "build/arch_builder.hpp"
#include "common.hpp"
#include "config/build_config.hpp"
#include "icon/icon_pipeline.hpp"
#include "merge/universal_merger.hpp"
#include "tools/tool_cache.hpp"
#include "verify/verifier.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace relpack::pipeline {

enum class State {
    Init,
    PrereqChecked,
    Cleaned,
    Built,
    Merged,
    IconReady,
    Assembled,
    Verified,
    Done,
    Failed,
};

const char* state_name(State state);

/// External collaborators. Anything left empty gets the real implementation.
struct PipelineServices {
    Box<assemble::ImageBackend> image_backend;
    Box<assemble::PresentationRunner> presentation;
    Box<tools::Fetcher> fetcher;
    std::function<std::vector<Box<icon::IconConverter>>()> converters;
    verify::VerifierOptions verifier;
};

struct PipelineReport {
    std::vector<State> states;
    std::vector<std::string> built_arches; ///< Architectures built, in configured order
    std::vector<std::string> warnings;
    std::optional<PackError> error;
    std::string failed_stage;
    std::optional<merge::MergedArtifact> merged;
    std::optional<assemble::PackageImage> package;
    std::optional<verify::Report> verification;

    bool ok() const {
        return !error.has_value();
    }

    State final_state() const {
        return states.empty() ? State::Init : states.back();
    }
};

class PipelineDriver {
public:
    explicit PipelineDriver(const config::BuildConfig& config, PipelineServices services = {});

    /// Runs every stage from prerequisites to cleanup.
    PipelineReport run();

    // Individual stages --------------------------------------------------------

    Result<Unit> check_prerequisites();
    Result<Unit> clean();
    Result<std::vector<build::Artifact>> build();

    /// Merges `artifacts`, or promotes the only one.
    Result<merge::MergedArtifact> merge(const std::vector<build::Artifact>& artifacts);

    /// Merges the artifacts left by an earlier `build()`.
    Result<merge::MergedArtifact> merge_existing();

    Result<icon::IconOutcome> icon();

    Result<assemble::PackageImage> assemble(const merge::MergedArtifact& merged,
                                            const std::optional<icon::IconSet>& icons);

    /// Assembles the merged bundle and icon set left by earlier stages.
    Result<assemble::PackageImage> assemble_existing();

    /// Inspects the merged bundle and checks it against the configuration and
    /// the package.
    Result<verify::Report> verify(const merge::MergedArtifact& merged,
                                  const assemble::PackageImage& package);

    /// Removes `<work>` unless intermediates are kept.
    void cleanup();

    tools::ToolCache& tool_cache() {
        return tool_cache_;
    }

    const std::vector<std::string>& warnings() const {
        return warnings_;
    }

private:
    const config::BuildConfig& config_;
    PipelineServices services_;
    tools::ToolCache tool_cache_;
    build::ArchitectureBuilder builder_;
    std::vector<std::string> warnings_;

    void warn(const PackError& warning);
};

} // namespace relpack::pipeline

#endif // RELPACK_PIPELINE_DRIVER_HPP
