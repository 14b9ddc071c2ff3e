//! # Universal Merger
//!
//! Fuses per-architecture bundles into one bundle whose executables carry
//! every architecture.
//!
//! ## Algorithm
//!
//! 1. Copy the first artifact (the template) to the merged location,
//!    preserving symlinks.
//! 2. Fuse the primary executable from all inputs.
//! 3. Walk every regular file of every input:
//!    - identical in all inputs: keep the template copy
//!    - different and Mach-O in all inputs: fuse
//!    - different otherwise: `MergeError` (strict) or warning (first-wins)
//!    - absent from some inputs: same rule as "different otherwise"
//! 4. Re-inspect the fused executable; its architecture set must equal the
//!    union of the inputs.
//! 5. Delete the per-architecture artifacts.

#ifndef RELPACK_MERGE_UNIVERSAL_MERGER_HPP
#define RELPACK_MERGE_UNIVERSAL_MERGER_HPP

#include "build/arch_builder.hpp"
#include "common.hpp"
#include "config/build_config.hpp"

#include <string>
#include <vector>

namespace relpack::merge {

struct MergedArtifact {
    fs::path bundle_path;
    fs::path executable_path;
    std::vector<std::string> architectures;
    std::vector<fs::path> fused_files; ///< Relative to the bundle root, executable excluded
    std::vector<std::string> warnings;
};

class UniversalMerger {
public:
    explicit UniversalMerger(const config::BuildConfig& config);

    /// Requires at least two artifacts with distinct architectures.
    Result<MergedArtifact> merge(const std::vector<build::Artifact>& artifacts);

    /// Single-architecture runs skip merging: the artifact is moved to the
    /// merged location and reported with its one architecture.
    Result<MergedArtifact> promote(const build::Artifact& artifact);

    /// Finds an existing merged bundle at its well-known path.
    static std::optional<MergedArtifact> locate(const config::BuildConfig& config);

private:
    const config::BuildConfig& config_;

    Result<Unit> reconcile(const std::vector<build::Artifact>& artifacts,
                           const fs::path& merged_root, MergedArtifact& merged);
};

} // namespace relpack::merge

#endif // RELPACK_MERGE_UNIVERSAL_MERGER_HPP
