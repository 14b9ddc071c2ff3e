//! # Image Presentation
//!
//! Customizes how the mounted image looks when opened in Finder: window
//! bounds, icon size, item positions and background. Failure here is never
//! fatal; the assembler records a `PresentationWarning`.

#ifndef RELPACK_ASSEMBLE_PRESENTATION_HPP
#define RELPACK_ASSEMBLE_PRESENTATION_HPP

#include "assemble/image_backend.hpp"
#include "common.hpp"
#include "config/build_config.hpp"

#include <string>

namespace relpack::assemble {

/// What the presentation step needs to know about the volume.
struct PresentationRequest {
    std::string volume_name;
    std::string app_item;        ///< Bundle name on the volume, e.g. "My App.app"
    std::string link_item = "Applications";
    std::string background_file; ///< File name under `.background/`, may be empty
    config::WindowLayout layout;
};

class PresentationRunner {
public:
    virtual ~PresentationRunner() = default;

    /// Applies the layout to the mounted volume. Errors use
    /// `ErrorKind::PresentationWarning`.
    virtual Result<Unit> apply(const MountHandle& mount, const PresentationRequest& request) = 0;
};

/// Feeds a Finder AppleScript to `osascript` on stdin.
class OsascriptPresentation : public PresentationRunner {
public:
    explicit OsascriptPresentation(int timeout_seconds = 60) : timeout_seconds_(timeout_seconds) {}

    Result<Unit> apply(const MountHandle& mount, const PresentationRequest& request) override;

private:
    int timeout_seconds_;
};

/// The AppleScript sent to Finder for `request`.
std::string presentation_script(const PresentationRequest& request);

} // namespace relpack::assemble

#endif // RELPACK_ASSEMBLE_PRESENTATION_HPP
