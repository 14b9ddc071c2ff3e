#include "assemble/presentation.hpp"

#include "log/log.hpp"
#include "process/subprocess.hpp"

#include <sstream>

namespace relpack::assemble {

namespace {

/// Quotes `text` as an AppleScript string literal.
std::string as_quoted(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

std::string presentation_script(const PresentationRequest& request) {
    const auto& w = request.layout;
    std::ostringstream script;
    script << "tell application \"Finder\"\n"
           << "  tell disk " << as_quoted(request.volume_name) << "\n"
           << "    open\n"
           << "    set current view of container window to icon view\n"
           << "    set toolbar visible of container window to false\n"
           << "    set statusbar visible of container window to false\n"
           << "    set the bounds of container window to {" << w.left << ", " << w.top << ", "
           << w.right << ", " << w.bottom << "}\n"
           << "    set viewOptions to the icon view options of container window\n"
           << "    set arrangement of viewOptions to not arranged\n"
           << "    set icon size of viewOptions to " << w.icon_size << "\n";
    if (!request.background_file.empty()) {
        script << "    set background picture of viewOptions to file "
               << as_quoted(".background:" + request.background_file) << "\n";
    }
    script << "    set position of item " << as_quoted(request.app_item)
           << " of container window to {" << w.app_position.x << ", " << w.app_position.y
           << "}\n"
           << "    set position of item " << as_quoted(request.link_item)
           << " of container window to {" << w.link_position.x << ", " << w.link_position.y
           << "}\n"
           << "    close\n"
           << "    open\n"
           << "    update without registering applications\n"
           << "    delay 2\n"
           << "  end tell\n"
           << "end tell\n";
    return script.str();
}

Result<Unit> OsascriptPresentation::apply(const MountHandle& mount,
                                          const PresentationRequest& request) {
    process::ProcessOptions options;
    options.stdin_data = presentation_script(request);
    options.timeout_seconds = timeout_seconds_;

    RELPACK_LOG_DEBUG("assemble", "Applying Finder layout to " << mount.mount_point.string());
    auto result = process::run_process({"osascript", "-"}, options);
    if (!result.ok()) {
        std::string reason;
        if (!result.launched)
            reason = "osascript is not available";
        else if (result.timed_out)
            reason = "osascript timed out after " + std::to_string(timeout_seconds_) + "s";
        else
            reason = "osascript exited with code " + std::to_string(result.exit_code);
        return make_error(ErrorKind::PresentationWarning,
                          "cannot customize the image window: " + reason,
                          "the image works but opens with Finder's default layout");
    }
    return Unit{};
}

} // namespace relpack::assemble
