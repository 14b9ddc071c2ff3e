#include "verify/verifier.hpp"

#include "bundle/info_plist.hpp"
#include "common/fs_utils.hpp"
#include "log/log.hpp"
#include "macho/fat_binary.hpp"
#include "process/subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <regex>
#include <sstream>

namespace relpack::verify {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep = ", ") {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty())
            out += sep;
        out += item;
    }
    return out;
}

/// Name crash reports are filed under: CFBundleName, else the bundle stem.
std::string app_name_for(const Report& report) {
    if (report.metadata && !report.metadata->name.empty())
        return report.metadata->name;
    return report.bundle_path.stem().string();
}

} // namespace

fs::path find_executable(const fs::path& bundle) {
    fs::path contents = bundle / "Contents";
    if (fs::is_directory(contents)) {
        std::string name = bundle.stem().string();
        if (auto plist = bundle::InfoPlist::load(contents / "Info.plist")) {
            if (auto exe = plist->get_string("CFBundleExecutable"))
                name = *exe;
        }
        return contents / "MacOS" / name;
    }
    return bundle / bundle.filename();
}

std::optional<fs::path> find_embedded_interpreter(const fs::path& bundle) {
    fs::path root = fs::is_directory(bundle / "Contents") ? bundle / "Contents" : bundle;
    std::error_code ec;
    std::vector<fs::path> candidates;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec))
            continue;
        std::string name = it->path().filename().string();
        if (name.rfind("python", 0) != 0)
            continue;
        auto ext = it->path().extension();
        if (ext == ".py" || ext == ".pyc" || ext == ".pyo")
            continue;
        if (!process::is_executable(it->path()))
            continue;
        candidates.push_back(it->path());
    }
    if (candidates.empty())
        return std::nullopt;
    std::sort(candidates.begin(), candidates.end());
    return candidates.front();
}

std::vector<std::string> filter_error_lines(const std::string& output) {
    static const std::regex pattern("error|exception|traceback|failed", std::regex::icase);
    std::vector<std::string> lines;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (std::regex_search(line, pattern))
            lines.push_back(line);
    }
    return lines;
}

Verifier::Verifier(VerifierOptions options) : options_(std::move(options)) {
    if (options_.diagnostics_dir.empty()) {
        const char* home = std::getenv("HOME");
        options_.diagnostics_dir =
            fs::path(home ? home : "") / "Library" / "Logs" / "DiagnosticReports";
    }
}

std::vector<fs::path> Verifier::find_crash_reports(const std::string& app_name) const {
    std::vector<std::pair<fs::file_time_type, fs::path>> found;
    std::error_code ec;
    if (!fs::is_directory(options_.diagnostics_dir, ec))
        return {};

    auto cutoff = fs::file_time_type::clock::now() -
                  std::chrono::duration_cast<fs::file_time_type::duration>(options_.lookback);

    for (fs::directory_iterator it(options_.diagnostics_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code st_ec;
        if (!it->is_regular_file(st_ec))
            continue;
        std::string file_name = it->path().filename().string();
        std::string ext = it->path().extension().string();
        if (ext != ".crash" && ext != ".ips")
            continue;
        if (file_name.rfind(app_name, 0) != 0)
            continue;
        auto modified = it->last_write_time(st_ec);
        if (st_ec || modified < cutoff)
            continue;
        found.emplace_back(modified, it->path());
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });
    std::vector<fs::path> reports;
    for (size_t i = 0; i < found.size() && i < options_.max_crash_reports; ++i) {
        reports.push_back(found[i].second);
    }
    return reports;
}

Report Verifier::inspect(const fs::path& bundle) const {
    Report report;
    report.bundle_path = bundle;
    report.bundle_exists = fs::is_directory(bundle);
    if (!report.bundle_exists) {
        report.problems.push_back("bundle " + bundle.string() + " not found");
        return report;
    }

    fs::path plist_path = bundle / "Contents" / "Info.plist";
    if (fs::exists(plist_path)) {
        std::string error;
        if (auto plist = bundle::InfoPlist::load(plist_path, &error)) {
            BundleMetadata meta;
            meta.name = plist->get_string("CFBundleName").value_or("");
            meta.version = plist->get_string("CFBundleShortVersionString").value_or("");
            meta.identifier = plist->get_string("CFBundleIdentifier").value_or("");
            report.metadata = meta;
        } else {
            report.problems.push_back("Info.plist is unreadable: " + error);
        }
    }

    report.executable_path = find_executable(bundle);
    report.executable_present = fs::is_regular_file(report.executable_path);
    if (!report.executable_present) {
        report.problems.push_back("executable " + report.executable_path.string() + " is missing");
    } else {
        report.executable_runnable = process::is_executable(report.executable_path);
        if (!report.executable_runnable) {
            report.problems.push_back("executable lacks execute permission (fix: chmod +x '" +
                                      report.executable_path.string() + "')");
        }
        if (auto info = macho::inspect(report.executable_path)) {
            report.architectures = info->architectures();
        }
    }

    report.crash_reports = find_crash_reports(app_name_for(report));
    if (!report.crash_reports.empty()) {
        report.problems.push_back(std::to_string(report.crash_reports.size()) +
                                  " recent crash report(s)");
    }

    RELPACK_LOG_DEBUG("verify", "Inspected " << bundle.string() << ": "
                                             << (report.ok() ? "ok" : "problems found"));
    return report;
}

std::string format_report(const Report& report) {
    std::ostringstream out;
    out << "Bundle:        " << report.bundle_path.string() << "\n";
    if (report.metadata) {
        out << "Name:          " << report.metadata->name << "\n"
            << "Version:       " << report.metadata->version << "\n"
            << "Identifier:    " << report.metadata->identifier << "\n";
    }
    out << "Executable:    " << report.executable_path.string();
    if (!report.executable_present)
        out << " [missing]";
    else if (!report.executable_runnable)
        out << " [not executable]";
    else
        out << " [ok]";
    out << "\n";
    if (!report.architectures.empty())
        out << "Architectures: " << join(report.architectures) << "\n";
    if (report.crash_reports.empty()) {
        out << "Crash reports: none in the last 24h\n";
    } else {
        out << "Crash reports:\n";
        for (const auto& crash : report.crash_reports)
            out << "  " << crash.string() << "\n";
    }
    for (const auto& problem : report.problems)
        out << "Problem:       " << problem << "\n";
    return out.str();
}

void Verifier::relaunch(const Report& report, bool errors_only, std::ostream& out) const {
    if (!report.executable_runnable) {
        out << "Cannot launch: " << report.executable_path.string() << " is not executable\n";
        return;
    }

    out << (errors_only ? "--- Application errors ---\n" : "--- Application output ---\n");
    process::ProcessOptions options;
    options.timeout_seconds = options_.launch_timeout_seconds;
    auto result = process::run_process({report.executable_path.string()}, options);
    std::string combined = result.stdout_output + result.stderr_output;

    if (errors_only) {
        auto lines = filter_error_lines(combined);
        if (lines.empty())
            out << "No errors found\n";
        for (const auto& line : lines)
            out << line << "\n";
    } else {
        out << combined;
        if (!combined.empty() && combined.back() != '\n')
            out << "\n";
    }

    if (result.timed_out)
        out << "(stopped after " << options_.launch_timeout_seconds << "s)\n";
    else
        out << "--- exited with code " << result.exit_code << " ---\n";
}

void Verifier::inspect_runtime(const Report& report, std::ostream& out) const {
    auto interpreter = find_embedded_interpreter(report.bundle_path);
    if (!interpreter) {
        out << "No embedded Python interpreter found in " << report.bundle_path.string() << "\n";
        return;
    }
    out << "Embedded interpreter: " << interpreter->string() << "\n"
        << "--- Module search path ---\n";

    process::ProcessOptions options;
    options.timeout_seconds = options_.launch_timeout_seconds;
    auto result = process::run_process(
        {interpreter->string(), "-c", "import sys; print('\\n'.join(sys.path))"}, options);
    if (!result.ok()) {
        RELPACK_LOG_DEBUG("verify", "Interpreter failed: " << result.stderr_output);
        out << "Could not query the interpreter (exit code " << result.exit_code << ")\n";
        return;
    }
    out << result.stdout_output;
    if (!result.stdout_output.empty() && result.stdout_output.back() != '\n')
        out << "\n";
}

void Verifier::show_latest_crash(const Report& report, std::ostream& out) const {
    auto crashes = find_crash_reports(app_name_for(report));
    if (crashes.empty()) {
        out << "No recent crash report found\n";
        return;
    }
    out << "Latest crash report: " << crashes.front().string() << "\n\n";
    auto content = read_file(crashes.front());
    out << (content ? *content : std::string("(unreadable)\n"));
    if (content && !content->empty() && content->back() != '\n')
        out << "\n";
}

int Verifier::run_interactive(const fs::path& bundle, std::istream& in, std::ostream& out) const {
    Report report = inspect(bundle);
    out << format_report(report) << "\n";
    if (!report.bundle_exists)
        return 1;

    while (true) {
        out << "1) Relaunch with full output\n"
            << "2) Relaunch showing only errors\n"
            << "3) Inspect the embedded runtime\n"
            << "4) Show the latest crash report\n"
            << "5) Quit\n"
            << "Choice [1-5]: " << std::flush;

        std::string choice;
        if (!std::getline(in, choice))
            return 0;
        while (!choice.empty() && std::isspace(static_cast<unsigned char>(choice.back())))
            choice.pop_back();

        if (choice == "1") {
            relaunch(report, false, out);
        } else if (choice == "2") {
            relaunch(report, true, out);
        } else if (choice == "3") {
            inspect_runtime(report, out);
        } else if (choice == "4") {
            show_latest_crash(report, out);
        } else if (choice == "5") {
            return 0;
        } else {
            out << "Invalid choice '" << choice << "'\n";
        }
        out << "\n";
    }
}

} // namespace relpack::verify
