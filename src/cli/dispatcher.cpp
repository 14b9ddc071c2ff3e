//! # CLI Command Dispatcher
//!
//! Parses the command line, loads the manifest and routes to one stage of the
//! pipeline driver (or all of them).
//!
//! ## Architecture
//!
//! ```text
//! relpack_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ all            → PipelineDriver::run()
//!   ├─ check          → check_prerequisites()
//!   ├─ clean          → clean()
//!   ├─ build          → check_prerequisites() + clean() + build()
//!   ├─ merge          → merge_existing()
//!   ├─ icon           → icon()
//!   ├─ assemble       → assemble_existing()
//!   ├─ verify         → Verifier::inspect()
//!   ├─ debug          → Verifier::run_interactive()
//!   ├─ fetch          → ToolCache::acquire()
//!   └─ cache          → ToolCache::entries() / clear()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                  |
//! |------|------------------------------------------|
//! | 0    | Success                                  |
//! | 1    | A stage failed or the arguments are bad  |

#include "cli/dispatcher.hpp"

#include "assemble/appimage_assembler.hpp"
#include "cli/utils.hpp"
#include "config/build_config.hpp"
#include "log/log.hpp"
#include "pipeline/driver.hpp"
#include "verify/verifier.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>

namespace relpack::cli {

namespace {

/// Commands that take the manifest.
bool needs_config(const std::string& command) {
    return command != "debug";
}

PackError usage_error(std::string message) {
    return make_error(ErrorKind::ConfigError, std::move(message), "see `relpack --help`");
}

int fail(const std::string& stage, const PackError& error) {
    print_failure(std::cerr, stage, error);
    return 1;
}

int finish(pipeline::PipelineDriver& driver) {
    print_warnings(std::cerr, driver.warnings());
    return 0;
}

int run_all(pipeline::PipelineDriver& driver) {
    auto report = driver.run();
    print_warnings(std::cerr, report.warnings);
    if (!report.ok())
        return fail(report.failed_stage, *report.error);

    std::cout << "Package: " << report.package->path.string() << " (" << report.package->size
              << " bytes)\n";
    if (report.verification && !report.verification->architectures.empty()) {
        std::cout << "Architectures:";
        for (const auto& arch : report.verification->architectures)
            std::cout << " " << arch;
        std::cout << "\n";
    }
    return 0;
}

int run_build(pipeline::PipelineDriver& driver) {
    auto prereq = driver.check_prerequisites();
    if (is_err(prereq))
        return fail("prerequisites", unwrap_err(prereq));
    auto cleaned = driver.clean();
    if (is_err(cleaned))
        return fail("clean", unwrap_err(cleaned));
    auto artifacts = driver.build();
    if (is_err(artifacts))
        return fail("build", unwrap_err(artifacts));
    for (const auto& artifact : unwrap(artifacts))
        std::cout << artifact.arch << ": " << artifact.bundle_path.string() << "\n";
    return finish(driver);
}

int run_verify(const config::BuildConfig& config, const CliOptions& options) {
    fs::path bundle;
    if (!options.args.empty()) {
        bundle = options.args.front();
    } else if (auto merged = merge::UniversalMerger::locate(config)) {
        bundle = merged->bundle_path;
    } else {
        return fail("verify", make_error(ErrorKind::AssemblyError,
                                         "no merged bundle at " +
                                             config.merged_bundle_path().string(),
                                         "pass a bundle path: relpack verify <bundle>"));
    }

    verify::Verifier verifier;
    auto report = verifier.inspect(bundle);
    std::cout << verify::format_report(report);
    return report.ok() ? 0 : 1;
}

int run_debug(const CliOptions& options) {
    if (options.args.empty()) {
        std::cerr << "Usage: relpack debug <bundle>\n";
        return 1;
    }
    verify::Verifier verifier;
    return verifier.run_interactive(options.args.front(), std::cin, std::cout);
}

int run_fetch(const config::BuildConfig& config, pipeline::PipelineDriver& driver,
              const CliOptions& options) {
    if (options.args.empty()) {
        std::cerr << "Usage: relpack fetch <tool>\n";
        return 1;
    }
    const std::string& name = options.args.front();
    auto spec = name == "appimagetool" ? assemble::appimagetool_spec(config) : config.tool(name);
    if (spec.url.empty()) {
        return fail("fetch", make_error(ErrorKind::ConfigError,
                                        "no download url for tool '" + name + "'",
                                        "add [tool." + name + "] url = \"...\" to the manifest"));
    }
    auto path = driver.tool_cache().acquire(spec);
    if (is_err(path))
        return fail("fetch", unwrap_err(path));
    std::cout << unwrap(path).string() << "\n";
    return 0;
}

int run_cache(pipeline::PipelineDriver& driver, const CliOptions& options) {
    std::string sub = options.args.empty() ? "list" : options.args.front();
    auto& cache = driver.tool_cache();

    if (sub == "list") {
        auto entries = cache.entries();
        std::cout << "Tool cache: " << cache.cache_dir().string() << "\n";
        if (entries.empty()) {
            std::cout << "  (empty)\n";
            return 0;
        }
        for (const auto& entry : entries) {
            std::cout << "  " << std::left << std::setw(16) << entry.name << std::setw(14)
                      << entry.version << std::setw(12) << entry.size
                      << entry.sha256.substr(0, 12) << "  " << entry.path.string() << "\n";
        }
        return 0;
    }
    if (sub == "clear") {
        if (!cache.clear()) {
            return fail("cache", make_error(ErrorKind::FetchError,
                                            "cannot clear " + cache.cache_dir().string()));
        }
        std::cout << "Cleared " << cache.cache_dir().string() << "\n";
        return 0;
    }

    std::cerr << "Usage: relpack cache [list|clear]\n";
    return 1;
}

int dispatch(const CliOptions& options) {
    const std::string& command = options.command;
    if (!needs_config(command))
        return run_debug(options);

    auto env = config::capture_environment();
    if (options.arch)
        env["TARGET_ARCH"] = *options.arch;

    auto loaded = config::load_build_config(options.config_path, env);
    if (is_err(loaded))
        return fail("config", unwrap_err(loaded));
    config::BuildConfig config = unwrap(loaded);
    if (options.jobs)
        config.build.jobs = *options.jobs;
    if (options.keep)
        config.assembly.keep_intermediates = true;

    pipeline::PipelineDriver driver(config);

    if (command == "all")
        return run_all(driver);

    if (command == "check") {
        auto prereq = driver.check_prerequisites();
        if (is_err(prereq))
            return fail("prerequisites", unwrap_err(prereq));
        std::cout << "All prerequisites satisfied\n";
        return 0;
    }

    if (command == "clean") {
        auto cleaned = driver.clean();
        if (is_err(cleaned))
            return fail("clean", unwrap_err(cleaned));
        return 0;
    }

    if (command == "build")
        return run_build(driver);

    if (command == "merge") {
        auto merged = driver.merge_existing();
        if (is_err(merged))
            return fail("merge", unwrap_err(merged));
        std::cout << unwrap(merged).bundle_path.string() << "\n";
        return finish(driver);
    }

    if (command == "icon") {
        auto outcome = driver.icon();
        if (is_err(outcome))
            return fail("icon", unwrap_err(outcome));
        if (unwrap(outcome).icon_set)
            std::cout << unwrap(outcome).icon_set->container.string() << "\n";
        return finish(driver);
    }

    if (command == "assemble") {
        auto package = driver.assemble_existing();
        if (is_err(package))
            return fail("assemble", unwrap_err(package));
        std::cout << unwrap(package).path.string() << "\n";
        return finish(driver);
    }

    if (command == "verify")
        return run_verify(config, options);

    if (command == "fetch")
        return run_fetch(config, driver, options);

    if (command == "cache")
        return run_cache(driver, options);

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'relpack --help' for usage.\n";
    return 1;
}

} // namespace

Result<CliOptions> parse_cli_args(int argc, char* argv[]) {
    CliOptions options;
    bool has_command = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (log::is_log_option(arg)) {
            continue;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.version = true;
        } else if (arg == "--keep") {
            options.keep = true;
        } else if (arg.starts_with("--config=")) {
            options.config_path = arg.substr(9);
        } else if (arg.starts_with("--arch=")) {
            options.arch = arg.substr(7);
        } else if (arg.starts_with("--jobs=")) {
            std::string value = arg.substr(7);
            int jobs = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), jobs);
            if (ec != std::errc() || ptr != value.data() + value.size() || jobs < 1)
                return usage_error("--jobs expects a positive integer, got '" + value + "'");
            options.jobs = jobs;
        } else if (arg.starts_with("-")) {
            return usage_error("unknown option '" + arg + "'");
        } else if (!has_command) {
            options.command = arg;
            has_command = true;
        } else {
            options.args.push_back(arg);
        }
    }

    return options;
}

int relpack_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto parsed = parse_cli_args(argc, argv);
    if (is_err(parsed)) {
        const auto& error = unwrap_err(parsed);
        std::cerr << "error: " << error.message << "\n";
        if (!error.hint.empty())
            std::cerr << "hint: " << error.hint << "\n";
        return 1;
    }
    const auto& options = unwrap(parsed);

    if (options.help) {
        print_usage();
        return 0;
    }
    if (options.version) {
        print_version();
        return 0;
    }

    int code = dispatch(options);
    log::Logger::instance().flush();
    return code;
}

} // namespace relpack::cli
