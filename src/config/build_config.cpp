//! # Build Configuration Loading
//!
//! Manifest sections are read into `BuildConfig`, environment overrides are
//! applied, defaults are filled in and the result is validated. Any problem is
//! reported as a `ConfigError`; nothing is created on disk here.

#include "config/build_config.hpp"

#include "common/fs_utils.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sys/utsname.h>

namespace relpack::config {

namespace {

constexpr const char* KNOWN_ARCHES[] = {"x86_64", "arm64", "arm64e", "i386"};

/// Default bundler invocation (PyInstaller), used when `[build] command` is absent.
/// The spec file goes to the per-arch work dir so parallel builds never share
/// one, and `--clean` is left out because every build starts from a fresh
/// work dir while the PyInstaller cache is shared.
std::vector<std::string> default_command() {
    return {"pyinstaller",
            "--noconfirm",
            "--windowed",
            "--name",
            "{name}",
            "--distpath",
            "{dist}",
            "--workpath",
            "{work}",
            "--specpath",
            "{work}",
            "--target-arch",
            "{arch}",
            "--osx-bundle-identifier",
            "{identifier}",
            "{entry}"};
}

PackError config_error(std::string message, std::string hint = {}) {
    return make_error(ErrorKind::ConfigError, std::move(message), std::move(hint));
}

fs::path resolve(const fs::path& base, const std::string& value) {
    if (value.empty())
        return {};
    fs::path p(value);
    if (p.is_absolute())
        return p.lexically_normal();
    return (base / p).lexically_normal();
}

/// True when `inner` is `outer` or lies below it. Compares lexically.
bool path_within(const fs::path& inner, const fs::path& outer) {
    if (inner.empty() || outer.empty())
        return false;
    fs::path in = inner.lexically_normal();
    fs::path out = outer.lexically_normal();
    if (!in.has_filename())
        in = in.parent_path();
    if (!out.has_filename())
        out = out.parent_path();
    auto [out_end, in_end] = std::mismatch(out.begin(), out.end(), in.begin(), in.end());
    return out_end == out.end();
}

std::string env_value(const EnvMap& env, const std::string& name) {
    auto it = env.find(name);
    return it == env.end() ? std::string() : it->second;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return std::string(s.substr(start, end - start));
}

Result<ImageFormat> parse_format(const std::string& value) {
    std::string lower = to_lower(value);
    if (lower == "dmg")
        return ImageFormat::Dmg;
    if (lower == "appimage")
        return ImageFormat::AppImage;
    return config_error("unknown image format '" + value + "'",
                        "use \"dmg\" or \"appimage\"");
}

/// Reads an integer array of exactly `count` elements.
Result<std::vector<int>> read_int_array(const TomlDocument& doc, const std::string& section,
                                        const std::string& key, size_t count) {
    auto items = doc.get_strings(section, key);
    std::vector<int> out;
    if (!items)
        return out;
    if (items->size() != count) {
        return config_error("[" + section + "] " + key + " must have " + std::to_string(count) +
                            " elements");
    }
    for (const auto& item : *items) {
        try {
            out.push_back(std::stoi(item));
        } catch (const std::exception&) {
            return config_error("[" + section + "] " + key + " must contain integers");
        }
    }
    return out;
}

/// Checks that `key` in `section`, if present, holds the expected type.
Result<Unit> expect_type(const TomlDocument& doc, const std::string& section,
                         const std::string& key, const char* type_name, bool matches) {
    if (doc.find(section, key) && !matches) {
        return config_error("[" + section + "] " + key + " must be " + type_name);
    }
    return Unit{};
}

} // namespace

// ============================================================================
// Names
// ============================================================================

const char* format_name(ImageFormat format) {
    return format == ImageFormat::Dmg ? "dmg" : "appimage";
}

const char* format_extension(ImageFormat format) {
    return format == ImageFormat::Dmg ? "dmg" : "AppImage";
}

std::string BuildConfig::arch_label() const {
    if (architectures.size() > 1)
        return "Universal";
    return architectures.empty() ? std::string("unknown") : architectures.front();
}

std::string BuildConfig::package_file_name() const {
    return sanitize_file_name(package.name) + "-" + package.version + "-" + arch_label() + "." +
           format_extension(assembly.format);
}

std::string BuildConfig::bundle_dir_name() const {
    if (assembly.format == ImageFormat::Dmg)
        return package.name + ".app";
    return package.name;
}

fs::path BuildConfig::executable_relpath() const {
    if (assembly.format == ImageFormat::Dmg)
        return fs::path("Contents") / "MacOS" / package.name;
    return fs::path(package.name);
}

fs::path BuildConfig::artifact_path(std::string_view arch) const {
    std::string dir = package.name + "-" + std::string(arch);
    if (assembly.format == ImageFormat::Dmg)
        dir += ".app";
    return bundles_dir() / dir;
}

ToolSpec BuildConfig::tool(const std::string& name) const {
    auto it = tools.find(name);
    if (it != tools.end())
        return it->second;
    ToolSpec spec;
    spec.name = name;
    return spec;
}

// ============================================================================
// Environment
// ============================================================================

EnvMap capture_environment() {
    static const char* names[] = {"TARGET_ARCH",      "RELPACK_IMAGE_FORMAT",
                                  "RELPACK_CACHE_DIR", "RELPACK_DIST_DIR",
                                  "XDG_CACHE_HOME",   "HOME"};
    EnvMap env;
    for (const char* name : names) {
        if (const char* value = std::getenv(name)) {
            env[name] = value;
        }
    }
    return env;
}

std::string host_architecture() {
    struct utsname info;
    if (uname(&info) != 0)
        return "x86_64";
    std::string machine = info.machine;
    if (machine == "aarch64" || machine == "arm64")
        return "arm64";
    if (machine == "amd64")
        return "x86_64";
    if (machine == "i686" || machine == "i586" || machine == "i486")
        return "i386";
    return machine;
}

bool host_is_darwin() {
    struct utsname info;
    if (uname(&info) != 0)
        return false;
    return std::string_view(info.sysname) == "Darwin";
}

// ============================================================================
// Validation
// ============================================================================

bool is_known_architecture(std::string_view arch) {
    for (const char* known : KNOWN_ARCHES) {
        if (arch == known)
            return true;
    }
    return false;
}

/// MAJOR.MINOR.PATCH with an optional `-prerelease` or `+build` suffix.
bool is_valid_semver(std::string_view version) {
    size_t pos = 0;
    for (int part = 0; part < 3; ++part) {
        size_t start = pos;
        while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos])))
            ++pos;
        if (pos == start)
            return false;
        if (part < 2) {
            if (pos >= version.size() || version[pos] != '.')
                return false;
            ++pos;
        }
    }
    if (pos == version.size())
        return true;
    if (version[pos] != '-' && version[pos] != '+')
        return false;
    ++pos;
    if (pos == version.size())
        return false;
    for (; pos < version.size(); ++pos) {
        char c = version[pos];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' && c != '+')
            return false;
    }
    return true;
}

/// At least two dot-separated labels of [A-Za-z0-9-], none empty.
bool is_valid_bundle_identifier(std::string_view identifier) {
    if (identifier.empty())
        return false;
    int labels = 0;
    size_t start = 0;
    while (start <= identifier.size()) {
        size_t dot = identifier.find('.', start);
        if (dot == std::string_view::npos)
            dot = identifier.size();
        std::string_view label = identifier.substr(start, dot - start);
        if (label.empty())
            return false;
        for (char c : label) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-')
                return false;
        }
        ++labels;
        start = dot + 1;
    }
    return labels >= 2;
}

Result<std::vector<std::string>> parse_arch_selector(std::string_view selector) {
    std::string value = trim(selector);
    if (to_lower(value) == "universal")
        return std::vector<std::string>{"x86_64", "arm64"};

    std::vector<std::string> arches;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos)
            comma = value.size();
        std::string arch = trim(std::string_view(value).substr(start, comma - start));
        if (arch == "aarch64")
            arch = "arm64";
        if (arch.empty()) {
            return config_error("empty architecture in '" + std::string(selector) + "'");
        }
        if (!is_known_architecture(arch)) {
            return config_error("unknown architecture '" + arch + "'",
                                "supported: x86_64, arm64, arm64e, i386, universal");
        }
        if (std::find(arches.begin(), arches.end(), arch) != arches.end()) {
            return config_error("architecture '" + arch + "' listed twice");
        }
        arches.push_back(arch);
        start = comma + 1;
    }
    return arches;
}

Result<Unit> validate(const BuildConfig& config) {
    const auto& pkg = config.package;
    if (pkg.name.empty()) {
        return config_error("[package] name is required");
    }
    if (pkg.name.find('/') != std::string::npos) {
        return config_error("[package] name must not contain '/'");
    }
    if (!is_valid_bundle_identifier(pkg.identifier)) {
        return config_error("invalid bundle identifier '" + pkg.identifier + "'",
                            "use reverse-DNS form, e.g. com.example.app");
    }
    if (!is_valid_semver(pkg.version)) {
        return config_error("invalid version '" + pkg.version + "'",
                            "use semantic versioning, e.g. 1.2.0");
    }
    if (config.architectures.empty()) {
        return config_error("no target architectures");
    }
    for (size_t i = 0; i < config.architectures.size(); ++i) {
        const auto& arch = config.architectures[i];
        if (!is_known_architecture(arch)) {
            return config_error("unknown architecture '" + arch + "'",
                                "supported: x86_64, arm64, arm64e, i386");
        }
        for (size_t j = 0; j < i; ++j) {
            if (config.architectures[j] == arch)
                return config_error("architecture '" + arch + "' listed twice");
        }
    }
    if (config.assembly.format == ImageFormat::AppImage && config.architectures.size() > 1) {
        return config_error("the appimage format supports a single architecture",
                            "set TARGET_ARCH to one architecture or use format \"dmg\"");
    }
    if (config.build.command.empty()) {
        return config_error("[build] command must not be empty");
    }
    if (config.build.jobs < 1) {
        return config_error("[build] jobs must be at least 1");
    }
    if (config.paths.entry_point.empty()) {
        return config_error("[paths] entry_point is required");
    }

    // <work> is removed by clean() and after a successful run.
    const auto& paths = config.paths;
    if (paths.work_dir.empty()) {
        return config_error("[paths] work_dir must not be empty");
    }
    const std::pair<const char*, const fs::path*> protected_paths[] = {
        {"the project directory", &config.project_dir},
        {"source_dir", &paths.source_dir},
        {"entry_point", &paths.entry_point},
        {"dist_dir", &paths.dist_dir},
        {"cache_dir", &paths.cache_dir}};
    for (const auto& [what, path] : protected_paths) {
        if (path_within(*path, paths.work_dir)) {
            return config_error("[paths] work_dir " + paths.work_dir.string() + " contains " +
                                    what + " (" + path->string() + ")",
                                "point work_dir at a directory used only for intermediates");
        }
    }

    if (config.assembly.size_margin_mb < 0) {
        return config_error("[assembly] size_margin_mb must not be negative");
    }
    if (config.assembly.mount_timeout_ms <= 0 || config.assembly.mount_poll_ms <= 0) {
        return config_error("[assembly] mount_timeout_ms and mount_poll_ms must be positive");
    }
    return Unit{};
}

// ============================================================================
// Loading
// ============================================================================

Result<BuildConfig> build_config_from_toml(const TomlDocument& doc, const fs::path& project_dir,
                                           const EnvMap& env) {
    BuildConfig config;
    config.project_dir = project_dir;

    // Type checks for keys whose accessors would otherwise silently ignore a
    // wrongly typed value.
    const std::pair<const char*, const char*> string_keys[] = {
        {"package", "name"},     {"package", "identifier"}, {"package", "version"},
        {"package", "minimum_os"}, {"paths", "entry_point"},  {"paths", "source_dir"},
        {"paths", "icon"},       {"paths", "default_icon"}, {"paths", "work_dir"},
        {"paths", "dist_dir"},   {"paths", "cache_dir"},    {"build", "resources"},
        {"assembly", "format"},  {"assembly", "background"}};
    for (const auto& [section, key] : string_keys) {
        auto check = expect_type(doc, section, key, "a string",
                                 doc.get_string(section, key).has_value());
        if (is_err(check))
            return unwrap_err(check);
    }

    // [package]
    config.package.name = doc.get_string("package", "name").value_or("");
    config.package.identifier = doc.get_string("package", "identifier").value_or("");
    config.package.version = doc.get_string("package", "version").value_or("");
    config.package.minimum_os = doc.get_string("package", "minimum_os").value_or("11.0");

    // [paths]
    config.paths.entry_point = resolve(project_dir, doc.get_string("paths", "entry_point").value_or(""));
    std::string source = doc.get_string("paths", "source_dir").value_or("");
    config.paths.source_dir = source.empty() && !config.paths.entry_point.empty()
                                  ? config.paths.entry_point.parent_path()
                                  : resolve(project_dir, source);
    config.paths.icon = resolve(project_dir, doc.get_string("paths", "icon").value_or(""));
    config.paths.default_icon =
        resolve(project_dir, doc.get_string("paths", "default_icon").value_or(""));
    config.paths.work_dir =
        resolve(project_dir, doc.get_string("paths", "work_dir").value_or("build/relpack"));
    config.paths.dist_dir = resolve(project_dir, doc.get_string("paths", "dist_dir").value_or("dist"));

    std::string cache = env_value(env, "RELPACK_CACHE_DIR");
    if (!cache.empty()) {
        config.paths.cache_dir = fs::absolute(cache).lexically_normal();
    } else if (auto manifest_cache = doc.get_string("paths", "cache_dir")) {
        config.paths.cache_dir = resolve(project_dir, *manifest_cache);
    } else if (!env_value(env, "XDG_CACHE_HOME").empty()) {
        config.paths.cache_dir = fs::path(env_value(env, "XDG_CACHE_HOME")) / "relpack";
    } else if (!env_value(env, "HOME").empty()) {
        config.paths.cache_dir = fs::path(env_value(env, "HOME")) / ".cache" / "relpack";
    } else {
        config.paths.cache_dir = project_dir / ".relpack-cache";
    }

    std::string dist_override = env_value(env, "RELPACK_DIST_DIR");
    if (!dist_override.empty()) {
        config.paths.dist_dir = fs::absolute(dist_override).lexically_normal();
    }

    // [build]
    std::string selector = env_value(env, "TARGET_ARCH");
    if (!selector.empty()) {
        auto arches = parse_arch_selector(selector);
        if (is_err(arches))
            return unwrap_err(arches);
        config.architectures = unwrap(arches);
    } else if (auto listed = doc.get_strings("build", "architectures")) {
        config.architectures = *listed;
    } else if (doc.find("build", "architectures")) {
        return config_error("[build] architectures must be an array of strings");
    } else {
        config.architectures = {host_architecture()};
    }

    if (auto command = doc.get_strings("build", "command")) {
        config.build.command = *command;
    } else if (doc.find("build", "command")) {
        return config_error("[build] command must be an array of strings");
    } else {
        config.build.command = default_command();
    }

    if (auto jobs = doc.get_int("build", "jobs")) {
        config.build.jobs = static_cast<int>(*jobs);
    }

    std::string resources = doc.get_string("build", "resources").value_or("strict");
    if (resources == "strict") {
        config.build.resources = ResourcePolicy::Strict;
    } else if (resources == "first-wins") {
        config.build.resources = ResourcePolicy::FirstWins;
    } else {
        return config_error("unknown resource policy '" + resources + "'",
                            "use \"strict\" or \"first-wins\"");
    }

    if (auto tools = doc.get_strings("build", "required_tools")) {
        config.build.required_tools = *tools;
    } else if (!doc.find("build", "command")) {
        config.build.required_tools = {"pyinstaller"};
    } else if (!config.build.command.empty()) {
        config.build.required_tools = {config.build.command.front()};
    }

    // [assembly]
    std::string format = env_value(env, "RELPACK_IMAGE_FORMAT");
    if (format.empty())
        format = doc.get_string("assembly", "format").value_or(host_is_darwin() ? "dmg" : "appimage");
    auto parsed_format = parse_format(format);
    if (is_err(parsed_format))
        return unwrap_err(parsed_format);
    config.assembly.format = unwrap(parsed_format);

    auto& assembly = config.assembly;
    if (auto v = doc.get_int("assembly", "size_margin_mb"))
        assembly.size_margin_mb = static_cast<int>(*v);
    if (auto v = doc.get_int("assembly", "mount_timeout_ms"))
        assembly.mount_timeout_ms = static_cast<int>(*v);
    if (auto v = doc.get_int("assembly", "mount_poll_ms"))
        assembly.mount_poll_ms = static_cast<int>(*v);
    if (auto v = doc.get_bool("assembly", "presentation"))
        assembly.presentation = *v;
    if (auto v = doc.get_bool("assembly", "keep_intermediates"))
        assembly.keep_intermediates = *v;
    if (auto v = doc.get_int("assembly", "icon_size"))
        assembly.window.icon_size = static_cast<int>(*v);
    assembly.background = resolve(project_dir, doc.get_string("assembly", "background").value_or(""));

    auto window = read_int_array(doc, "assembly", "window", 4);
    if (is_err(window))
        return unwrap_err(window);
    if (!unwrap(window).empty()) {
        const auto& w = unwrap(window);
        assembly.window.left = w[0];
        assembly.window.top = w[1];
        assembly.window.right = w[2];
        assembly.window.bottom = w[3];
    }
    auto app_pos = read_int_array(doc, "assembly", "app_position", 2);
    if (is_err(app_pos))
        return unwrap_err(app_pos);
    if (!unwrap(app_pos).empty())
        assembly.window.app_position = {unwrap(app_pos)[0], unwrap(app_pos)[1]};
    auto link_pos = read_int_array(doc, "assembly", "link_position", 2);
    if (is_err(link_pos))
        return unwrap_err(link_pos);
    if (!unwrap(link_pos).empty())
        assembly.window.link_position = {unwrap(link_pos)[0], unwrap(link_pos)[1]};

    // [tool.<name>]
    for (const auto& name : doc.subsections("tool.")) {
        std::string section = "tool." + name;
        ToolSpec spec;
        spec.name = name;
        spec.version = doc.get_string(section, "version").value_or("latest");
        spec.url = doc.get_string(section, "url").value_or("");
        if (auto smoke = doc.get_strings(section, "smoke_args"))
            spec.smoke_args = *smoke;
        if (spec.url.empty()) {
            return config_error("[" + section + "] url is required");
        }
        config.tools[name] = spec;
    }

    auto valid = validate(config);
    if (is_err(valid))
        return unwrap_err(valid);

    RELPACK_LOG_DEBUG("config", "Loaded " << config.package.name << " " << config.package.version
                                          << " for " << config.arch_label() << " ("
                                          << format_name(config.assembly.format) << ")");
    return config;
}

Result<BuildConfig> load_build_config(const fs::path& manifest_path, const EnvMap& env) {
    auto content = read_file(manifest_path);
    if (!content) {
        return config_error("cannot read manifest " + manifest_path.string(),
                            "run relpack from the project directory or pass --config=<path>");
    }

    SimpleTomlParser parser(*content);
    auto doc = parser.parse();
    if (!doc) {
        return config_error(manifest_path.filename().string() + ": " + parser.get_error());
    }

    fs::path project_dir = fs::absolute(manifest_path).parent_path().lexically_normal();
    return build_config_from_toml(*doc, project_dir, env);
}

std::string expand_placeholders(std::string_view text,
                                const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('{', pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        size_t close = text.find('}', open + 1);
        if (close == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));
        std::string key(text.substr(open + 1, close - open - 1));
        auto it = values.find(key);
        if (it != values.end()) {
            out += it->second;
        } else {
            out.append(text.substr(open, close - open + 1));
        }
        pos = close + 1;
    }
    return out;
}

} // namespace relpack::config
