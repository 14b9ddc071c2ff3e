#include "cli/utils.hpp"

#include <iostream>

namespace relpack::cli {

void print_usage() {
    std::cout << "relpack " << VERSION << "\n\n";
    std::cout << "Usage: relpack [command] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  all               Run every stage (default)\n";
    std::cout << "  check             Check prerequisites\n";
    std::cout << "  clean             Remove previous build output\n";
    std::cout << "  build             Build every configured architecture\n";
    std::cout << "  merge             Merge per-architecture bundles\n";
    std::cout << "  icon              Build the icon set and container\n";
    std::cout << "  assemble          Build the disk image or AppImage\n";
    std::cout << "  verify [bundle]   Inspect a bundle\n";
    std::cout << "  debug <bundle>    Interactive debugging menu\n";
    std::cout << "  fetch <tool>      Download a tool into the cache\n";
    std::cout << "  cache [list|clear] Inspect or empty the tool cache\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h         Show this help\n";
    std::cout << "  --version, -V      Show version\n";
    std::cout << "  --config=<path>    Manifest path (default: relpack.toml)\n";
    std::cout << "  --arch=<list>      Architectures: x86_64, arm64, a comma list or universal\n";
    std::cout << "  --jobs=N           Parallel architecture builds\n";
    std::cout << "  --keep             Keep intermediates after success\n";
    std::cout << "  --log-level=LEVEL  trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=SPEC  Per-module levels, e.g. merge=debug,*=warn\n";
    std::cout << "  --log-file=PATH    Also write logs to a file\n";
    std::cout << "  --log-format=FMT   text or json\n";
    std::cout << "  -v, -vv, -q        More or less output\n";
}

void print_version() {
    std::cout << "relpack " << VERSION << "\n";
}

void print_failure(std::ostream& out, const std::string& stage, const PackError& error) {
    out << "error: stage '" << stage << "' failed: " << error.message << "\n";
    if (!error.hint.empty())
        out << "hint: " << error.hint << "\n";
}

void print_warnings(std::ostream& out, const std::vector<std::string>& warnings) {
    for (const auto& warning : warnings)
        out << "warning: " << warning << "\n";
}

} // namespace relpack::cli
