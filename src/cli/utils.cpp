// CLI utilities - help and version output

#include "utils.hpp"

#include "common.hpp"

#include <iostream>

namespace elmtest::cli {

void print_usage() {
    std::cout << "elmtest " << VERSION << "\n\n";
    std::cout << "Usage: elmtest <command> [options] [paths]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  check     Report tests that their module does not expose\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h           Show this help\n";
    std::cout << "  --version, -V        Show version\n";
    std::cout << "  --log-level=<level>  trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>  Per-module levels, e.g. check=debug,*=warn\n";
    std::cout << "  --log-file=<path>    Also write log output to a file\n";
    std::cout << "  --log-format=json    Log as JSON lines\n";
    std::cout << "  -v, -vv, -vvv        Increase log verbosity\n";
    std::cout << "  -q, --quiet          Only log errors\n";
    std::cout << "\nRun 'elmtest check --help' for check options.\n";
}

void print_version() {
    std::cout << "elmtest " << VERSION << "\n";
}

} // namespace elmtest::cli
