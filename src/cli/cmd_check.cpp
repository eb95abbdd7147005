//! # Check Command
//!
//! Implements `elmtest check`, which warns about tests that exist in a test
//! module but are missing from its `exposing` list.
//!
//! ## Check Flow
//!
//! ```text
//! run_check()
//!   ├─ Load elmtest.toml (or --config=<file>)
//!   ├─ Apply command-line overrides
//!   ├─ collect_jobs()   - discover modules and candidate tests
//!   ├─ check_modules()  - parallel exposure check
//!   └─ print_reports()  - problems, summary and exit code
//! ```

#include "cmd_check.hpp"

#include "cli/checker.hpp"
#include "config/check_config.hpp"
#include "log/log.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace elmtest::cli {

namespace {

void print_check_help() {
    std::cout << "Usage: elmtest check [options] [paths]\n\n";
    std::cout << "Paths are test directories or single .elm files. Without paths the\n";
    std::cout << "test-directories from elmtest.toml are checked (default: tests).\n\n";
    std::cout << "Options:\n";
    std::cout << "  --jobs=<n>, -j<n>    Worker threads (0 = one per core)\n";
    std::cout << "  --strict             Treat unexposed tests as errors\n";
    std::cout << "  --no-color           Disable colored output\n";
    std::cout << "  --config=<file>      Read settings from <file> instead of elmtest.toml\n";
    std::cout << "  --help, -h           Show this help\n";
}

bool parse_jobs(std::string_view text, unsigned& jobs) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), jobs);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

int run_check(int argc, char* argv[]) {
    std::optional<unsigned> jobs;
    bool strict = false;
    bool no_color = false;
    std::string config_file;
    std::vector<fs::path> paths;

    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            print_check_help();
            return 0;
        } else if (arg == "--strict") {
            strict = true;
        } else if (arg == "--no-color") {
            no_color = true;
        } else if (arg.starts_with("--config=")) {
            config_file = std::string(arg.substr(9));
        } else if (arg.starts_with("--jobs=") || arg.starts_with("-j")) {
            auto value = arg.substr(arg.starts_with("-j") ? 2 : 7);
            unsigned n = 0;
            if (!parse_jobs(value, n)) {
                std::cerr << "error: invalid job count '" << value << "'\n";
                return 1;
            }
            jobs = n;
        } else if (!arg.empty() && arg[0] != '-') {
            paths.emplace_back(arg);
        } else {
            std::cerr << "error: unknown option '" << arg << "'\n";
            print_check_help();
            return 1;
        }
    }

    config::CheckConfig config = config_file.empty()
                                     ? config::load_check_config(fs::current_path())
                                     : config::load_check_config_file(config_file);
    if (jobs)
        config.jobs = *jobs;
    if (strict)
        config.strict = true;
    if (no_color)
        config.color = false;

    if (paths.empty()) {
        for (const auto& dir : config.test_directories) {
            paths.emplace_back(dir);
        }
    }

    CheckPlan plan = collect_jobs(paths);
    ELMTEST_LOG_INFO("check", "Checking " << plan.jobs.size() << " test module(s)");

    auto reports = check_modules(plan.jobs, config.jobs);
    auto summary = summarize(reports, plan.discovery_errors.size());

    for (const auto& error : plan.discovery_errors) {
        std::cout << "  " << (config.color ? colors::red : "") << "error  "
                  << (config.color ? colors::reset : "") << "  " << error << "\n";
    }
    print_reports(std::cout, reports, summary, config.strict, config.color);

    return exit_code(summary, config.strict);
}

} // namespace elmtest::cli
