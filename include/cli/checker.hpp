//! # Batch Exposure Checking
//!
//! Runs the exposure check over every test module of a project.
//!
//! ## Pipeline
//!
//! ```text
//! collect_jobs()    test dirs → *.elm files → candidate tests per module
//! check_modules()   worker threads → filter_exposing() per module
//! summarize()       counts for the report and the exit code
//! print_reports()   per-module problems, then a summary line
//! ```
//!
//! A problem in one module never stops the others.

#ifndef ELMTEST_CLI_CHECKER_HPP
#define ELMTEST_CLI_CHECKER_HPP

#include "common.hpp"
#include "exposure/exposure_checker.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace elmtest::cli {

namespace fs = std::filesystem;

/// One module to check.
struct ModuleJob {
    fs::path path;
    std::string module_name;
    NameSet candidates;
};

/// Outcome of checking one module.
struct ModuleReport {
    ModuleJob job;
    NameSet accepted;
    std::optional<exposure::Problem> problem;
};

/// Jobs found under the requested paths, plus files whose tests could not
/// be discovered.
struct CheckPlan {
    std::vector<ModuleJob> jobs;
    std::vector<std::string> discovery_errors;
};

struct CheckSummary {
    size_t modules = 0;  ///< Modules checked
    size_t tests = 0;    ///< Tests accepted
    size_t warnings = 0; ///< Modules with unexposed tests
    size_t errors = 0;   ///< Modules that could not be checked
};

/// Thread-safe report aggregation.
struct ReportCollector {
    std::mutex mutex;
    std::vector<ModuleReport> reports;

    void add(ModuleReport report);
};

/// Discovers test modules below each path. A path may be a directory (the
/// module root) or a single `.elm` file. Modules without candidate tests
/// are left out.
[[nodiscard]] CheckPlan collect_jobs(const std::vector<fs::path>& paths);

/// Checks a single module.
[[nodiscard]] ModuleReport check_module(const ModuleJob& job);

/// Checks all jobs on `worker_count` threads (0 = hardware concurrency).
/// Reports come back sorted by module name.
[[nodiscard]] std::vector<ModuleReport> check_modules(const std::vector<ModuleJob>& jobs,
                                                      unsigned worker_count);

[[nodiscard]] CheckSummary summarize(const std::vector<ModuleReport>& reports,
                                     size_t discovery_errors = 0);

/// 1 if any module failed, or under `strict` if any test is unexposed.
[[nodiscard]] int exit_code(const CheckSummary& summary, bool strict);

void print_reports(std::ostream& out, const std::vector<ModuleReport>& reports,
                   const CheckSummary& summary, bool strict, bool color);

} // namespace elmtest::cli

#endif // ELMTEST_CLI_CHECKER_HPP
