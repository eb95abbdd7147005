// Check command - discovery, parallel execution and reporting

#include "cli/checker.hpp"

#include "discovery/test_discovery.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>

namespace elmtest::cli {

namespace {

// Color helper that respects --no-color
struct ColorOutput {
    bool enabled;

    explicit ColorOutput(bool use_color) : enabled(use_color) {}

    const char* reset() const {
        return enabled ? colors::reset : "";
    }
    const char* bold() const {
        return enabled ? colors::bold : "";
    }
    const char* dim() const {
        return enabled ? colors::dim : "";
    }
    const char* red() const {
        return enabled ? colors::red : "";
    }
    const char* green() const {
        return enabled ? colors::green : "";
    }
    const char* yellow() const {
        return enabled ? colors::yellow : "";
    }
};

void check_worker(const std::vector<ModuleJob>& jobs, std::atomic<size_t>& current_index,
                  ReportCollector& collector) {
    while (true) {
        size_t index = current_index.fetch_add(1);
        if (index >= jobs.size()) {
            break;
        }

        const auto& job = jobs[index];
        ELMTEST_LOG_DEBUG("check", "[" << (index + 1) << "/" << jobs.size() << "] "
                                       << job.module_name);
        collector.add(check_module(job));
    }
}

void add_jobs_from_root(const fs::path& root, const std::vector<fs::path>& files,
                        CheckPlan& plan) {
    for (const auto& file : files) {
        auto candidates = discovery::find_candidate_tests(file);
        if (is_err(candidates)) {
            ELMTEST_LOG_ERROR("check", unwrap_err(candidates));
            plan.discovery_errors.push_back(std::move(unwrap_err(candidates)));
            continue;
        }
        if (unwrap(candidates).empty()) {
            ELMTEST_LOG_DEBUG("check", "No tests in " << file.string() << ", skipping");
            continue;
        }
        plan.jobs.push_back(ModuleJob{file, discovery::module_name_from_path(file, root),
                                      std::move(unwrap(candidates))});
    }
}

} // namespace

// ============================================================================
// Result Collector
// ============================================================================

void ReportCollector::add(ModuleReport report) {
    std::lock_guard<std::mutex> lock(mutex);
    reports.push_back(std::move(report));
}

// ============================================================================
// Job Collection
// ============================================================================

CheckPlan collect_jobs(const std::vector<fs::path>& paths) {
    CheckPlan plan;

    for (const auto& path : paths) {
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            std::vector<fs::path> files;
            discovery::find_elm_files(path, files);
            ELMTEST_LOG_INFO("check", "Found " << files.size() << " Elm files in "
                                               << path.string());
            add_jobs_from_root(path, files, plan);
        } else if (fs::is_regular_file(path, ec) && path.extension() == ".elm") {
            size_t before = plan.jobs.size();
            add_jobs_from_root(path.parent_path(), {path}, plan);
            // A lone file has no module root; use the name it declares
            if (plan.jobs.size() > before) {
                if (auto declared = discovery::declared_module_name(path)) {
                    plan.jobs.back().module_name = std::move(*declared);
                }
            }
        } else if (fs::exists(path, ec)) {
            ELMTEST_LOG_WARN("check", path.string() << " is not an .elm file, skipping");
        } else {
            ELMTEST_LOG_WARN("check", path.string() << " does not exist");
        }
    }

    return plan;
}

// ============================================================================
// Execution
// ============================================================================

ModuleReport check_module(const ModuleJob& job) {
    ModuleReport report{job, NameSet(), std::nullopt};

    auto result = exposure::filter_exposing(job.path, job.candidates, job.module_name);
    if (is_ok(result)) {
        report.accepted = std::move(unwrap(result).names);
    } else {
        report.problem = std::move(unwrap_err(result));
    }
    return report;
}

std::vector<ModuleReport> check_modules(const std::vector<ModuleJob>& jobs,
                                        unsigned worker_count) {
    if (worker_count == 0) {
        worker_count = std::max(1u, std::thread::hardware_concurrency());
    }
    worker_count = static_cast<unsigned>(std::min<size_t>(worker_count, jobs.size()));

    ReportCollector collector;
    std::atomic<size_t> current_index{0};

    if (worker_count <= 1) {
        check_worker(jobs, current_index, collector);
    } else {
        ELMTEST_LOG_DEBUG("check", "Checking " << jobs.size() << " modules on " << worker_count
                                               << " threads");
        std::vector<std::thread> threads;
        threads.reserve(worker_count);
        for (unsigned i = 0; i < worker_count; ++i) {
            threads.emplace_back(check_worker, std::cref(jobs), std::ref(current_index),
                                 std::ref(collector));
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    std::sort(collector.reports.begin(), collector.reports.end(),
              [](const ModuleReport& a, const ModuleReport& b) {
                  if (a.job.module_name != b.job.module_name)
                      return a.job.module_name < b.job.module_name;
                  return a.job.path < b.job.path;
              });
    return std::move(collector.reports);
}

// ============================================================================
// Summary
// ============================================================================

CheckSummary summarize(const std::vector<ModuleReport>& reports, size_t discovery_errors) {
    CheckSummary summary;
    summary.errors = discovery_errors;
    for (const auto& report : reports) {
        ++summary.modules;
        summary.tests += report.accepted.size();
        if (!report.problem)
            continue;
        if (exposure::is_warning(*report.problem)) {
            ++summary.warnings;
        } else {
            ++summary.errors;
        }
    }
    return summary;
}

int exit_code(const CheckSummary& summary, bool strict) {
    if (summary.errors > 0)
        return 1;
    if (strict && summary.warnings > 0)
        return 1;
    return 0;
}

void print_reports(std::ostream& out, const std::vector<ModuleReport>& reports,
                   const CheckSummary& summary, bool strict, bool color) {
    ColorOutput c(color);

    for (const auto& report : reports) {
        if (!report.problem)
            continue;

        const auto& problem = *report.problem;
        bool as_error = !exposure::is_warning(problem) || strict;
        out << "  " << (as_error ? c.red() : c.yellow()) << (as_error ? "error  " : "warning")
            << c.reset() << "  " << c.bold() << report.job.module_name << c.reset() << " "
            << c.dim() << "(" << report.job.path.string() << ")" << c.reset() << "\n";
        out << "      " << exposure::describe(problem) << "\n";
        if (problem.kind == exposure::ProblemKind::UnexposedTests) {
            out << "      " << c.dim() << "Add them to the module's exposing list so they run."
                << c.reset() << "\n";
        }
    }

    out << "Checked " << summary.modules << " module(s): " << c.green() << summary.tests
        << " test(s) exposed" << c.reset();
    if (summary.warnings > 0) {
        out << ", " << (strict ? c.red() : c.yellow()) << summary.warnings << " with unexposed tests"
            << c.reset();
    }
    if (summary.errors > 0) {
        out << ", " << c.red() << summary.errors << " error(s)" << c.reset();
    }
    out << "\n";
}

} // namespace elmtest::cli
