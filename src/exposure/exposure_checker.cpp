//! # Exposure Checker Implementation

#include "exposure/exposure_checker.hpp"

#include "scan/comment_stripper.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>

namespace elmtest::exposure {

// ============================================================================
// Problem Constructors
// ============================================================================

auto Problem::unexposed_tests(std::string module_name, NameSet names) -> Problem {
    return Problem{ProblemKind::UnexposedTests, std::move(module_name), fs::path(),
                   std::move(names), std::string()};
}

auto Problem::missing_module_declaration(fs::path path) -> Problem {
    return Problem{ProblemKind::MissingModuleDeclaration, std::string(), std::move(path),
                   NameSet(), std::string()};
}

auto Problem::open_file(fs::path path, std::string detail) -> Problem {
    return Problem{ProblemKind::OpenFile, std::string(), std::move(path), NameSet(),
                   std::move(detail)};
}

auto Problem::read_file(fs::path path, std::string detail) -> Problem {
    return Problem{ProblemKind::ReadFile, std::string(), std::move(path), NameSet(),
                   std::move(detail)};
}

auto Problem::parse_error(fs::path path) -> Problem {
    return Problem{ProblemKind::ParseError, std::string(), std::move(path), NameSet(),
                   std::string()};
}

// ============================================================================
// Header Reading
// ============================================================================

auto read_exposing(const fs::path& path) -> Result<scan::ExposureSet, Problem> {
    errno = 0;
    std::ifstream file(path);
    if (!file) {
        return Problem::open_file(path, errno_message(errno, "cannot open file"));
    }

    scan::HeaderScanner scanner;
    bool in_block_comment = false;
    std::string raw;
    while (std::getline(file, raw)) {
        auto stripped = scan::strip_comments(raw, in_block_comment);
        in_block_comment = stripped.in_block_comment;
        if (scanner.feed(stripped.line)) {
            break;
        }
    }

    if (file.bad()) {
        return Problem::read_file(path, errno_message(errno, "read error"));
    }

    auto outcome = scanner.finish();
    if (is_ok(outcome)) {
        return unwrap(outcome);
    }

    switch (unwrap_err(outcome)) {
    case scan::HeaderError::MissingModuleDeclaration:
        return Problem::missing_module_declaration(path);
    case scan::HeaderError::IncompleteHeader:
        break;
    }
    return Problem::parse_error(path);
}

// ============================================================================
// Reconciliation
// ============================================================================

auto reconcile(const scan::ExposureSet& exposure, const NameSet& candidates,
               const std::string& module_name) -> Result<AcceptedTests, Problem> {
    NameSet accepted;
    if (std::holds_alternative<scan::Wildcard>(exposure)) {
        accepted = candidates;
    } else {
        const auto& exposed = std::get<scan::Enumerated>(exposure).names;
        std::set_intersection(exposed.begin(), exposed.end(), candidates.begin(), candidates.end(),
                              std::inserter(accepted, accepted.end()));
    }

    if (accepted.size() < candidates.size()) {
        NameSet unexposed;
        std::set_difference(candidates.begin(), candidates.end(), accepted.begin(), accepted.end(),
                            std::inserter(unexposed, unexposed.end()));
        return Problem::unexposed_tests(module_name, std::move(unexposed));
    }

    return AcceptedTests{module_name, std::move(accepted)};
}

auto filter_exposing(const fs::path& path, const NameSet& candidates,
                     const std::string& module_name) -> Result<AcceptedTests, Problem> {
    auto exposure = read_exposing(path);
    if (is_err(exposure)) {
        return std::move(unwrap_err(exposure));
    }
    return reconcile(unwrap(exposure), candidates, module_name);
}

// ============================================================================
// Reporting
// ============================================================================

auto kind_name(ProblemKind kind) -> const char* {
    switch (kind) {
    case ProblemKind::UnexposedTests:
        return "unexposed-tests";
    case ProblemKind::MissingModuleDeclaration:
        return "missing-module-declaration";
    case ProblemKind::OpenFile:
        return "open-file";
    case ProblemKind::ReadFile:
        return "read-file";
    case ProblemKind::ParseError:
        return "parse-error";
    }
    return "unknown";
}

auto is_warning(const Problem& problem) -> bool {
    return problem.kind == ProblemKind::UnexposedTests;
}

auto describe(const Problem& problem) -> std::string {
    std::ostringstream oss;
    switch (problem.kind) {
    case ProblemKind::UnexposedTests: {
        oss << "Module " << problem.module_name << " has tests that are not exposed: ";
        bool first = true;
        for (const auto& name : problem.unexposed) {
            if (!first)
                oss << ", ";
            oss << name;
            first = false;
        }
        break;
    }
    case ProblemKind::MissingModuleDeclaration:
        oss << problem.path.string() << " does not start with a module declaration";
        break;
    case ProblemKind::OpenFile:
        oss << "Cannot open " << problem.path.string() << " to read its exports: "
            << problem.detail;
        break;
    case ProblemKind::ReadFile:
        oss << "Error while reading exports from " << problem.path.string() << ": "
            << problem.detail;
        break;
    case ProblemKind::ParseError:
        oss << "Could not parse the module header of " << problem.path.string();
        break;
    }
    return oss.str();
}

} // namespace elmtest::exposure
