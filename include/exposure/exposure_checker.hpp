//! # Exposure Checker
//!
//! Decides which candidate tests of a module are reachable through its
//! `exposing` clause, and reports the ones that are not.
//!
//! ## Pipeline
//!
//! ```text
//! filter_exposing()
//!   ├─ read_exposing()      - file lines → strip_comments() → HeaderScanner
//!   └─ reconcile()          - exposed ∩ candidates, report the shortfall
//! ```
//!
//! ## Problems
//!
//! | Kind                       | Cause                                   |
//! |----------------------------|-----------------------------------------|
//! | `UnexposedTests`           | candidate test missing from the exports |
//! | `MissingModuleDeclaration` | first real content is not a module line |
//! | `OpenFile`                 | file could not be opened                |
//! | `ReadFile`                 | I/O error while reading                 |
//! | `ParseError`               | header never completed                  |
//!
//! Every function here only reads its file argument; calls for different
//! modules can run concurrently.

#ifndef ELMTEST_EXPOSURE_EXPOSURE_CHECKER_HPP
#define ELMTEST_EXPOSURE_EXPOSURE_CHECKER_HPP

#include "common.hpp"
#include "scan/header_scanner.hpp"

#include <filesystem>
#include <string>

namespace elmtest::exposure {

namespace fs = std::filesystem;

enum class ProblemKind {
    UnexposedTests,
    MissingModuleDeclaration,
    OpenFile,
    ReadFile,
    ParseError,
};

/// A failure to confirm a module's tests, reportable on its own.
struct Problem {
    ProblemKind kind;
    std::string module_name; ///< Set for UnexposedTests.
    fs::path path;           ///< Set for every file-level kind.
    NameSet unexposed;       ///< Candidates not exported (UnexposedTests only).
    std::string detail;      ///< OS error text for OpenFile and ReadFile.

    [[nodiscard]] static auto unexposed_tests(std::string module_name, NameSet names) -> Problem;
    [[nodiscard]] static auto missing_module_declaration(fs::path path) -> Problem;
    [[nodiscard]] static auto open_file(fs::path path, std::string detail) -> Problem;
    [[nodiscard]] static auto read_file(fs::path path, std::string detail) -> Problem;
    [[nodiscard]] static auto parse_error(fs::path path) -> Problem;
};

/// Candidates that survived the exposure check.
struct AcceptedTests {
    std::string module_name;
    NameSet names;
};

/// Scans the header of the file at `path`.
[[nodiscard]] auto read_exposing(const fs::path& path) -> Result<scan::ExposureSet, Problem>;

/// Intersects `exposure` with `candidates`. Fails with UnexposedTests when
/// any candidate is not exported.
[[nodiscard]] auto reconcile(const scan::ExposureSet& exposure, const NameSet& candidates,
                             const std::string& module_name) -> Result<AcceptedTests, Problem>;

/// Reads the module at `path` and keeps the candidates it exports.
///
/// `module_name` only labels the result and UnexposedTests problems.
[[nodiscard]] auto filter_exposing(const fs::path& path, const NameSet& candidates,
                                   const std::string& module_name)
    -> Result<AcceptedTests, Problem>;

/// One-line human-readable description of `problem`.
[[nodiscard]] auto describe(const Problem& problem) -> std::string;

/// UnexposedTests is a warning; every other kind fails the module.
[[nodiscard]] auto is_warning(const Problem& problem) -> bool;

/// Short name of a problem kind, e.g. "unexposed-tests".
[[nodiscard]] auto kind_name(ProblemKind kind) -> const char*;

} // namespace elmtest::exposure

#endif // ELMTEST_EXPOSURE_EXPOSURE_CHECKER_HPP
