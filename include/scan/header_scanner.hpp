//! # Module Header Scanner
//!
//! Reads the `module ... exposing (...)` declaration at the top of an Elm
//! source file and reports what the module exports.
//!
//! ## Accepted Headers
//!
//! ```elm
//! module Foo.Bar exposing (..)
//! port module Ports exposing (send, receive)
//! effect module Task where { command = MyCmd } exposing
//!     ( Task
//!     , perform
//!     )
//! ```
//!
//! ## State Machine
//!
//! ```text
//! AwaitingModuleKeyword --"module"--> ReadingModuleName --"exposing"-->
//! AwaitingOpenBracket --"("--> AccumulatingExposedNames(depth) --depth 0--> Done
//! ```
//!
//! The state is a single `std::variant` advanced by `step()`, which never
//! touches anything but its arguments. `HeaderScanner` wraps it for callers
//! that feed lines one at a time. All input lines must already have passed
//! through `strip_comments()`.

#ifndef ELMTEST_SCAN_HEADER_SCANNER_HPP
#define ELMTEST_SCAN_HEADER_SCANNER_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace elmtest::scan {

// ============================================================================
// Exposure Sets
// ============================================================================

/// The module declares `exposing (..)`.
struct Wildcard {
    [[nodiscard]] auto operator==(const Wildcard&) const -> bool = default;
};

/// The module lists its exports; only value-level names are kept.
struct Enumerated {
    NameSet names;

    [[nodiscard]] auto operator==(const Enumerated&) const -> bool = default;
};

using ExposureSet = std::variant<Wildcard, Enumerated>;

/// Why a header could not be read.
enum class HeaderError {
    MissingModuleDeclaration, ///< First real content was not a module line.
    IncompleteHeader,         ///< Input ended before the exposing clause closed.
};

using HeaderOutcome = Result<ExposureSet, HeaderError>;

// ============================================================================
// Scan States
// ============================================================================

struct AwaitingModuleKeyword {};

struct ReadingModuleName {
    std::string name; ///< Text seen so far between the module keyword and `exposing`.
};

struct AwaitingOpenBracket {
    std::string module_name;
};

struct AccumulatingExposedNames {
    std::string module_name;
    std::string buffer; ///< Clause text after the opening parenthesis.
    int depth = 1;      ///< Open parentheses not yet closed.
};

using ScanState =
    std::variant<AwaitingModuleKeyword, ReadingModuleName, AwaitingOpenBracket,
                 AccumulatingExposedNames>;

/// Result of feeding one line to the state machine.
struct Step {
    ScanState state;
    std::optional<HeaderOutcome> outcome; ///< Set once the header is resolved.
};

/// Advances the state machine over one comment-free line.
///
/// A single line may carry the machine through several states, as in
/// `module Foo exposing (a, b)`.
[[nodiscard]] auto step(ScanState state, std::string_view cleaned_line) -> Step;

/// Interprets the text between the exposing parentheses.
[[nodiscard]] auto parse_exposed_names(std::string_view clause) -> ExposureSet;

/// Length of the module keyword prefix at the start of `line`
/// (`module`, `port module` or `effect module`), or nullopt.
[[nodiscard]] auto match_module_prefix(std::string_view line) -> std::optional<size_t>;

/// True for names that start with a lowercase letter and contain only
/// letters, digits and underscores. Non-ASCII UTF-8 bytes count as
/// lowercase letters, so `tëst` is a value name.
[[nodiscard]] auto is_value_identifier(std::string_view name) -> bool;

// ============================================================================
// HeaderScanner
// ============================================================================

/// Line-at-a-time driver over `step()`.
///
/// # Example
///
/// ```cpp
/// HeaderScanner scanner;
/// while (std::getline(in, raw)) {
///     if (auto outcome = scanner.feed(cleaned)) {
///         return *outcome;
///     }
/// }
/// return scanner.finish();
/// ```
class HeaderScanner {
public:
    /// Feeds the next comment-free line. Returns the outcome once resolved;
    /// further calls keep returning it.
    auto feed(std::string_view cleaned_line) -> std::optional<HeaderOutcome>;

    /// Signals end of input. Returns the resolved outcome, or
    /// `HeaderError::IncompleteHeader` if the header never completed.
    [[nodiscard]] auto finish() const -> HeaderOutcome;

    [[nodiscard]] auto done() const -> bool {
        return outcome_.has_value();
    }

    /// Dotted module name once `exposing` was reached, empty before. For
    /// effect modules the `where { ... }` clause is left out.
    [[nodiscard]] auto declared_module_name() const -> std::string;

private:
    ScanState state_;
    std::optional<HeaderOutcome> outcome_;
};

/// Strips comments from raw lines and scans them to a header outcome.
[[nodiscard]] auto scan_header(const std::vector<std::string>& raw_lines) -> HeaderOutcome;

} // namespace elmtest::scan

#endif // ELMTEST_SCAN_HEADER_SCANNER_HPP
