//! # Common Definitions
//!
//! Shared types used by every elmtest component.
//!
//! - **Version Information**: tool version constants
//! - **Result Type**: error handling without exceptions
//! - **Name Sets**: the identifier set type passed between components
//! - **System Errors**: thread-safe `errno` messages
//! - **Terminal Colors**: ANSI escape codes for report output
//!
//! All fallible operations return `Result<T, E>`; exceptions never cross a
//! component boundary.

#ifndef ELMTEST_COMMON_HPP
#define ELMTEST_COMMON_HPP

#include <set>
#include <string>
#include <system_error>
#include <variant>

namespace elmtest {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.1";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 1;

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = read_exposing(path);
/// if (is_ok(result)) {
///     const ExposureSet& exposure = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value.
///
/// Throws `std::bad_variant_access` if the Result holds an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value.
///
/// Throws `std::bad_variant_access` if the Result holds a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Name Sets
// ============================================================================

/// A deduplicated set of identifiers. Ordered so reports are stable.
using NameSet = std::set<std::string>;

// ============================================================================
// System Errors
// ============================================================================

/// Message for an `errno` value, or `fallback` when `err` is 0. Safe to call
/// from worker threads, unlike `std::strerror`.
inline auto errno_message(int err, const char* fallback) -> std::string {
    if (err == 0) {
        return fallback;
    }
    return std::error_code(err, std::generic_category()).message();
}

// ============================================================================
// Terminal Colors
// ============================================================================

namespace colors {
inline const char* reset = "\033[0m";
inline const char* bold = "\033[1m";
inline const char* dim = "\033[2m";
inline const char* red = "\033[31m";
inline const char* green = "\033[32m";
inline const char* yellow = "\033[33m";
inline const char* cyan = "\033[36m";
} // namespace colors

} // namespace elmtest

#endif // ELMTEST_COMMON_HPP
