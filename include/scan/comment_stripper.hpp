//! # Comment Stripper
//!
//! Removes Elm comment text from one source line at a time. Line comments
//! start with `--` and run to the end of the line; block comments are
//! delimited by `{-` and `-}` and may span many lines, so the caller threads
//! the "inside block comment" flag from one line to the next.
//!
//! ## Example
//!
//! ```cpp
//! bool in_block = false;
//! for (const auto& raw : lines) {
//!     auto stripped = strip_comments(raw, in_block);
//!     in_block = stripped.in_block_comment;
//!     consume(stripped.line);
//! }
//! ```
//!
//! ## Nesting
//!
//! Block comments do not nest: the first `-}` ends the comment no matter how
//! many `{-` markers preceded it.

#ifndef ELMTEST_SCAN_COMMENT_STRIPPER_HPP
#define ELMTEST_SCAN_COMMENT_STRIPPER_HPP

#include <string>
#include <string_view>

namespace elmtest::scan {

constexpr std::string_view LINE_COMMENT = "--";
constexpr std::string_view BLOCK_OPEN = "{-";
constexpr std::string_view BLOCK_CLOSE = "-}";

/// A line with its comment text removed.
struct StrippedLine {
    std::string line;      ///< Remaining non-comment text.
    bool in_block_comment; ///< True if a block comment is still open at end of line.
};

/// Removes comment text from `line`.
///
/// `in_block_comment` says whether the line starts inside a block comment.
/// The input is never modified; the result owns a fresh copy of the
/// surviving text.
[[nodiscard]] auto strip_comments(std::string_view line, bool in_block_comment) -> StrippedLine;

} // namespace elmtest::scan

#endif // ELMTEST_SCAN_COMMENT_STRIPPER_HPP
