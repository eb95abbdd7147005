//! # Comment Stripper Implementation
//!
//! Walks the line with a cursor and copies only the text outside comments.
//!
//! ```text
//! outside:  "--" before any "{-"  -> drop rest of line, done
//!           "{-" ... "-}"         -> drop both markers and what's between, go on
//!           "{-" without "-}"     -> drop rest of line, still inside
//!           no open marker        -> keep rest of line, done
//! inside:   "-}"                  -> drop through marker, now outside, go on
//!           no close marker       -> drop rest of line, still inside
//! ```

#include "scan/comment_stripper.hpp"

namespace elmtest::scan {

auto strip_comments(std::string_view line, bool in_block_comment) -> StrippedLine {
    StrippedLine result{std::string(), in_block_comment};
    result.line.reserve(line.size());

    std::string_view rest = line;
    while (true) {
        if (result.in_block_comment) {
            size_t close = rest.find(BLOCK_CLOSE);
            if (close == std::string_view::npos) {
                return result;
            }
            rest.remove_prefix(close + BLOCK_CLOSE.size());
            result.in_block_comment = false;
            continue;
        }

        size_t open = rest.find(BLOCK_OPEN);
        size_t dash = rest.find(LINE_COMMENT);

        // A line comment only counts if no block comment opened before it.
        if (dash != std::string_view::npos && (open == std::string_view::npos || dash < open)) {
            result.line.append(rest.substr(0, dash));
            return result;
        }

        if (open == std::string_view::npos) {
            // A stray "-}" outside a comment is ordinary text.
            result.line.append(rest);
            return result;
        }

        result.line.append(rest.substr(0, open));
        size_t close = rest.find(BLOCK_CLOSE, open + BLOCK_OPEN.size());
        if (close == std::string_view::npos) {
            result.in_block_comment = true;
            return result;
        }
        rest.remove_prefix(close + BLOCK_CLOSE.size());
    }
}

} // namespace elmtest::scan
