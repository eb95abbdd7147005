//! # Module Header Scanner Implementation

#include "scan/header_scanner.hpp"

#include "scan/comment_stripper.hpp"

#include <array>

namespace elmtest::scan {

namespace {

constexpr std::string_view EXPOSING = "exposing";
constexpr std::string_view WILDCARD_TOKEN = "..";
constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

constexpr std::array<std::string_view, 3> MODULE_PREFIXES = {"module", "port module",
                                                              "effect module"};

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

/// Any byte of a multi-byte UTF-8 sequence.
auto is_non_ascii(char c) -> bool {
    return static_cast<unsigned char>(c) >= 0x80;
}

// Non-ASCII leading bytes are taken as lowercase letters; Elm source is
// UTF-8 and only ASCII capitals are distinguished here.
auto is_lower(char c) -> bool {
    return (c >= 'a' && c <= 'z') || is_non_ascii(c);
}

auto is_ident_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
           is_non_ascii(c);
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && is_space(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))
        s.remove_suffix(1);
    return s;
}

/// Finds `keyword` as a whole word; dotted module names count as words.
auto find_keyword(std::string_view text, std::string_view keyword) -> size_t {
    size_t pos = text.find(keyword);
    while (pos != std::string_view::npos) {
        size_t end = pos + keyword.size();
        bool starts_word = pos == 0 || !(is_ident_char(text[pos - 1]) || text[pos - 1] == '.');
        bool ends_word = end == text.size() || !(is_ident_char(text[end]) || text[end] == '.');
        if (starts_word && ends_word) {
            return pos;
        }
        pos = text.find(keyword, pos + 1);
    }
    return std::string_view::npos;
}

void append_name_text(std::string& name, std::string_view text) {
    text = trim(text);
    if (text.empty())
        return;
    if (!name.empty())
        name.push_back(' ');
    name.append(text);
}

} // namespace

// ============================================================================
// Helpers
// ============================================================================

auto match_module_prefix(std::string_view line) -> std::optional<size_t> {
    for (auto prefix : MODULE_PREFIXES) {
        if (!line.starts_with(prefix))
            continue;
        if (line.size() == prefix.size() || is_space(line[prefix.size()])) {
            return prefix.size();
        }
    }
    return std::nullopt;
}

auto is_value_identifier(std::string_view name) -> bool {
    if (name.empty() || !is_lower(name.front()))
        return false;
    for (char c : name) {
        if (!is_ident_char(c))
            return false;
    }
    return true;
}

auto parse_exposed_names(std::string_view clause) -> ExposureSet {
    if (trim(clause) == WILDCARD_TOKEN) {
        return Wildcard{};
    }

    // Split on commas outside parentheses so `Msg(A, B)` stays one item.
    // Types, constructors (`Msg(..)`) and operators fail is_value_identifier().
    Enumerated exposed;
    int depth = 0;
    size_t item_start = 0;
    for (size_t i = 0; i <= clause.size(); ++i) {
        if (i < clause.size()) {
            char c = clause[i];
            if (c == '(') {
                ++depth;
            } else if (c == ')') {
                --depth;
            }
            if (c != ',' || depth != 0)
                continue;
        }
        auto item = trim(clause.substr(item_start, i - item_start));
        if (is_value_identifier(item)) {
            exposed.names.emplace(item);
        }
        item_start = i + 1;
    }
    return exposed;
}

// ============================================================================
// State Transitions
// ============================================================================

auto step(ScanState state, std::string_view cleaned_line) -> Step {
    std::string_view rest = cleaned_line;

    while (true) {
        if (std::holds_alternative<AwaitingModuleKeyword>(state)) {
            if (rest.starts_with(UTF8_BOM)) {
                rest.remove_prefix(UTF8_BOM.size());
            }
            rest = trim(rest);
            if (rest.empty()) {
                return {std::move(state), std::nullopt};
            }
            auto prefix_len = match_module_prefix(rest);
            if (!prefix_len) {
                return {std::move(state), HeaderOutcome(HeaderError::MissingModuleDeclaration)};
            }
            rest.remove_prefix(*prefix_len);
            state = ReadingModuleName{};
            continue;
        }

        if (auto* reading = std::get_if<ReadingModuleName>(&state)) {
            size_t keyword = find_keyword(rest, EXPOSING);
            if (keyword == std::string_view::npos) {
                append_name_text(reading->name, rest);
                return {std::move(state), std::nullopt};
            }
            append_name_text(reading->name, rest.substr(0, keyword));
            rest.remove_prefix(keyword + EXPOSING.size());
            std::string name = std::move(reading->name);
            state = AwaitingOpenBracket{std::move(name)};
            continue;
        }

        if (auto* awaiting = std::get_if<AwaitingOpenBracket>(&state)) {
            size_t paren = rest.find('(');
            if (paren == std::string_view::npos) {
                return {std::move(state), std::nullopt};
            }
            rest.remove_prefix(paren + 1);
            std::string name = std::move(awaiting->module_name);
            state = AccumulatingExposedNames{std::move(name), std::string(), 1};
            continue;
        }

        auto& accumulating = std::get<AccumulatingExposedNames>(state);
        if (!accumulating.buffer.empty()) {
            accumulating.buffer.push_back(' ');
        }
        for (char c : rest) {
            if (c == '(') {
                ++accumulating.depth;
            } else if (c == ')' && --accumulating.depth == 0) {
                ExposureSet exposure = parse_exposed_names(accumulating.buffer);
                return {std::move(state), HeaderOutcome(std::move(exposure))};
            }
            accumulating.buffer.push_back(c);
        }
        return {std::move(state), std::nullopt};
    }
}

// ============================================================================
// HeaderScanner
// ============================================================================

auto HeaderScanner::feed(std::string_view cleaned_line) -> std::optional<HeaderOutcome> {
    if (outcome_) {
        return outcome_;
    }
    Step next = step(std::move(state_), cleaned_line);
    state_ = std::move(next.state);
    outcome_ = std::move(next.outcome);
    return outcome_;
}

auto HeaderScanner::finish() const -> HeaderOutcome {
    if (outcome_) {
        return *outcome_;
    }
    return HeaderError::IncompleteHeader;
}

auto HeaderScanner::declared_module_name() const -> std::string {
    std::string_view name;
    if (auto* awaiting = std::get_if<AwaitingOpenBracket>(&state_)) {
        name = awaiting->module_name;
    } else if (auto* accumulating = std::get_if<AccumulatingExposedNames>(&state_)) {
        name = accumulating->module_name;
    }
    // `effect module Task where { ... }` names the module `Task`
    size_t end = 0;
    while (end < name.size() && !is_space(name[end]))
        ++end;
    return std::string(name.substr(0, end));
}

auto scan_header(const std::vector<std::string>& raw_lines) -> HeaderOutcome {
    HeaderScanner scanner;
    bool in_block_comment = false;
    for (const auto& raw : raw_lines) {
        auto stripped = strip_comments(raw, in_block_comment);
        in_block_comment = stripped.in_block_comment;
        if (auto outcome = scanner.feed(stripped.line)) {
            return *outcome;
        }
    }
    return scanner.finish();
}

} // namespace elmtest::scan
