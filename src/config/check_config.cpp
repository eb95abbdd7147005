//! # Check Configuration Loading
//!
//! Line-based reader for the `[check]` section of `elmtest.toml`. Supports
//! the subset of TOML the section needs: `key = value` pairs with strings,
//! integers, booleans and single-line string arrays, plus `#` comments.

#include "config/check_config.hpp"

#include "log/log.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace elmtest::config {

namespace {

auto trim(std::string_view s) -> std::string_view {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string_view::npos)
        return {};
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

/// Drops a trailing `# comment` that is not inside a string.
auto strip_toml_comment(std::string_view line) -> std::string_view {
    bool in_string = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            in_string = !in_string;
        } else if (line[i] == '#' && !in_string) {
            return line.substr(0, i);
        }
    }
    return line;
}

auto unquote(std::string_view value) -> std::string {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return std::string(value.substr(1, value.size() - 2));
    }
    return std::string(value);
}

auto parse_bool(std::string_view key, std::string_view value, bool fallback) -> bool {
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    ELMTEST_LOG_WARN("config", "Expected true or false for '" << key << "', got '" << value
                                                               << "'");
    return fallback;
}

auto parse_string_array(std::string_view value, std::vector<std::string>& out) -> bool {
    if (value.size() < 2 || value.front() != '[' || value.back() != ']')
        return false;

    std::vector<std::string> items;
    std::string_view body = value.substr(1, value.size() - 2);
    size_t pos = 0;
    while (pos <= body.size()) {
        size_t comma = body.find(',', pos);
        if (comma == std::string_view::npos)
            comma = body.size();
        auto item = trim(body.substr(pos, comma - pos));
        if (!item.empty()) {
            if (item.size() < 2 || item.front() != '"' || item.back() != '"')
                return false;
            items.push_back(unquote(item));
        }
        pos = comma + 1;
    }

    out = std::move(items);
    return true;
}

} // namespace

CheckConfig parse_check_config(std::string_view content) {
    CheckConfig config;
    bool in_check_section = false;
    int line_no = 0;

    std::istringstream input{std::string(content)};
    std::string raw;
    while (std::getline(input, raw)) {
        ++line_no;
        auto line = trim(strip_toml_comment(raw));
        if (line.empty())
            continue;

        if (line.front() == '[') {
            in_check_section = (line == "[check]");
            continue;
        }
        if (!in_check_section)
            continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos) {
            ELMTEST_LOG_WARN("config", CONFIG_FILE_NAME << ":" << line_no
                                                        << ": expected 'key = value'");
            continue;
        }

        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (key == "test-directories") {
            if (!parse_string_array(value, config.test_directories)) {
                ELMTEST_LOG_WARN("config", CONFIG_FILE_NAME << ":" << line_no
                                                            << ": test-directories must be an "
                                                               "array of strings");
            }
        } else if (key == "jobs") {
            unsigned jobs = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), jobs);
            if (ec != std::errc() || ptr != value.data() + value.size()) {
                ELMTEST_LOG_WARN("config", CONFIG_FILE_NAME << ":" << line_no
                                                            << ": invalid jobs value '" << value
                                                            << "'");
            } else {
                config.jobs = jobs;
            }
        } else if (key == "strict") {
            config.strict = parse_bool(key, value, config.strict);
        } else if (key == "color") {
            config.color = parse_bool(key, value, config.color);
        } else {
            ELMTEST_LOG_WARN("config", CONFIG_FILE_NAME << ":" << line_no << ": unknown key '"
                                                        << key << "'");
        }
    }

    return config;
}

CheckConfig load_check_config_file(const fs::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        ELMTEST_LOG_WARN("config", "Cannot open " << config_path.string() << ", using defaults");
        return CheckConfig{};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    ELMTEST_LOG_DEBUG("config", "Loaded " << config_path.string());
    return parse_check_config(buffer.str());
}

CheckConfig load_check_config(const fs::path& project_root) {
    fs::path config_path = project_root / CONFIG_FILE_NAME;
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        return CheckConfig{};
    }
    return load_check_config_file(config_path);
}

} // namespace elmtest::config
