//! # Check Configuration
//!
//! Settings for `elmtest check`, loaded from `elmtest.toml` in the project
//! root. Command-line flags override anything read here.
//!
//! ```toml
//! [check]
//! test-directories = ["tests", "integration"]
//! jobs = 4
//! strict = false
//! color = true
//! ```

#ifndef ELMTEST_CONFIG_CHECK_CONFIG_HPP
#define ELMTEST_CONFIG_CHECK_CONFIG_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace elmtest::config {

namespace fs = std::filesystem;

/// Name of the manifest looked up in the project root.
constexpr const char* CONFIG_FILE_NAME = "elmtest.toml";

struct CheckConfig {
    std::vector<std::string> test_directories = {"tests"};
    unsigned jobs = 0;   ///< Worker threads, 0 = hardware concurrency
    bool strict = false; ///< Report unexposed tests as errors
    bool color = true;
};

/// Loads `elmtest.toml` from `project_root`; defaults if it does not exist.
CheckConfig load_check_config(const fs::path& project_root);

/// Loads the given manifest file; defaults if it cannot be opened.
CheckConfig load_check_config_file(const fs::path& config_path);

/// Parses manifest text. Unknown keys and malformed values are logged and
/// leave the defaults in place.
CheckConfig parse_check_config(std::string_view content);

} // namespace elmtest::config

#endif // ELMTEST_CONFIG_CHECK_CONFIG_HPP
