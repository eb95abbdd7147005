//! # elmtest Entry Point
//!
//! Delegates to the CLI driver, which handles command parsing and
//! dispatch.
//!
//! ```bash
//! elmtest check                 # Check the configured test directories
//! elmtest check tests/Parser    # Check one directory
//! elmtest check --strict -j4    # Unexposed tests fail the run
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return elmtest_main(argc, argv);
}
