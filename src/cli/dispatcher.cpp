//! # CLI Command Dispatcher
//!
//! Entry point for the elmtest CLI. Initializes logging from the global
//! flags, then routes to the command handler.
//!
//! ```text
//! elmtest_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   └─ check          → run_check()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                        |
//! |------|------------------------------------------------|
//! | 0    | Success                                        |
//! | 1    | Usage error, or a module could not be checked  |

#include "cli/driver.hpp"

#include "cmd_check.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

using namespace elmtest::cli;

int elmtest_main(int argc, char* argv[]) {
    elmtest::log::Logger::init(elmtest::log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "check") {
        int code = run_check(argc, argv);
        elmtest::log::Logger::instance().flush();
        return code;
    }

    std::cerr << "error: unknown command '" << command << "'\n\n";
    print_usage();
    return 1;
}
