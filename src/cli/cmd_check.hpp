#pragma once

namespace elmtest::cli {

// Check that every discovered test is exposed by its module
// Returns 0 on success, 1 if any module failed (or, with --strict, has unexposed tests)
int run_check(int argc, char* argv[]);

} // namespace elmtest::cli
