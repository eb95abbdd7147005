//! # CLI Driver Interface
//!
//! `elmtest_main()` dispatches to the command handler named by argv[1].

#pragma once

// Main driver entry point
// Dispatches to appropriate command handlers
int elmtest_main(int argc, char* argv[]);
