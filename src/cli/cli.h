#pragma once

#include <string>

// ANSI color codes for terminal output
namespace colors {
    constexpr const char* RESET   = "\033[0m";
    constexpr const char* BOLD    = "\033[1m";
    constexpr const char* DIM     = "\033[2m";

    constexpr const char* RED     = "\033[31m";
    constexpr const char* GREEN   = "\033[32m";
    constexpr const char* YELLOW  = "\033[33m";
    constexpr const char* BLUE    = "\033[34m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN    = "\033[36m";
    constexpr const char* WHITE   = "\033[37m";

    // Brand color (purple)
    constexpr const char* BRAND   = "\033[38;5;141m";
}

// Options collected from the command line
struct CliOptions {
    std::string input_file;
    std::string output_file;       // empty: derived from the input name
    bool to_stdout = false;
    bool debug = false;
    bool strict = false;
    bool collect_errors = false;
    bool dump_tokens = false;
    bool verbose = false;
    bool use_tabs = false;
    int indent_width = 2;
    std::string module_format = "esm";
    std::string lexer_mode = "strict";
    std::string runtime_module;
};

// Parse argv into options
// Returns 0 on success, 1 on a usage error, 2 when the caller should exit cleanly (help/version)
int parse_cli_args(int argc, char** argv, CliOptions& options);

// Compile one file according to the options
// Returns 0 on success, non-zero on error
int compile_file(const CliOptions& options);

// Print help message
void print_help(const char* program_name);

// Print version
void print_version();
