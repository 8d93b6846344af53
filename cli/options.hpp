#pragma once

// ============================================================
// options.hpp -- msync command line
// ============================================================

#include "../sync/copy_primitive.hpp"
#include <string>
#include <iosfwd>

static constexpr int DEFAULT_WORKER_MULTIPLIER = 2;
static constexpr int MAX_WORKER_MULTIPLIER     = 64;

struct AppOptions {
    std::string destinations;     // comma-separated host list
    std::string path;             // source path
    bool        verbose{false};
    int         multiplier{DEFAULT_WORKER_MULTIPLIER}; // workers per hardware thread
    int         timeout_secs{0};  // per copy, 0 = none
    std::string source_host;      // empty: local hostname
    std::string log_file;
    Toolchain   tools;
};

enum class ParseResult {
    OK,
    HELP,
    ERROR,
};

// Fills out from argv[1..argc). On ERROR, error holds a one-line reason.
ParseResult parse_options(int argc, const char* const argv[],
                          AppOptions& out, std::string& error);

void print_usage(std::ostream& os, const char* prog);
