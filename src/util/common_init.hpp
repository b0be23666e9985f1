#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <thread>

// PANANNOT_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace panannot {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, PANANNOT_VERSION);
        return true;
    }
    return false;
}

// Create a Logger from -v / --verbose and -q / --quiet flags.
inline Logger make_logger(const CliParser& cli) {
    bool verbose = cli.has("-v") || cli.has("--verbose");
    bool quiet = cli.has("-q") || cli.has("--quiet");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo, quiet);
}

// Resolve a requested thread count (0 or negative → hardware_concurrency).
inline int resolve_threads(int requested) {
    int n = requested;
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

} // namespace panannot
