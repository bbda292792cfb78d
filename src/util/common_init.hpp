#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <string>
#include <thread>
#include <vector>

// HHRKIT_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace hhrkit {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, HHRKIT_VERSION);
        return true;
    }
    return false;
}

// Logger tagged with the command name; -v / --verbose enables debug.
inline Logger make_logger(const CliParser& cli, const char* cmd_name) {
    bool verbose = cli.has("-v") || cli.has("--verbose");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo, cmd_name);
}

// Report options the command does not accept. Returns false if any.
inline bool check_known_options(const CliParser& cli,
                                const std::vector<std::string>& known,
                                const Logger& logger) {
    auto unknown = cli.unknown_keys(known);
    for (const auto& key : unknown) {
        logger.error("unknown option '%s'", key.c_str());
    }
    return unknown.empty();
}

// Standard input can back at most one input path ("-"). Returns false
// and logs an error if it is given more than once.
inline bool check_single_stdin(const std::vector<std::string>& inputs,
                               const Logger& logger) {
    size_t n = 0;
    for (const auto& path : inputs) {
        if (path == "-") n++;
    }
    if (n > 1) {
        logger.error("standard input ('-') given %zu times; it can be read only once", n);
        return false;
    }
    return true;
}

// Resolve thread count from CLI (0 or negative → hardware_concurrency).
inline int resolve_threads(const CliParser& cli,
                           const std::string& key = "-threads") {
    int n = cli.get_int(key, 0);
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

} // namespace hhrkit
