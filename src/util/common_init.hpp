#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>

// BILLWIRE_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace billwire {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, BILLWIRE_VERSION);
        return true;
    }
    return false;
}

// Resolve the log level from -log_level <name>, then -v / --verbose.
// Returns false (after printing an error) for an unknown level name.
inline bool make_logger(const CliParser& cli, Logger& logger) {
    Logger::Level level = Logger::kInfo;
    if (cli.has("-log_level")) {
        std::string name = cli.get_string("-log_level");
        if (!Logger::parse_level(name, level)) {
            std::fprintf(stderr, "Error: unknown -log_level '%s'\n", name.c_str());
            return false;
        }
    } else if (cli.has("-v") || cli.has("--verbose")) {
        level = Logger::kDebug;
    }
    logger.set_level(level);
    return true;
}

} // namespace billwire
