#include "util/cli_parser.hpp"

#include <cerrno>
#include <cstdlib>

namespace billwire {

bool parse_long(const std::string& s, long& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno == ERANGE || end == s.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

// "-1" style negative numbers are values, not options.
static bool looks_like_option(const char* arg) {
    if (arg[0] != '-' || arg[1] == '\0') return false;
    long ignored;
    return !parse_long(arg, ignored);
}

// Bare words that are not an option's value carry no meaning and are skipped.
CliParser::CliParser(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if (!looks_like_option(argv[i])) continue;
        std::string arg = argv[i];

        // --key=value
        if (arg.size() >= 3 && arg[1] == '-') {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                opts_[arg.substr(0, eq)] = arg.substr(eq + 1);
                continue;
            }
        }

        if (i + 1 < argc && !looks_like_option(argv[i + 1])) {
            opts_[arg] = argv[i + 1];
            i++;
        } else {
            opts_[arg] = "1";
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                  const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return default_val;
}

bool CliParser::get_int_in_range(const std::string& key, long min_val, long max_val,
                                 long& out) const {
    auto it = opts_.find(key);
    if (it == opts_.end()) return false;
    long v;
    if (!parse_long(it->second, v)) return false;
    if (v < min_val || v > max_val) return false;
    out = v;
    return true;
}

} // namespace billwire
