#pragma once

#include <string>
#include <unordered_map>

namespace billwire {

// Command-line parser for "-key value", "--key=value" and bare flags.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Get string value for a key. Returns default_val if not found.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Parse the value of key as an integer in [min_val, max_val].
    // Returns false if the key is missing, not an integer, or out of range.
    bool get_int_in_range(const std::string& key, long min_val, long max_val,
                          long& out) const;

private:
    std::unordered_map<std::string, std::string> opts_;
};

// Strict base-10 parse of the whole string. Returns false on empty input,
// trailing garbage, or overflow.
bool parse_long(const std::string& s, long& out);

} // namespace billwire
