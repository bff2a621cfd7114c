#include "billwireclient/console_input.hpp"
#include "core/config.hpp"
#include "util/cli_parser.hpp"

#include <string>

namespace billwire {

enum class FieldRead { kValue, kFinish, kRetry };

static FieldRead read_field(std::istream& in, std::ostream& out,
                            const char* prompt, const char* name,
                            bool allow_finish, uint16_t& value) {
    out << prompt << std::flush;

    std::string line;
    if (!std::getline(in, line)) return FieldRead::kFinish;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    // Tolerate surrounding blanks
    size_t start = line.find_first_not_of(" \t");
    size_t end = line.find_last_not_of(" \t");
    std::string text = start == std::string::npos
        ? std::string() : line.substr(start, end - start + 1);

    long v;
    if (!parse_long(text, v)) {
        out << name << " must be a number\n";
        return FieldRead::kRetry;
    }
    if (allow_finish && v == -1) return FieldRead::kFinish;
    if (v < 0 || v > MAX_FIELD_VALUE) {
        out << name << " must be in range 0.." << MAX_FIELD_VALUE << "\n";
        return FieldRead::kRetry;
    }
    value = static_cast<uint16_t>(v);
    return FieldRead::kValue;
}

std::vector<LineItem> collect_line_items(std::istream& in, std::ostream& out) {
    std::vector<LineItem> items;

    for (;;) {
        LineItem item;
        FieldRead r = read_field(in, out, "Enter quantity Qi (or -1 to finish): ",
                                 "Qi", true, item.quantity);
        if (r == FieldRead::kFinish) break;
        if (r == FieldRead::kRetry) continue;

        r = read_field(in, out, "Enter code Ci: ", "Ci", false, item.code);
        if (r == FieldRead::kFinish) break;
        if (r == FieldRead::kRetry) continue;

        items.push_back(item);
    }

    return items;
}

} // namespace billwire
