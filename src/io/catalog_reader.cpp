#include "io/catalog_reader.hpp"
#include "protocol/response_codec.hpp"
#include "util/cli_parser.hpp"
#include "core/config.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <unordered_map>
#include <utility>

namespace billwire {

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        end--;
    return s.substr(start, end - start);
}

static bool is_header_line(const std::string& line) {
    std::string lower;
    for (size_t i = 0; i < line.size() && i < 4; i++) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(line[i])));
    }
    return lower.compare(0, 2, "ci") == 0 || lower.compare(0, 4, "code") == 0;
}

static std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

static std::string strip_dollar(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '$') out += c;
    }
    return trim(out);
}

Catalog read_catalog(std::istream& in, const std::string& source, const Logger& logger) {
    std::unordered_map<uint16_t, CatalogEntry> entries;

    std::string line;
    size_t line_num = 0;
    while (std::getline(in, line)) {
        line_num++;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line_num == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
            line.erase(0, 3);

        line = trim(line);
        if (line.empty()) continue;
        if (is_header_line(line)) continue;

        auto first = line.find(',');
        auto last = line.rfind(',');
        if (first == std::string::npos || first == last) {
            logger.warn("%s:%zu: skipping malformed line: %s",
                        source.c_str(), line_num, line.c_str());
            continue;
        }

        std::string code_str = trim(line.substr(0, first));
        std::string desc = strip_quotes(trim(line.substr(first + 1, last - first - 1)));
        std::string cost_str = strip_dollar(line.substr(last + 1));

        long code, cost;
        if (!parse_long(code_str, code) || !parse_long(cost_str, cost)) {
            logger.warn("%s:%zu: skipping line with non-numeric code or cost: %s",
                        source.c_str(), line_num, line.c_str());
            continue;
        }

        if (code < 0 || code > MAX_FIELD_VALUE) {
            logger.debug("%s:%zu: code %ld out of range, skipped",
                         source.c_str(), line_num, code);
            continue;
        }
        if (cost < 0 || cost > MAX_FIELD_VALUE) {
            logger.debug("%s:%zu: cost %ld out of range, priced as 0",
                         source.c_str(), line_num, cost);
            cost = 0;
        }

        CatalogEntry entry;
        entry.description = truncate_description(desc);
        entry.unit_cost = static_cast<uint16_t>(cost);
        entries[static_cast<uint16_t>(code)] = std::move(entry);
    }

    return Catalog(std::move(entries));
}

Catalog read_catalog(const std::string& path, const Logger& logger) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logger.warn("Could not load catalog file '%s'", path.c_str());
        logger.warn("Every code will be priced as '%s'", ARTICLE_NOT_AVAILABLE);
        return Catalog();
    }
    return read_catalog(file, path, logger);
}

} // namespace billwire
