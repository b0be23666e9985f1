#include "io/genome_list_reader.hpp"

#include <cctype>
#include <fstream>

#include "core/config.hpp"
#include "core/types.hpp"

namespace panannot {

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        end--;
    return s.substr(start, end - start);
}

static std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
        size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) i++;
        if (i > start) tokens.push_back(s.substr(start, i - start));
    }
    return tokens;
}

bool parse_genome_list_line(const std::string& raw, GenomeListEntry& out) {
    std::string line = raw;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    line = trim(line);
    if (line.empty() || line[0] == '#') return false;

    out = GenomeListEntry{};

    std::string files_part = line;
    auto sep = line.find("::");
    if (sep != std::string::npos) {
        files_part = line.substr(0, sep);
        std::string info = trim(line.substr(sep + 2));
        auto dot = info.find('.');
        if (dot == std::string::npos) {
            out.prefix_override = info;
        } else {
            out.prefix_override = info.substr(0, dot);
            out.date_override = info.substr(dot + 1);
        }
    }

    out.files = split_whitespace(files_part);
    return !out.files.empty();
}

bool read_genome_list(const std::string& path,
                      std::vector<GenomeListEntry>& out,
                      std::string& error_msg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error_msg = "cannot open genome list " + path;
        return false;
    }

    std::string line;
    uint32_t line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        GenomeListEntry entry;
        if (!parse_genome_list_line(line, entry)) continue;
        entry.line_number = line_number;
        if (!entry.prefix_override.empty() && !is_valid_name_prefix(entry.prefix_override)) {
            error_msg = path + ":" + std::to_string(line_number) + ": prefix '" +
                        entry.prefix_override + "' must be " +
                        std::to_string(PREFIX_LENGTH) + " alphanumeric characters";
            return false;
        }
        if (!entry.date_override.empty() && !is_valid_name_date(entry.date_override)) {
            error_msg = path + ":" + std::to_string(line_number) + ": date '" +
                        entry.date_override + "' must be " +
                        std::to_string(DATE_LENGTH) + " characters without '.' or spaces";
            return false;
        }
        out.push_back(std::move(entry));
    }
    if (file.bad()) {
        error_msg = "read error on genome list " + path;
        return false;
    }
    return true;
}

} // namespace panannot
