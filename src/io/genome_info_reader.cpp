#include "io/genome_info_reader.hpp"

#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <unordered_map>

namespace panannot {

static std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string::size_type start = 0;
    while (true) {
        auto pos = line.find('\t', start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

// Index of the first of the given column names present in the header.
static bool find_column(const std::unordered_map<std::string, size_t>& cmap,
                        std::initializer_list<const char*> names, size_t& out) {
    for (const char* n : names) {
        auto it = cmap.find(n);
        if (it != cmap.end()) {
            out = it->second;
            return true;
        }
    }
    return false;
}

static bool parse_count(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    char* end = nullptr;
    out = std::strtoull(s.c_str(), &end, 10);
    return *end == '\0';
}

bool read_genome_info(std::istream& in, std::vector<GenomeInfoEntry>& out,
                      std::string& error_msg) {
    std::unordered_map<std::string, size_t> cmap;
    size_t col_name = 0, col_size = 0, col_contigs = 0, col_l90 = 0;
    std::string line;
    uint32_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        if (cmap.empty()) {
            if (line.rfind("# ", 0) == 0) line = line.substr(2);
            auto cols = split_tabs(line);
            for (size_t i = 0; i < cols.size(); i++) cmap[cols[i]] = i;
            if (!find_column(cmap, {"orig_name", "original_name"}, col_name) ||
                !find_column(cmap, {"gsize", "genome_size"}, col_size) ||
                !find_column(cmap, {"nb_conts", "nb_contigs"}, col_contigs) ||
                !find_column(cmap, {"L90", "l90"}, col_l90)) {
                error_msg = "line " + std::to_string(line_no) +
                            ": header must name orig_name, gsize, nb_conts and L90 columns";
                return false;
            }
            continue;
        }
        if (line[0] == '#') continue;

        auto fields = split_tabs(line);
        GenomeInfoEntry entry;
        entry.line_number = line_no;
        if (col_name < fields.size()) entry.identifier = fields[col_name];
        if (entry.identifier.empty()) {
            error_msg = "line " + std::to_string(line_no) + ": no genome name";
            return false;
        }

        uint64_t size = 0, contigs = 0, l90 = 0;
        if (col_size >= fields.size() || !parse_count(fields[col_size], size) ||
            col_contigs >= fields.size() || !parse_count(fields[col_contigs], contigs) ||
            col_l90 >= fields.size() || !parse_count(fields[col_l90], l90) ||
            contigs > UINT32_MAX || l90 > UINT32_MAX) {
            entry.valid = false;
            entry.error = "invalid size, contig count or L90 at line " +
                          std::to_string(line_no);
        } else if (l90 > contigs) {
            entry.valid = false;
            entry.error = "L90 " + std::to_string(l90) + " greater than contig count " +
                          std::to_string(contigs) + " at line " + std::to_string(line_no);
        } else {
            entry.metrics.genome_size = size;
            entry.metrics.nb_contigs = static_cast<uint32_t>(contigs);
            entry.metrics.l90 = static_cast<uint32_t>(l90);
        }
        out.push_back(std::move(entry));
    }
    if (in.bad()) {
        error_msg = "read error";
        return false;
    }
    if (cmap.empty()) {
        error_msg = "no header line";
        return false;
    }
    return true;
}

bool read_genome_info(const std::string& path, std::vector<GenomeInfoEntry>& out,
                      std::string& error_msg) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error_msg = "cannot open genome info file " + path;
        return false;
    }
    if (!read_genome_info(in, out, error_msg)) {
        error_msg = path + ": " + error_msg;
        return false;
    }
    return true;
}

} // namespace panannot
