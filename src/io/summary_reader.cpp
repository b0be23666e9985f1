#include "io/summary_reader.hpp"

#include <fstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

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

static const std::string& field_str(
    const std::vector<std::string>& fields,
    const std::unordered_map<std::string, size_t>& cmap,
    const std::string& name) {
    static const std::string empty;
    auto it = cmap.find(name);
    if (it == cmap.end() || it->second >= fields.size()) return empty;
    return fields[it->second];
}

static uint64_t field_u64(
    const std::vector<std::string>& fields,
    const std::unordered_map<std::string, size_t>& cmap,
    const std::string& name) {
    const std::string& s = field_str(fields, cmap, name);
    if (s.empty()) return 0;
    return std::stoull(s);
}

static std::string field_text(
    const std::vector<std::string>& fields,
    const std::unordered_map<std::string, size_t>& cmap,
    const std::string& name) {
    const std::string& s = field_str(fields, cmap, name);
    return s == "-" ? std::string() : s;
}

static bool parse_error_kind(const std::string& s, ErrorKind& out) {
    static const ErrorKind kinds[] = {
        ErrorKind::kConfig, ErrorKind::kValidationRejection, ErrorKind::kEngine,
        ErrorKind::kUnsupportedOption, ErrorKind::kCancelled,
    };
    if (s.empty() || s == "-") {
        out = ErrorKind::kNone;
        return true;
    }
    for (ErrorKind k : kinds) {
        if (s == error_kind_name(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

static QualityMetrics read_metrics(const std::vector<std::string>& fields,
                                   const std::unordered_map<std::string, size_t>& cmap) {
    QualityMetrics m;
    m.genome_size = field_u64(fields, cmap, "genome_size");
    m.nb_contigs = static_cast<uint32_t>(field_u64(fields, cmap, "nb_contigs"));
    m.l90 = static_cast<uint32_t>(field_u64(fields, cmap, "l90"));
    return m;
}

bool read_summary_tab(std::istream& in, RunSummary& summary, std::string& error_msg) {
    summary = RunSummary{};
    std::unordered_map<std::string, size_t> cmap;
    std::string line;
    size_t line_no = 0;
    uint32_t rejected_index = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        if (line.rfind("# ", 0) == 0) {
            auto cols = split_tabs(line.substr(2));
            if (cols[0] == "run_status" && cols.size() >= 2) {
                if (cols[1] == "done") {
                    summary.status = RunStatus::kDone;
                } else if (cols[1] == "cancelled") {
                    summary.status = RunStatus::kCancelled;
                } else {
                    error_msg = "line " + std::to_string(line_no) +
                                ": unknown run status '" + cols[1] + "'";
                    return false;
                }
            } else if (cols[0] == "name") {
                cmap.clear();
                for (size_t i = 0; i < cols.size(); i++) cmap[cols[i]] = i;
            }
            continue;
        }
        if (cmap.empty()) {
            error_msg = "line " + std::to_string(line_no) + ": row before column header";
            return false;
        }

        auto fields = split_tabs(line);
        const std::string& status = field_str(fields, cmap, "status");
        try {
            if (status == "rejected") {
                RejectedGenome g;
                g.identifier = field_str(fields, cmap, "identifier");
                if (!parse_reject_reason(field_str(fields, cmap, "reason"), g.reason)) {
                    error_msg = "line " + std::to_string(line_no) + ": unknown reject reason";
                    return false;
                }
                g.metrics = read_metrics(fields, cmap);
                g.detail = field_text(fields, cmap, "detail");
                g.list_index = rejected_index++;
                summary.rejected.push_back(std::move(g));
                continue;
            }

            AnnotationResult r;
            r.name = field_str(fields, cmap, "name");
            r.identifier = field_str(fields, cmap, "identifier");
            if (r.name.empty() || r.name == "-" ||
                !parse_backend_name(field_str(fields, cmap, "backend"), r.backend) ||
                !parse_annotation_status(status, r.status) ||
                !parse_error_kind(field_str(fields, cmap, "reason"), r.error)) {
                error_msg = "line " + std::to_string(line_no) + ": malformed row";
                return false;
            }
            r.metrics = read_metrics(fields, cmap);
            r.gene_count = static_cast<uint32_t>(field_u64(fields, cmap, "genes"));
            r.reused = field_str(fields, cmap, "reused") == "1";
            r.reason = field_text(fields, cmap, "detail");
            std::string key = r.name;
            summary.results.emplace(std::move(key), std::move(r));
        } catch (const std::exception&) {
            error_msg = "line " + std::to_string(line_no) + ": invalid number";
            return false;
        }
    }
    return true;
}

bool read_summary_tab(const std::string& path, RunSummary& summary,
                      std::string& error_msg) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error_msg = "cannot open " + path;
        return false;
    }
    return read_summary_tab(in, summary, error_msg);
}

} // namespace panannot
