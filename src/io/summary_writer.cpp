#include "io/summary_writer.hpp"

#include <fstream>

namespace panannot {

std::string summary_path(const std::string& results_dir, const std::string& list_name) {
    return results_dir + "/annotate-summary-" + list_name + ".tsv";
}

std::string lstinfo_path(const std::string& results_dir, const std::string& list_name) {
    return results_dir + "/LSTINFO-" + list_name + ".lst";
}

std::string discarded_path(const std::string& results_dir, const std::string& list_name) {
    return results_dir + "/discarded-" + list_name + ".lst";
}

// Free text goes in the last column; keep it on one line.
static std::string clean_field(const std::string& s) {
    if (s.empty()) return "-";
    std::string out = s;
    for (auto& c : out) {
        if (c == '\t' || c == '\n' || c == '\r') c = ' ';
    }
    return out;
}

static void write_metrics(std::ostream& out, const QualityMetrics& m) {
    out << m.genome_size << '\t' << m.nb_contigs << '\t' << m.l90;
}

void write_summary_tab(std::ostream& out, const RunSummary& summary) {
    out << "# run_status\t" << run_status_name(summary.status) << '\n';
    out << "# name\tidentifier\tbackend\tstatus\treason\tgenome_size\tnb_contigs"
           "\tl90\tgenes\twarnings\treused\tdetail\n";

    for (const auto& [name, r] : summary.results) {
        out << r.name << '\t'
            << r.identifier << '\t'
            << backend_name(r.backend) << '\t'
            << annotation_status_name(r.status) << '\t'
            << (r.error == ErrorKind::kNone ? "-" : error_kind_name(r.error)) << '\t';
        write_metrics(out, r.metrics);
        out << '\t' << r.gene_count << '\t'
            << r.warnings.size() << '\t'
            << (r.reused ? 1 : 0) << '\t'
            << clean_field(r.reason) << '\n';
    }

    for (const auto& g : summary.rejected) {
        out << "-\t"
            << g.identifier << "\t-\trejected\t"
            << reject_reason_name(g.reason) << '\t';
        write_metrics(out, g.metrics);
        out << "\t0\t0\t0\t" << clean_field(g.detail) << '\n';
    }
}

void write_lstinfo(std::ostream& out, const RunSummary& summary) {
    out << "# name\toriginal_name\tgenome_size\tnb_contigs\tL90\n";
    for (const auto& [name, r] : summary.results) {
        if (r.status != AnnotationStatus::kOk && r.status != AnnotationStatus::kSkipped)
            continue;
        out << r.name << '\t' << r.identifier << '\t';
        write_metrics(out, r.metrics);
        out << '\n';
    }
}

void write_discarded(std::ostream& out, const RunSummary& summary) {
    out << "# original_name\tgenome_size\tnb_contigs\tL90\treason\n";
    for (const auto& g : summary.rejected) {
        out << g.identifier << '\t';
        write_metrics(out, g.metrics);
        out << '\t' << reject_reason_name(g.reason) << '\n';
    }
}

static bool write_one(const std::string& path, const RunSummary& summary,
                      void (*writer)(std::ostream&, const RunSummary&),
                      std::string& error_msg) {
    std::ofstream out(path);
    if (!out.is_open()) {
        error_msg = "cannot open " + path + " for writing";
        return false;
    }
    writer(out, summary);
    out.close();
    if (!out) {
        error_msg = "write error on " + path;
        return false;
    }
    return true;
}

bool write_run_summary(const std::string& results_dir, const std::string& list_name,
                       const RunSummary& summary, std::string& error_msg) {
    return write_one(summary_path(results_dir, list_name), summary,
                     write_summary_tab, error_msg) &&
           write_one(lstinfo_path(results_dir, list_name), summary,
                     write_lstinfo, error_msg) &&
           write_one(discarded_path(results_dir, list_name), summary,
                     write_discarded, error_msg);
}

} // namespace panannot
