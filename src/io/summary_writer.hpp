#pragma once

#include <ostream>
#include <string>

#include "core/types.hpp"

namespace panannot {

// Files written next to the per-genome directories, named after the list
// file: annotate-summary-<list>.tsv, LSTINFO-<list>.lst,
// discarded-<list>.lst.
std::string summary_path(const std::string& results_dir, const std::string& list_name);
std::string lstinfo_path(const std::string& results_dir, const std::string& list_name);
std::string discarded_path(const std::string& results_dir, const std::string& list_name);

// Run summary: "# run_status" line, column header, then one row per
// accepted genome (name order) and one per rejected genome (list order).
void write_summary_tab(std::ostream& out, const RunSummary& summary);

// Accepted genomes usable downstream (status ok, or skipped in QC-only runs).
void write_lstinfo(std::ostream& out, const RunSummary& summary);

void write_discarded(std::ostream& out, const RunSummary& summary);

// Write the three files. Returns false (and sets error_msg) on I/O error.
bool write_run_summary(const std::string& results_dir, const std::string& list_name,
                       const RunSummary& summary, std::string& error_msg);

} // namespace panannot
