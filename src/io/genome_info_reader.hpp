#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace panannot {

// One genome of an info file: precomputed quality metrics, so the sequence
// is not analysed again.
struct GenomeInfoEntry {
    std::string identifier;     // sequence file, as written in the file
    QualityMetrics metrics;
    bool valid = true;          // false if a metric is missing, not a number,
                                // or L90 > contig count
    std::string error;
    uint32_t line_number = 0;
};

// Tab-separated file with a header line (optionally starting with "# ").
// Columns are found by name, other columns are ignored:
//   orig_name | original_name      sequence file
//   gsize | genome_size            total length
//   nb_conts | nb_contigs          contig count
//   L90 | l90
// LSTINFO files written by this program are accepted as is.
// Returns false if the file cannot be read or a required column is absent.
bool read_genome_info(std::istream& in, std::vector<GenomeInfoEntry>& out,
                      std::string& error_msg);

bool read_genome_info(const std::string& path, std::vector<GenomeInfoEntry>& out,
                      std::string& error_msg);

} // namespace panannot
