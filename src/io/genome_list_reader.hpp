#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace panannot {

// One genome line of a list file:
//   genome.fna [more.fna ...] [:: PREFIX[.DATE] | :: .DATE]
struct GenomeListEntry {
    std::vector<std::string> files;
    std::string prefix_override;   // "" = run default
    std::string date_override;     // "" = run default
    uint32_t line_number = 0;      // 1-based line in the list file
};

// Parse a single list line. Returns false for blank and comment lines.
bool parse_genome_list_line(const std::string& line, GenomeListEntry& out);

// Read a genome list file.
// Blank lines and lines starting with '#' are skipped, trailing '\r' removed.
// Returns false (and sets error_msg) if the file cannot be opened or a
// prefix/date override is not a valid name part.
bool read_genome_list(const std::string& path,
                      std::vector<GenomeListEntry>& out,
                      std::string& error_msg);

} // namespace panannot
