#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace panannot {

struct FastaRecord {
    std::string id;       // sequence ID (first word after '>')
    std::string sequence; // concatenated sequence lines (uppercase)
};

// Read all records from an input stream.
std::vector<FastaRecord> read_fasta_stream(std::istream& in);

// Read all records from a FASTA file, appending to out.
// Returns false (and sets error_msg) if the file cannot be opened.
// A readable file without records is not an error.
bool read_fasta(const std::string& path, std::vector<FastaRecord>& out,
                std::string& error_msg);

// Split a contig at every run of at least cut_n 'N'. The runs are dropped,
// as are empty pieces. cut_n <= 0 returns the sequence unchanged.
std::vector<std::string> split_at_n_runs(const std::string& seq, int cut_n);

// Write one record, wrapping the sequence at line_width columns.
void write_fasta_record(std::ostream& out, const std::string& header,
                        const std::string& sequence, size_t line_width = 60);

} // namespace panannot
