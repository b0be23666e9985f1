#include "io/fasta_reader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace panannot {

static void finish_record(std::vector<FastaRecord>& records,
                          std::string& cur_id, std::string& cur_seq,
                          bool have_header) {
    if (have_header) {
        // Convert sequence to uppercase
        for (auto& c : cur_seq)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        records.push_back({std::move(cur_id), std::move(cur_seq)});
    }
    cur_id.clear();
    cur_seq.clear();
}

std::vector<FastaRecord> read_fasta_stream(std::istream& in) {
    std::vector<FastaRecord> records;
    std::string line;
    std::string cur_id;
    std::string cur_seq;
    bool have_header = false;

    while (std::getline(in, line)) {
        // Remove trailing \r if present (Windows line endings)
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (line.empty())
            continue;

        if (line[0] == '>') {
            finish_record(records, cur_id, cur_seq, have_header);
            have_header = true;
            // Extract ID: first word after '>'
            size_t start = 1;
            while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start])))
                start++;
            size_t end = start;
            while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end])))
                end++;
            cur_id = line.substr(start, end - start);
        } else if (line[0] == ';') {
            // Comment line, skip
            continue;
        } else {
            // Sequence lines may carry stray blanks
            for (char c : line) {
                if (!std::isspace(static_cast<unsigned char>(c))) cur_seq += c;
            }
        }
    }

    finish_record(records, cur_id, cur_seq, have_header);
    return records;
}

bool read_fasta(const std::string& path, std::vector<FastaRecord>& out,
                std::string& error_msg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error_msg = "cannot open " + path;
        return false;
    }
    auto records = read_fasta_stream(file);
    if (file.bad()) {
        error_msg = "read error on " + path;
        return false;
    }
    for (auto& r : records) out.push_back(std::move(r));
    return true;
}

std::vector<std::string> split_at_n_runs(const std::string& seq, int cut_n) {
    std::vector<std::string> pieces;
    if (cut_n <= 0) {
        if (!seq.empty()) pieces.push_back(seq);
        return pieces;
    }

    size_t piece_start = 0;
    size_t i = 0;
    while (i < seq.size()) {
        if (seq[i] != 'N') {
            i++;
            continue;
        }
        size_t run_start = i;
        while (i < seq.size() && seq[i] == 'N') i++;
        if (i - run_start >= static_cast<size_t>(cut_n)) {
            if (run_start > piece_start)
                pieces.push_back(seq.substr(piece_start, run_start - piece_start));
            piece_start = i;
        }
    }
    if (piece_start < seq.size())
        pieces.push_back(seq.substr(piece_start));
    return pieces;
}

void write_fasta_record(std::ostream& out, const std::string& header,
                        const std::string& sequence, size_t line_width) {
    out << '>' << header << '\n';
    if (line_width == 0) line_width = sequence.size();
    for (size_t pos = 0; pos < sequence.size(); pos += line_width) {
        out.write(sequence.data() + pos,
                  static_cast<std::streamsize>(std::min(line_width, sequence.size() - pos)));
        out << '\n';
    }
}

} // namespace panannot
