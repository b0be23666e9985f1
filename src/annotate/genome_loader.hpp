#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "io/genome_info_reader.hpp"
#include "io/genome_list_reader.hpp"

namespace panannot {

// Read the FASTA files of one genome, in order, and split every contig at
// runs of >= cut_n 'N'. Returns false if a file cannot be opened.
bool read_genome_contigs(const std::vector<std::string>& paths, int cut_n,
                         std::vector<std::string>& contigs,
                         std::string& error_msg);

// Yields one GenomeRecord per list entry, reading sequence files lazily.
// Single pass: once exhausted, call load() again to re-read from disk.
class GenomeLoader {
public:
    explicit GenomeLoader(int cut_n = DEFAULT_CUT_N) : cut_n_(cut_n) {}

    // Read the list file and check the genome directory.
    // Fails with ErrorKind::kConfig if either is unusable.
    bool load(const std::string& list_path, const std::string& genome_dir,
              StageError& err);

    // Same, from an info file with precomputed metrics. Records carry
    // known_metrics and their sequences are not read; an entry with invalid
    // metrics is returned unreadable.
    bool load_info(const std::string& info_path, const std::string& genome_dir,
                   StageError& err);

    // Produce the next record. Returns false when the list is exhausted.
    // A genome whose files are missing is returned with readable == false.
    bool next(GenomeRecord& out);

    size_t size() const { return from_info_ ? info_.size() : entries_.size(); }

private:
    int cut_n_;
    std::string genome_dir_;
    std::vector<GenomeListEntry> entries_;
    std::vector<GenomeInfoEntry> info_;
    bool from_info_ = false;
    size_t pos_ = 0;

    bool next_from_info(GenomeRecord& out);
};

} // namespace panannot
