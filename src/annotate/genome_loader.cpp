#include "annotate/genome_loader.hpp"

#include <filesystem>

#include "io/fasta_reader.hpp"
#include "util/file_utils.hpp"

namespace panannot {

bool read_genome_contigs(const std::vector<std::string>& paths, int cut_n,
                         std::vector<std::string>& contigs,
                         std::string& error_msg) {
    contigs.clear();
    for (const auto& path : paths) {
        std::vector<FastaRecord> records;
        if (!read_fasta(path, records, error_msg)) return false;
        for (auto& rec : records) {
            for (auto& piece : split_at_n_runs(rec.sequence, cut_n))
                contigs.push_back(std::move(piece));
        }
    }
    return true;
}

bool GenomeLoader::load(const std::string& list_path,
                        const std::string& genome_dir, StageError& err) {
    entries_.clear();
    info_.clear();
    from_info_ = false;
    pos_ = 0;
    genome_dir_ = genome_dir;

    if (!dir_exists(genome_dir)) {
        err.set(ErrorKind::kConfig, "genome directory not found: " + genome_dir);
        return false;
    }

    std::string msg;
    if (!read_genome_list(list_path, entries_, msg)) {
        err.set(ErrorKind::kConfig, msg);
        return false;
    }
    if (entries_.empty()) {
        err.set(ErrorKind::kConfig, "no genome listed in " + list_path);
        return false;
    }
    return true;
}

bool GenomeLoader::load_info(const std::string& info_path,
                             const std::string& genome_dir, StageError& err) {
    entries_.clear();
    info_.clear();
    from_info_ = true;
    pos_ = 0;
    genome_dir_ = genome_dir;

    if (!dir_exists(genome_dir)) {
        err.set(ErrorKind::kConfig, "genome directory not found: " + genome_dir);
        return false;
    }

    std::string msg;
    if (!read_genome_info(info_path, info_, msg)) {
        err.set(ErrorKind::kConfig, msg);
        return false;
    }
    if (info_.empty()) {
        err.set(ErrorKind::kConfig, "no genome listed in " + info_path);
        return false;
    }
    return true;
}

bool GenomeLoader::next_from_info(GenomeRecord& out) {
    const GenomeInfoEntry& entry = info_[pos_];
    out = GenomeRecord{};
    out.identifier = entry.identifier;
    out.list_index = static_cast<uint32_t>(pos_);
    pos_++;

    std::filesystem::path file(entry.identifier);
    std::string path = file.is_absolute() ? file.string()
                                          : (std::filesystem::path(genome_dir_) / file).string();
    if (!file_exists(path)) {
        out.readable = false;
        out.load_error = "sequence file not found: " + path;
    } else if (!entry.valid) {
        out.readable = false;
        out.load_error = entry.error;
    } else {
        out.has_known_metrics = true;
        out.known_metrics = entry.metrics;
        out.total_length = entry.metrics.genome_size;
    }
    out.paths.push_back(std::move(path));
    return true;
}

bool GenomeLoader::next(GenomeRecord& out) {
    if (from_info_) {
        if (pos_ >= info_.size()) return false;
        return next_from_info(out);
    }
    if (pos_ >= entries_.size()) return false;

    const GenomeListEntry& entry = entries_[pos_];
    out = GenomeRecord{};
    out.identifier = entry.files.front();
    out.prefix_override = entry.prefix_override;
    out.date_override = entry.date_override;
    out.list_index = static_cast<uint32_t>(pos_);
    pos_++;

    for (const auto& f : entry.files) {
        std::string path = (std::filesystem::path(genome_dir_) / f).string();
        if (!file_exists(path)) {
            out.readable = false;
            out.load_error = "sequence file not found: " + path;
        }
        out.paths.push_back(std::move(path));
    }
    if (!out.readable) return true;

    std::vector<std::string> contigs;
    if (!read_genome_contigs(out.paths, cut_n_, contigs, out.load_error)) {
        out.readable = false;
        return true;
    }

    out.contig_lengths.reserve(contigs.size());
    for (const auto& c : contigs) {
        out.contig_lengths.push_back(c.size());
        out.total_length += c.size();
    }
    return true;
}

} // namespace panannot
