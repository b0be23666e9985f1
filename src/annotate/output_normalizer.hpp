#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

#include "io/fasta_reader.hpp"

namespace panannot {

// One feature called by an engine, in engine coordinates (1-based,
// inclusive, start <= end).
struct GeneCall {
    std::string contig;
    uint64_t start = 0;
    uint64_t end = 0;
    char strand = '+';
    std::string type = "CDS";
    std::string engine_id;
    std::string product;
    std::string gene_id;    // <NAME>_<nnnnn>, set by assign_gene_ids()
};

// Prokka GFF3: feature lines up to "##FASTA". The ID attribute is the
// engine id (locus tag); "gene" and region lines are skipped.
bool parse_prokka_gff(std::istream& in, std::vector<GeneCall>& calls,
                      std::string& error_msg);

// Prokka run with --centre renames contigs "gnl|<centre>|<name>_<n>".
// Map such a seqid back to replicon <name>.<nnnn>; other ids are returned
// unchanged.
std::string prokka_replicon_id(const std::string& seqid, const std::string& name);

// Prodigal protein FASTA headers: ">contig_n # start # end # strand # attrs".
bool parse_prodigal_faa(std::istream& in, std::vector<GeneCall>& calls,
                        std::string& error_msg);

// First word of each header -> sequence, trailing stop '*' removed.
std::unordered_map<std::string, std::string>
read_protein_map(const std::string& faa_path);

// Sort calls by replicon index then start, and number them <name>_00001...
// Fails if a call refers to a contig that is not a replicon.
bool assign_gene_ids(const std::string& name,
                     const std::vector<FastaRecord>& replicons,
                     std::vector<GeneCall>& calls, std::string& error_msg);

// Nucleotide sequence of a call, reverse-complemented (IUPAC) on the minus
// strand.
std::string extract_gene_sequence(const FastaRecord& replicon, const GeneCall& call);

// "<name>.0001" ...
std::string replicon_name(const std::string& name, size_t index);

// Rename contigs to <name>.<cccc>, in order.
std::vector<FastaRecord> make_replicons(const std::string& name,
                                        std::vector<std::string>&& contigs);

std::string format_replicons(const std::vector<FastaRecord>& replicons);

// Write <dir>/<name>.prt, .gen, .gff and .lst from numbered calls.
bool write_canonical_outputs(const std::string& dir, const std::string& name,
                             const std::string& engine,
                             const std::vector<FastaRecord>& replicons,
                             const std::vector<GeneCall>& calls,
                             const std::unordered_map<std::string, std::string>& proteins,
                             std::string& error_msg);

} // namespace panannot
