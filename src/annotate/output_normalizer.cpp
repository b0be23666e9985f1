#include "annotate/output_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "core/config.hpp"

namespace panannot {

static std::vector<std::string> split_fields(const std::string& line, char delim) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(delim, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

static bool parse_position(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (*end != '\0' || v == 0) return false;
    out = v;
    return true;
}

// GFF3 column 9 percent-decoding (%2C -> ',').
static std::string gff_unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            out += static_cast<char>(std::strtol(hex, nullptr, 16));
            i += 2;
            continue;
        }
        out += s[i];
    }
    return out;
}

static std::string gff_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case ';':  out += "%3B"; break;
            case '=':  out += "%3D"; break;
            case '&':  out += "%26"; break;
            case ',':  out += "%2C"; break;
            case '%':  out += "%25"; break;
            case '\t': out += "%09"; break;
            default:   out += c;
        }
    }
    return out;
}

static bool is_annotated_feature(const std::string& type) {
    return type == "CDS" || type == "tRNA" || type == "rRNA" ||
           type == "tmRNA" || type == "ncRNA" || type == "misc_RNA";
}

bool parse_prokka_gff(std::istream& in, std::vector<GeneCall>& calls,
                      std::string& error_msg) {
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.rfind("##FASTA", 0) == 0) break;
        if (line.empty() || line[0] == '#') continue;

        auto cols = split_fields(line, '\t');
        if (cols.size() < 9) {
            error_msg = "GFF line " + std::to_string(line_no) +
                        ": expected 9 columns, got " + std::to_string(cols.size());
            return false;
        }
        if (!is_annotated_feature(cols[2])) continue;

        GeneCall call;
        call.contig = cols[0];
        call.type = cols[2];
        if (!parse_position(cols[3], call.start) ||
            !parse_position(cols[4], call.end) || call.start > call.end) {
            error_msg = "GFF line " + std::to_string(line_no) + ": invalid coordinates";
            return false;
        }
        call.strand = (cols[6] == "-") ? '-' : '+';

        for (const auto& attr : split_fields(cols[8], ';')) {
            size_t eq = attr.find('=');
            if (eq == std::string::npos) continue;
            std::string key = attr.substr(0, eq);
            std::string value = gff_unescape(attr.substr(eq + 1));
            if (key == "ID") {
                call.engine_id = value;
            } else if (key == "locus_tag" && call.engine_id.empty()) {
                call.engine_id = value;
            } else if (key == "product") {
                std::replace(value.begin(), value.end(), '\t', ' ');
                call.product = value;
            }
        }
        if (call.engine_id.empty()) {
            error_msg = "GFF line " + std::to_string(line_no) + ": feature without ID";
            return false;
        }
        calls.push_back(std::move(call));
    }
    return true;
}

bool parse_prodigal_faa(std::istream& in, std::vector<GeneCall>& calls,
                        std::string& error_msg) {
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty() || line[0] != '>') continue;
        if (line.back() == '\r') line.pop_back();

        auto fields = split_fields(line.substr(1), '#');
        if (fields.size() < 4) {
            error_msg = "protein header line " + std::to_string(line_no) +
                        ": expected '>id # start # end # strand'";
            return false;
        }

        GeneCall call;
        call.engine_id = trim(fields[0]);
        size_t us = call.engine_id.rfind('_');
        if (call.engine_id.empty() || us == std::string::npos || us == 0) {
            error_msg = "protein header line " + std::to_string(line_no) +
                        ": gene id '" + call.engine_id + "' has no contig part";
            return false;
        }
        call.contig = call.engine_id.substr(0, us);
        if (!parse_position(trim(fields[1]), call.start) ||
            !parse_position(trim(fields[2]), call.end) || call.start > call.end) {
            error_msg = "protein header line " + std::to_string(line_no) +
                        ": invalid coordinates";
            return false;
        }
        std::string strand = trim(fields[3]);
        if (strand == "1") {
            call.strand = '+';
        } else if (strand == "-1") {
            call.strand = '-';
        } else {
            error_msg = "protein header line " + std::to_string(line_no) +
                        ": invalid strand '" + strand + "'";
            return false;
        }
        call.type = "CDS";
        calls.push_back(std::move(call));
    }
    return true;
}

std::unordered_map<std::string, std::string>
read_protein_map(const std::string& faa_path) {
    std::unordered_map<std::string, std::string> proteins;
    std::vector<FastaRecord> records;
    std::string msg;
    if (!read_fasta(faa_path, records, msg)) return proteins;
    for (auto& rec : records) {
        while (!rec.sequence.empty() && rec.sequence.back() == '*')
            rec.sequence.pop_back();
        proteins[rec.id] = std::move(rec.sequence);
    }
    return proteins;
}

bool assign_gene_ids(const std::string& name,
                     const std::vector<FastaRecord>& replicons,
                     std::vector<GeneCall>& calls, std::string& error_msg) {
    std::unordered_map<std::string, size_t> contig_index;
    for (size_t i = 0; i < replicons.size(); i++)
        contig_index[replicons[i].id] = i;

    std::vector<std::pair<size_t, size_t>> order;  // (contig index, call index)
    order.reserve(calls.size());
    for (size_t i = 0; i < calls.size(); i++) {
        auto it = contig_index.find(calls[i].contig);
        if (it == contig_index.end()) {
            error_msg = "gene " + calls[i].engine_id + " is on unknown contig " +
                        calls[i].contig;
            return false;
        }
        if (calls[i].end > replicons[it->second].sequence.size()) {
            error_msg = "gene " + calls[i].engine_id + " ends past contig " +
                        calls[i].contig;
            return false;
        }
        order.emplace_back(it->second, i);
    }

    std::stable_sort(order.begin(), order.end(),
        [&](const std::pair<size_t, size_t>& a, const std::pair<size_t, size_t>& b) {
            if (a.first != b.first) return a.first < b.first;
            return calls[a.second].start < calls[b.second].start;
        });

    std::vector<GeneCall> sorted;
    sorted.reserve(calls.size());
    char buf[32];
    for (size_t k = 0; k < order.size(); k++) {
        GeneCall call = std::move(calls[order[k].second]);
        std::snprintf(buf, sizeof(buf), "_%0*zu", GENE_INDEX_WIDTH, k + 1);
        call.gene_id = name + buf;
        sorted.push_back(std::move(call));
    }
    calls = std::move(sorted);
    return true;
}

std::string prokka_replicon_id(const std::string& seqid, const std::string& name) {
    if (seqid.rfind("gnl|", 0) != 0) return seqid;
    std::string tail = seqid.substr(seqid.rfind('|') + 1);
    size_t us = tail.rfind('_');
    if (us == std::string::npos || us != name.size() ||
        tail.compare(0, us, name) != 0 || us + 1 == tail.size())
        return seqid;

    size_t index = 0;
    for (size_t i = us + 1; i < tail.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(tail[i]))) return seqid;
        index = index * 10 + static_cast<size_t>(tail[i] - '0');
    }
    if (index == 0) return seqid;
    return replicon_name(name, index);
}

// IUPAC complement; S, W, N and gaps map to themselves.
static char complement_base(char c) {
    switch (c) {
        case 'A': return 'T';
        case 'T': return 'A';
        case 'U': return 'A';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'R': return 'Y';
        case 'Y': return 'R';
        case 'K': return 'M';
        case 'M': return 'K';
        case 'B': return 'V';
        case 'V': return 'B';
        case 'D': return 'H';
        case 'H': return 'D';
        case 'a': return 't';
        case 't': return 'a';
        case 'u': return 'a';
        case 'c': return 'g';
        case 'g': return 'c';
        case 'r': return 'y';
        case 'y': return 'r';
        case 'k': return 'm';
        case 'm': return 'k';
        case 'b': return 'v';
        case 'v': return 'b';
        case 'd': return 'h';
        case 'h': return 'd';
        default:  return c;
    }
}

std::string extract_gene_sequence(const FastaRecord& replicon, const GeneCall& call) {
    std::string seq = replicon.sequence.substr(call.start - 1,
                                               call.end - call.start + 1);
    if (call.strand == '-') {
        std::reverse(seq.begin(), seq.end());
        for (auto& c : seq) c = complement_base(c);
    }
    return seq;
}

std::string replicon_name(const std::string& name, size_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), ".%0*zu", CONTIG_INDEX_WIDTH, index);
    return name + buf;
}

std::vector<FastaRecord> make_replicons(const std::string& name,
                                        std::vector<std::string>&& contigs) {
    std::vector<FastaRecord> replicons;
    replicons.reserve(contigs.size());
    for (size_t i = 0; i < contigs.size(); i++) {
        FastaRecord rec;
        rec.id = replicon_name(name, i + 1);
        rec.sequence = std::move(contigs[i]);
        replicons.push_back(std::move(rec));
    }
    return replicons;
}

std::string format_replicons(const std::vector<FastaRecord>& replicons) {
    std::ostringstream out;
    for (const auto& rec : replicons)
        write_fasta_record(out, rec.id, rec.sequence);
    return out.str();
}

static const std::string& product_or_na(const GeneCall& call) {
    static const std::string kNA = "NA";
    return call.product.empty() ? kNA : call.product;
}

bool write_canonical_outputs(const std::string& dir, const std::string& name,
                             const std::string& engine,
                             const std::vector<FastaRecord>& replicons,
                             const std::vector<GeneCall>& calls,
                             const std::unordered_map<std::string, std::string>& proteins,
                             std::string& error_msg) {
    std::string base = dir + "/" + name;
    std::ofstream prt(base + ".prt");
    std::ofstream gen(base + ".gen");
    std::ofstream gff(base + ".gff");
    std::ofstream lst(base + ".lst");
    if (!prt || !gen || !gff || !lst) {
        error_msg = "cannot create output files in " + dir;
        return false;
    }

    std::unordered_map<std::string, const FastaRecord*> by_id;
    for (const auto& rec : replicons) by_id[rec.id] = &rec;

    gff << "##gff-version 3\n";
    for (const auto& rec : replicons)
        gff << "##sequence-region " << rec.id << " 1 " << rec.sequence.size() << "\n";

    for (const auto& call : calls) {
        const FastaRecord& replicon = *by_id.at(call.contig);
        const std::string& product = product_or_na(call);

        std::string nuc = extract_gene_sequence(replicon, call);
        write_fasta_record(gen, call.gene_id + " " + std::to_string(nuc.size()) +
                                " " + product, nuc);

        if (call.type == "CDS") {
            auto it = proteins.find(call.engine_id);
            if (it != proteins.end() && !it->second.empty()) {
                write_fasta_record(prt, call.gene_id + " " +
                                        std::to_string(it->second.size()) +
                                        " " + product, it->second);
            }
        }

        gff << call.contig << '\t' << engine << '\t' << call.type << '\t'
            << call.start << '\t' << call.end << "\t.\t" << call.strand << '\t'
            << (call.type == "CDS" ? "0" : ".") << '\t'
            << "ID=" << call.gene_id << ";locus_tag=" << call.gene_id;
        if (!call.product.empty()) gff << ";product=" << gff_escape(call.product);
        gff << '\n';

        lst << call.start << '\t' << call.end << '\t' << call.strand << '\t'
            << call.type << '\t' << call.gene_id << '\t' << call.contig << '\t'
            << call.engine_id << '\t' << product << '\n';
    }

    prt.close();
    gen.close();
    gff.close();
    lst.close();
    if (!prt || !gen || !gff || !lst) {
        error_msg = "write error in " + dir;
        return false;
    }
    return true;
}

} // namespace panannot
