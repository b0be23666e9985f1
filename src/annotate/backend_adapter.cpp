#include "annotate/backend_adapter.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include "annotate/genome_loader.hpp"
#include "annotate/output_normalizer.hpp"
#include "annotate/subprocess.hpp"
#include "util/file_utils.hpp"

namespace panannot {

namespace fs = std::filesystem;

std::string annotation_fingerprint(BackendKind kind, const BackendOptions& opts,
                                   const std::string& replicon_fasta) {
    return sha256_string(engine_option_signature(kind, opts) + "\n" + replicon_fasta);
}

static const char* kCanonicalSuffixes[] = {".fna", ".prt", ".gen", ".gff", ".lst"};

bool is_reusable_result(const std::string& dir, const std::string& name,
                        BackendKind kind, const std::string& fingerprint) {
    if (!dir_exists(dir)) return false;
    std::string base = dir + "/" + name;
    for (const char* suffix : kCanonicalSuffixes) {
        if (!file_exists(base + suffix)) return false;
    }
    if (!file_exists(base + "-" + backend_name(kind) + ".log")) return false;
    return read_file_string(base + ".sha256") == fingerprint + "\n";
}

static uint32_t count_lines(const std::string& path) {
    std::ifstream in(path);
    uint32_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) n++;
    }
    return n;
}

std::vector<std::string> collect_engine_warnings(const std::string& log_path) {
    std::vector<std::string> warnings;
    std::ifstream in(log_path);
    std::string line;
    while (std::getline(in, line) && warnings.size() < MAX_ENGINE_WARNINGS) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string lower = line;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (lower.find("warning") != std::string::npos)
            warnings.push_back(line);
    }
    return warnings;
}

static std::string describe_exit(const char* engine, const ProcessResult& pr) {
    if (!pr.error.empty()) return std::string(engine) + ": " + pr.error;
    if (pr.term_signal != 0)
        return std::string(engine) + " killed by signal " + std::to_string(pr.term_signal);
    return std::string(engine) + " exited with status " + std::to_string(pr.exit_code);
}

static void fail(AnnotationResult& result, ErrorKind kind, const std::string& reason) {
    result.status = AnnotationStatus::kFailed;
    result.error = kind;
    result.reason = reason;
}

static void mark_cancelled(AnnotationResult& result) {
    result.status = AnnotationStatus::kCancelled;
    result.error = ErrorKind::kCancelled;
    result.reason = "run cancelled";
}

// Keep the engine log of a failed genome next to the work directories.
static std::string preserve_log(const EngineInvocation& inv, const std::string& tmp_dir,
                                const std::string& name) {
    std::string dest = tmp_dir + "/" + name + "-" + backend_name(inv.kind) + ".log";
    std::error_code ec;
    fs::copy_file(inv.log_path, dest, fs::copy_options::overwrite_existing, ec);
    return ec ? std::string() : dest;
}

AnnotationResult annotate_genome(const GenomeRecord& record,
                                 const SystematicName& name,
                                 BackendKind kind,
                                 const BackendOptions& opts,
                                 const BackendContext& ctx) {
    AnnotationResult result;
    result.name = name.text;
    result.identifier = record.identifier;
    result.backend = kind;
    result.output_dir = ctx.results_dir + "/" + name.text;
    const char* engine = backend_name(kind);

    if (ctx.cancel && ctx.cancel->requested()) {
        mark_cancelled(result);
        return result;
    }

    // Renamed replicons: the engine input, the canonical .fna and the
    // fingerprint all come from the same text.
    std::vector<std::string> contigs;
    std::string msg;
    if (!read_genome_contigs(record.paths, ctx.cut_n, contigs, msg)) {
        fail(result, ErrorKind::kEngine, msg);
        return result;
    }
    std::vector<FastaRecord> replicons = make_replicons(name.text, std::move(contigs));
    std::string fna_text = format_replicons(replicons);
    std::string fingerprint = annotation_fingerprint(kind, opts, fna_text);

    if (!opts.force &&
        is_reusable_result(result.output_dir, name.text, kind, fingerprint)) {
        result.status = AnnotationStatus::kOk;
        result.reused = true;
        result.gene_count = count_lines(result.output_dir + "/" + name.text + ".lst");
        if (ctx.logger)
            ctx.logger->debug("%s: reusing existing results in %s",
                              name.text.c_str(), result.output_dir.c_str());
        return result;
    }
    remove_recursive(result.output_dir);

    ScopedTempDir work(engine_work_dir(ctx.tmp_dir, name.text, kind));
    if (!work.created()) {
        fail(result, ErrorKind::kEngine, "cannot create work directory " + work.path());
        return result;
    }

    EngineInvocation inv;
    StageError err;
    if (!build_invocation(kind, name.text, work.path(), opts, inv, err)) {
        fail(result, err.kind, err.message);
        return result;
    }
    if (!write_file_string(inv.input_fasta, fna_text)) {
        fail(result, ErrorKind::kEngine, "cannot write " + inv.input_fasta);
        return result;
    }

    if (ctx.logger) {
        std::string cmd;
        for (const auto& a : inv.argv) {
            if (!cmd.empty()) cmd += ' ';
            cmd += a;
        }
        ctx.logger->debug("%s: %s", name.text.c_str(), cmd.c_str());
    }

    ProcessResult pr;
    {
        Subprocess proc;
        if (!proc.start(inv.argv, inv.log_path, work.path(), msg)) {
            fail(result, ErrorKind::kEngine, msg);
            return result;
        }
        pr = proc.wait(ctx.cancel);
    }
    if (pr.cancelled) {
        mark_cancelled(result);
        return result;
    }

    result.warnings = collect_engine_warnings(inv.log_path);

    if (!pr.success()) {
        std::string reason = describe_exit(engine, pr);
        std::string kept = preserve_log(inv, ctx.tmp_dir, name.text);
        if (!kept.empty()) reason += " (see " + kept + ")";
        fail(result, ErrorKind::kEngine, reason);
        return result;
    }

    std::vector<GeneCall> calls;
    bool parsed = false;
    switch (kind) {
        case BackendKind::kProkka: {
            std::ifstream gff(inv.gff_path);
            if (!gff) {
                msg = "missing output " + inv.gff_path;
                break;
            }
            parsed = parse_prokka_gff(gff, calls, msg);
            for (auto& call : calls)
                call.contig = prokka_replicon_id(call.contig, name.text);
            break;
        }
        case BackendKind::kProdigal: {
            std::ifstream faa(inv.faa_path);
            if (!faa) {
                msg = "missing output " + inv.faa_path;
                break;
            }
            parsed = parse_prodigal_faa(faa, calls, msg);
            break;
        }
    }
    if (!parsed) {
        fail(result, ErrorKind::kEngine, std::string(engine) + ": " + msg);
        preserve_log(inv, ctx.tmp_dir, name.text);
        return result;
    }
    if (calls.empty()) {
        fail(result, ErrorKind::kEngine, std::string(engine) + " produced no gene calls");
        preserve_log(inv, ctx.tmp_dir, name.text);
        return result;
    }
    if (!assign_gene_ids(name.text, replicons, calls, msg)) {
        fail(result, ErrorKind::kEngine, std::string(engine) + ": " + msg);
        preserve_log(inv, ctx.tmp_dir, name.text);
        return result;
    }

    // Canonical directory. The fingerprint is written last so an
    // interrupted write never looks reusable.
    std::error_code ec;
    fs::create_directories(result.output_dir, ec);
    if (ec) {
        fail(result, ErrorKind::kEngine, "cannot create " + result.output_dir);
        return result;
    }
    std::string base = result.output_dir + "/" + name.text;
    auto proteins = read_protein_map(inv.faa_path);
    bool written =
        write_file_string(base + ".fna", fna_text) &&
        write_canonical_outputs(result.output_dir, name.text, engine, replicons,
                                calls, proteins, msg);
    if (written) {
        fs::copy_file(inv.log_path, base + "-" + engine + ".log",
                      fs::copy_options::overwrite_existing, ec);
        written = !ec && write_file_string(base + ".sha256", fingerprint + "\n");
        if (ec) msg = "cannot copy engine log: " + ec.message();
    }
    if (!written) {
        remove_recursive(result.output_dir);
        fail(result, ErrorKind::kEngine, msg.empty() ? "write error in " + result.output_dir : msg);
        return result;
    }

    result.status = AnnotationStatus::kOk;
    result.gene_count = static_cast<uint32_t>(calls.size());
    return result;
}

} // namespace panannot
