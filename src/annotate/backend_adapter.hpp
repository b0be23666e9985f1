#pragma once

#include <string>

#include "annotate/backend.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "util/cancellation.hpp"
#include "util/logger.hpp"

namespace panannot {

// Where and how one run annotates its genomes.
struct BackendContext {
    std::string results_dir;
    std::string tmp_dir;
    int cut_n = DEFAULT_CUT_N;
    const CancellationToken* cancel = nullptr;
    const Logger* logger = nullptr;
};

// Annotate one accepted genome with `kind` and normalize the outputs into
// <results_dir>/<name>/. Never throws and never fails the run: engine
// problems come back as status kFailed with ErrorKind::kEngine, and an
// interrupted run as kCancelled. The engine work directory is removed on
// every path; the canonical directory only exists on success.
AnnotationResult annotate_genome(const GenomeRecord& record,
                                 const SystematicName& name,
                                 BackendKind kind,
                                 const BackendOptions& opts,
                                 const BackendContext& ctx);

// SHA-256 over the engine option signature and the renamed replicons.
std::string annotation_fingerprint(BackendKind kind, const BackendOptions& opts,
                                   const std::string& replicon_fasta);

// True if <dir> holds a complete result produced from `fingerprint`.
bool is_reusable_result(const std::string& dir, const std::string& name,
                        BackendKind kind, const std::string& fingerprint);

// Up to MAX_ENGINE_WARNINGS log lines that mention a warning.
std::vector<std::string> collect_engine_warnings(const std::string& log_path);

} // namespace panannot
