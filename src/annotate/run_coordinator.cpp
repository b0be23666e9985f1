#include "annotate/run_coordinator.hpp"

#include <filesystem>
#include <mutex>
#include <unordered_set>

#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include "annotate/backend_adapter.hpp"
#include "annotate/genome_loader.hpp"
#include "annotate/name_assigner.hpp"
#include "annotate/quality_filter.hpp"
#include "io/summary_writer.hpp"
#include "util/progress.hpp"

namespace panannot {

const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::kInitialized: return "initialized";
        case RunState::kLoading:     return "loading";
        case RunState::kFiltering:   return "filtering";
        case RunState::kNaming:      return "naming";
        case RunState::kAnnotating:  return "annotating";
        case RunState::kSummarizing: return "summarizing";
        case RunState::kDone:        return "done";
        case RunState::kCancelled:   return "cancelled";
    }
    return "unknown";
}

RunCoordinator::RunCoordinator(const AnnotateConfig& config, const Logger& logger,
                               const CancellationToken* cancel)
    : config_(config), logger_(logger), cancel_(cancel) {}

void RunCoordinator::set_state(RunState s) {
    state_.store(s, std::memory_order_release);
    logger_.debug("run state: %s", run_state_name(s));
}

static std::string rejection_detail(const AcceptanceDecision& d,
                                    const GenomeRecord& record,
                                    const QualityThresholds& t) {
    const char* op = t.inclusive ? ">" : ">=";
    switch (d.reason) {
        case RejectReason::kUnreadable:
            return record.load_error;
        case RejectReason::kEmptySequence:
            return "no sequence";
        case RejectReason::kTooManyContigs:
            return std::to_string(d.metrics.nb_contigs) + " contigs " + op + " " +
                   std::to_string(t.max_contigs);
        case RejectReason::kL90TooHigh:
            return "L90 " + std::to_string(d.metrics.l90) + " " + op + " " +
                   std::to_string(t.max_l90);
        default:
            return {};
    }
}

bool RunCoordinator::load_and_filter(std::vector<AcceptedGenome>& accepted,
                                     RunSummary& summary, StageError& err) {
    set_state(RunState::kLoading);
    GenomeLoader loader(config_.cut_n);
    if (config_.info_file.empty()) {
        if (!loader.load(config_.list_file, config_.genome_dir, err)) return false;
        logger_.info("Genome list: %s (%zu genome(s))", config_.list_file.c_str(),
                     loader.size());
    } else {
        if (!loader.load_info(config_.info_file, config_.genome_dir, err)) return false;
        logger_.info("Genome info: %s (%zu genome(s)); L90 and contig counts are "
                     "taken from this file", config_.info_file.c_str(), loader.size());
    }

    set_state(RunState::kFiltering);
    std::unordered_set<std::string> seen;
    GenomeRecord record;
    while (loader.next(record)) {
        if (cancelled()) return true;

        RejectedGenome rej;
        rej.identifier = record.identifier;
        rej.list_index = record.list_index;

        if (!seen.insert(record.identifier).second) {
            rej.reason = RejectReason::kDuplicateIdentifier;
            rej.detail = "listed more than once";
            if (record.readable) rej.metrics = compute_metrics(record);
        } else {
            AcceptanceDecision d = evaluate(record, config_.thresholds);
            if (d.accepted) {
                AcceptedGenome g;
                g.metrics = d.metrics;
                g.record = std::move(record);
                accepted.push_back(std::move(g));
                continue;
            }
            rej.reason = d.reason;
            rej.metrics = d.metrics;
            rej.detail = rejection_detail(d, record, config_.thresholds);
        }

        logger_.info("%s rejected: %s (%s)", rej.identifier.c_str(),
                     reject_reason_name(rej.reason), rej.detail.c_str());
        summary.rejected.push_back(std::move(rej));
    }
    return true;
}

void RunCoordinator::assign_names(std::vector<AcceptedGenome>& accepted) {
    set_state(RunState::kNaming);

    std::vector<NamingCandidate> candidates;
    candidates.reserve(accepted.size());
    for (const auto& g : accepted) {
        NamingCandidate c;
        c.identifier = g.record.identifier;
        c.prefix_override = g.record.prefix_override;
        c.date_override = g.record.date_override;
        c.metrics = g.metrics;
        candidates.push_back(std::move(c));
    }

    NamingContext naming(config_.naming);
    std::vector<SystematicName> names = naming.assign(candidates);
    for (size_t i = 0; i < accepted.size(); i++) {
        accepted[i].name = std::move(names[i]);
        logger_.debug("%s -> %s", accepted[i].record.identifier.c_str(),
                      accepted[i].name.text.c_str());
    }
}

void RunCoordinator::record_without_engine(const std::vector<AcceptedGenome>& accepted,
                                           AnnotationStatus status,
                                           RunSummary& summary) {
    for (const auto& g : accepted) {
        AnnotationResult r;
        r.name = g.name.text;
        r.identifier = g.record.identifier;
        r.backend = config_.backend;
        r.output_dir = config_.results_dir + "/" + g.name.text;
        r.status = status;
        r.metrics = g.metrics;
        if (status == AnnotationStatus::kCancelled) {
            r.error = ErrorKind::kCancelled;
            r.reason = "run cancelled";
        }
        summary.results[r.name] = std::move(r);
    }
}

void RunCoordinator::annotate_all(const std::vector<AcceptedGenome>& accepted,
                                  RunSummary& summary) {
    set_state(RunState::kAnnotating);
    logger_.info("Annotating %zu genome(s) with %s on %d thread(s)",
                 accepted.size(), backend_name(config_.backend), config_.threads);

    BackendContext ctx;
    ctx.results_dir = config_.results_dir;
    ctx.tmp_dir = config_.tmp_dir;
    ctx.cut_n = config_.info_file.empty() ? config_.cut_n : 0;
    ctx.cancel = cancel_;
    ctx.logger = &logger_;

    // Only the summary accumulator and the progress line are shared.
    std::mutex summary_mutex;
    Progress progress("annotate", accepted.size(), !logger_.quiet());

    tbb::task_arena arena(config_.threads);
    arena.execute([&] {
        tbb::task_group tg;
        for (size_t i = 0; i < accepted.size(); i++) {
            tg.run([&, i]() {
                const AcceptedGenome& g = accepted[i];
                AnnotationResult r = annotate_genome(g.record, g.name, config_.backend,
                                                     config_.backend_options, ctx);
                r.metrics = g.metrics;

                std::lock_guard<std::mutex> lock(summary_mutex);
                switch (r.status) {
                    case AnnotationStatus::kOk:
                        logger_.debug("%s: %u gene(s)%s", r.name.c_str(),
                                      r.gene_count, r.reused ? " (reused)" : "");
                        break;
                    case AnnotationStatus::kFailed:
                        logger_.warn("%s (%s): %s: %s", r.name.c_str(),
                                     r.identifier.c_str(), error_kind_name(r.error),
                                     r.reason.c_str());
                        break;
                    default:
                        break;
                }
                for (const auto& w : r.warnings)
                    logger_.debug("%s: %s", r.name.c_str(), w.c_str());
                progress.tick(r.status == AnnotationStatus::kOk);
                summary.results[r.name] = std::move(r);
            });
        }
        tg.wait();
    });
    progress.finish();

    // The scratch root is ours only if nothing else lives there.
    std::error_code ec;
    if (std::filesystem::is_empty(config_.tmp_dir, ec) && !ec)
        std::filesystem::remove(config_.tmp_dir, ec);
}

void RunCoordinator::log_counts(const RunSummary& summary) const {
    logger_.info("Genomes: %zu accepted, %zu rejected; annotations: %zu ok, "
                 "%zu failed, %zu cancelled, %zu skipped",
                 summary.accepted_count(), summary.rejected_count(),
                 summary.count_status(AnnotationStatus::kOk),
                 summary.count_status(AnnotationStatus::kFailed),
                 summary.count_status(AnnotationStatus::kCancelled),
                 summary.count_status(AnnotationStatus::kSkipped));
}

bool RunCoordinator::run(RunSummary& summary, StageError& err) {
    summary = RunSummary{};

    std::error_code ec;
    std::filesystem::create_directories(config_.results_dir, ec);
    if (ec) {
        err.set(ErrorKind::kConfig, "cannot create results directory " +
                                    config_.results_dir + ": " + ec.message());
        return false;
    }

    std::vector<AcceptedGenome> accepted;
    if (!load_and_filter(accepted, summary, err)) return false;
    logger_.info("%zu genome(s) accepted, %zu rejected", accepted.size(),
                 summary.rejected.size());

    // Names are complete for the whole batch before any engine starts.
    assign_names(accepted);

    if (cancelled()) {
        record_without_engine(accepted, AnnotationStatus::kCancelled, summary);
    } else if (config_.qc_only) {
        logger_.info("QC only: no annotation");
        record_without_engine(accepted, AnnotationStatus::kSkipped, summary);
    } else if (!accepted.empty()) {
        std::filesystem::create_directories(config_.tmp_dir, ec);
        if (ec) {
            err.set(ErrorKind::kConfig, "cannot create temporary directory " +
                                        config_.tmp_dir + ": " + ec.message());
            return false;
        }
        annotate_all(accepted, summary);
    }

    summary.status = cancelled() ? RunStatus::kCancelled : RunStatus::kDone;

    set_state(RunState::kSummarizing);
    std::string msg;
    if (!write_run_summary(config_.results_dir, list_name(config_), summary, msg)) {
        // The annotations themselves are on disk; report and carry on.
        logger_.error("%s", msg.c_str());
    } else {
        logger_.info("Summary written to %s",
                     summary_path(config_.results_dir, list_name(config_)).c_str());
    }
    log_counts(summary);

    set_state(summary.status == RunStatus::kCancelled ? RunState::kCancelled
                                                      : RunState::kDone);
    return true;
}

} // namespace panannot
