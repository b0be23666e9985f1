#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "annotate/annotate_config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "util/cancellation.hpp"
#include "util/logger.hpp"

namespace panannot {

enum class RunState : uint8_t {
    kInitialized,
    kLoading,
    kFiltering,
    kNaming,
    kAnnotating,
    kSummarizing,
    kDone,
    kCancelled,
};

const char* run_state_name(RunState state);

// An accepted genome on its way to annotation.
struct AcceptedGenome {
    GenomeRecord record;
    QualityMetrics metrics;
    SystematicName name;
};

// Drives one annotate run: Loading -> Filtering -> Naming -> Annotating ->
// Summarizing -> Done (or Cancelled). Owns every per-run object; only the
// per-genome directories and the summary files outlive it.
class RunCoordinator {
public:
    // cancel may be null. config must have passed validate_annotate_config().
    RunCoordinator(const AnnotateConfig& config, const Logger& logger,
                   const CancellationToken* cancel = nullptr);

    // Returns false only on a fatal configuration-level error (err is set).
    // Per-genome rejections and engine failures are recorded in summary.
    bool run(RunSummary& summary, StageError& err);

    RunState state() const { return state_.load(std::memory_order_acquire); }

private:
    const AnnotateConfig& config_;
    Logger logger_;
    const CancellationToken* cancel_;
    std::atomic<RunState> state_{RunState::kInitialized};

    bool cancelled() const { return cancel_ && cancel_->requested(); }
    void set_state(RunState s);

    bool load_and_filter(std::vector<AcceptedGenome>& accepted,
                         RunSummary& summary, StageError& err);
    void assign_names(std::vector<AcceptedGenome>& accepted);
    void annotate_all(const std::vector<AcceptedGenome>& accepted,
                      RunSummary& summary);
    void record_without_engine(const std::vector<AcceptedGenome>& accepted,
                               AnnotationStatus status, RunSummary& summary);
    void log_counts(const RunSummary& summary) const;
};

} // namespace panannot
