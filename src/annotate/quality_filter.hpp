#pragma once

#include <cstdint>
#include <vector>

#include "core/types.hpp"

namespace panannot {

struct QualityThresholds {
    uint32_t max_contigs = 999;
    uint32_t max_l90 = 100;
    bool inclusive = true;   // value == threshold is accepted
};

// L90: minimum number of contigs, longest first, whose cumulative length
// reaches 90% of the assembly. 0 for an empty assembly.
uint32_t compute_l90(const std::vector<uint64_t>& contig_lengths);

// Metrics from the contig lengths, or the record's known_metrics if set.
QualityMetrics compute_metrics(const GenomeRecord& record);

// Pure quality gate. Checks, in order: unreadable, empty sequence,
// contig count, L90.
AcceptanceDecision evaluate(const GenomeRecord& record,
                            const QualityThresholds& thresholds);

} // namespace panannot
