#include "annotate/quality_filter.hpp"

#include <algorithm>
#include <functional>

namespace panannot {

uint32_t compute_l90(const std::vector<uint64_t>& contig_lengths) {
    if (contig_lengths.empty()) return 0;

    std::vector<uint64_t> sorted(contig_lengths);
    std::sort(sorted.begin(), sorted.end(), std::greater<uint64_t>());

    uint64_t total = 0;
    for (uint64_t len : sorted) total += len;

    // cum / total >= 0.9, kept in integers
    uint64_t cum = 0;
    for (size_t i = 0; i < sorted.size(); i++) {
        cum += sorted[i];
        if (cum * 10 >= total * 9) return static_cast<uint32_t>(i + 1);
    }
    return static_cast<uint32_t>(sorted.size());
}

QualityMetrics compute_metrics(const GenomeRecord& record) {
    if (record.has_known_metrics) return record.known_metrics;
    QualityMetrics m;
    m.genome_size = record.total_length;
    m.nb_contigs = static_cast<uint32_t>(record.contig_lengths.size());
    m.l90 = compute_l90(record.contig_lengths);
    return m;
}

static bool exceeds(uint32_t value, uint32_t limit, bool inclusive) {
    return inclusive ? value > limit : value >= limit;
}

AcceptanceDecision evaluate(const GenomeRecord& record,
                            const QualityThresholds& thresholds) {
    AcceptanceDecision d;
    if (!record.readable) {
        d.reason = RejectReason::kUnreadable;
        return d;
    }

    d.metrics = compute_metrics(record);
    if (d.metrics.nb_contigs == 0 || d.metrics.genome_size == 0) {
        d.reason = RejectReason::kEmptySequence;
    } else if (exceeds(d.metrics.nb_contigs, thresholds.max_contigs, thresholds.inclusive)) {
        d.reason = RejectReason::kTooManyContigs;
    } else if (exceeds(d.metrics.l90, thresholds.max_l90, thresholds.inclusive)) {
        d.reason = RejectReason::kL90TooHigh;
    } else {
        d.accepted = true;
    }
    return d;
}

} // namespace panannot
