#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace panannot {

enum class NamingOrder : uint8_t {
    kListOrder,   // ordinal = arrival order of accepted genomes
    kQuality,     // ordinal = increasing L90, then contig count; ties by list order
};

struct NamingPolicy {
    std::string prefix;     // e.g. "ESCO"
    std::string date;       // "" = names without a date field
    NamingOrder order = NamingOrder::kListOrder;
    int min_width = 0;      // minimum zero-padding of the ordinal
};

// What the assigner needs to know about one accepted genome.
struct NamingCandidate {
    std::string identifier;
    std::string prefix_override;
    std::string date_override;
    QualityMetrics metrics;
};

// Run-scoped naming state. Owns one ordinal counter per prefix so that no
// counter outlives the run or is shared between runs. Genomes of one prefix
// share the counter whatever their date.
class NamingContext {
public:
    explicit NamingContext(const NamingPolicy& policy) : policy_(policy) {}

    // Effective prefix after applying the override.
    std::string group_for(const NamingCandidate& c) const;

    // "<prefix>" or "<prefix>.<date>" after applying overrides.
    std::string label_for(const NamingCandidate& c) const;

    // Assign names to all accepted genomes, given in arrival order. The ordinal
    // width is sized on the whole batch so that all names have the same width.
    // Result i is the name of accepted[i].
    std::vector<SystematicName> assign(const std::vector<NamingCandidate>& accepted);

    const std::map<std::string, uint32_t>& counters() const { return counters_; }

private:
    NamingPolicy policy_;
    std::map<std::string, uint32_t> counters_;
};

// Digits needed to print n (at least 1).
int ordinal_width(size_t n);

std::string format_systematic_name(const std::string& group, uint32_t ordinal,
                                   int width);

} // namespace panannot
