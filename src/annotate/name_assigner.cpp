#include "annotate/name_assigner.hpp"

#include <algorithm>
#include <cstdio>

namespace panannot {

int ordinal_width(size_t n) {
    int w = 1;
    while (n >= 10) {
        n /= 10;
        w++;
    }
    return w;
}

std::string format_systematic_name(const std::string& group, uint32_t ordinal,
                                   int width) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%0*u", width, ordinal);
    return group + "." + buf;
}

std::string NamingContext::group_for(const NamingCandidate& c) const {
    return c.prefix_override.empty() ? policy_.prefix : c.prefix_override;
}

std::string NamingContext::label_for(const NamingCandidate& c) const {
    std::string label = group_for(c);
    const std::string& date = c.date_override.empty() ? policy_.date : c.date_override;
    if (!date.empty()) label += "." + date;
    return label;
}

std::vector<SystematicName> NamingContext::assign(
    const std::vector<NamingCandidate>& accepted) {
    std::vector<SystematicName> names(accepted.size());
    if (accepted.empty()) return names;

    int width = std::max(policy_.min_width, ordinal_width(accepted.size()));

    // Group members in arrival order; std::map keeps group iteration stable.
    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < accepted.size(); i++) {
        groups[group_for(accepted[i])].push_back(i);
    }

    for (auto& [group, members] : groups) {
        if (policy_.order == NamingOrder::kQuality) {
            std::stable_sort(members.begin(), members.end(),
                             [&](size_t a, size_t b) {
                                 const auto& ma = accepted[a].metrics;
                                 const auto& mb = accepted[b].metrics;
                                 if (ma.l90 != mb.l90) return ma.l90 < mb.l90;
                                 return ma.nb_contigs < mb.nb_contigs;
                             });
        }
        for (size_t idx : members) {
            uint32_t ordinal = ++counters_[group];
            names[idx].group = group;
            names[idx].ordinal = ordinal;
            names[idx].text = format_systematic_name(label_for(accepted[idx]),
                                                     ordinal, width);
        }
    }
    return names;
}

} // namespace panannot
