#include "core/SiteSelector.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace CentiPrep {

SiteSelector::SiteSelector(double log10p_threshold) : log10p_threshold_(log10p_threshold) {
}

bool SiteSelector::is_significant(double p_value) const {
    // NaN compares false and is dropped; p = 0 gives +inf and is kept
    return -std::log10(p_value) > log10p_threshold_;
}

std::vector<MotifSite> SiteSelector::select(const std::vector<MotifMatch>& matches,
                                            const std::string& source_name) const {
    std::vector<MotifSite> sites;
    sites.reserve(matches.size());

    for (const auto& m : matches) {
        if (!is_significant(m.p_value)) {
            continue;
        }
        MotifSite site;
        site.region = Region(m.sequence_name, m.start, m.stop);
        site.motif_id = m.motif_id;
        site.strand = m.strand;
        site.score = m.score;
        site.p_value = m.p_value;
        site.q_value = m.q_value;
        site.matched_sequence = m.matched_sequence;
        site.original_index = static_cast<int>(sites.size());
        sites.push_back(std::move(site));
    }

    if (sites.empty()) {
        LOG_ERROR("No motif match passes -log10(p) > " + std::to_string(log10p_threshold_) + " in " + source_name);
        throw NoSignificantMatchesError(source_name);
    }

    size_t significant = sites.size();

    std::stable_sort(sites.begin(), sites.end(), [](const MotifSite& a, const MotifSite& b) {
        if (a.region != b.region) {
            return a.region < b.region;
        }
        return a.score > b.score;
    });

    auto last = std::unique(sites.begin(), sites.end(), [](const MotifSite& a, const MotifSite& b) {
        return a.region == b.region;
    });
    sites.erase(last, sites.end());

    LOG_INFO("Selected " + std::to_string(sites.size()) + " sites (" + std::to_string(significant) +
             " significant of " + std::to_string(matches.size()) + ", " +
             std::to_string(significant - sites.size()) + " duplicates removed)");
    return sites;
}

}  // namespace CentiPrep
