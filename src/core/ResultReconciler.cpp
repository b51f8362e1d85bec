#include "core/ResultReconciler.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace CentiPrep {

ResultReconciler::ResultReconciler(const std::string& source_name) : source_name_(source_name) {
}

std::vector<ReconciledSite> ResultReconciler::reconcile(const std::vector<SiteWindow>& windows,
                                                        std::vector<RegionReads> results) const {
    // Join key: the widened window
    std::map<Region, size_t> by_window;
    for (size_t i = 0; i < windows.size(); ++i) {
        auto inserted = by_window.emplace(windows[i].window, i);
        if (!inserted.second) {
            throw ReconciliationError("Two sites share window " + RegionCodec::format(windows[i].window) +
                                      " in '" + source_name_ + "'");
        }
    }

    std::vector<ReconciledSite> joined;
    joined.reserve(results.size());
    std::set<Region> seen;

    for (auto& result : results) {
        Region key = RegionCodec::parse(result.region_id);

        auto it = by_window.find(key);
        if (it == by_window.end()) {
            throw ReconciliationError("Alignment result " + result.region_id + " matches no site in '" +
                                      source_name_ + "'");
        }
        if (!seen.insert(key).second) {
            throw ReconciliationError("Alignment result " + result.region_id + " returned twice for '" +
                                      source_name_ + "'");
        }

        ReconciledSite rs;
        rs.site_window = windows[it->second];
        rs.region_id = std::move(result.region_id);
        rs.reads = std::move(result.reads);
        joined.push_back(std::move(rs));
    }

    // Every window was queried, so each must come back exactly once
    if (joined.size() != windows.size()) {
        throw ReconciliationError("ERROR: " + std::to_string(windows.size()) + " regions and " +
                                  std::to_string(joined.size()) + " in bam. '" + source_name_ + "'");
    }

    std::sort(joined.begin(), joined.end(), [](const ReconciledSite& a, const ReconciledSite& b) {
        return a.site_window.window < b.site_window.window;
    });

    size_t empty = std::count_if(joined.begin(), joined.end(),
                                 [](const ReconciledSite& rs) { return rs.reads.empty(); });
    if (empty > 0) {
        LOG_INFO(std::to_string(empty) + " of " + std::to_string(joined.size()) +
                 " sites have no overlapping reads and get all-zero rows");
    }
    return joined;
}

}  // namespace CentiPrep
