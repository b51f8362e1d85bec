#pragma once

#include <string>
#include <vector>

#include "core/DataStructs.hpp"

namespace CentiPrep {

/**
 * @brief Pairs alignment query results back to the sites that produced them.
 *
 * Results arrive keyed by window identifier in query order. Each identifier
 * is parsed and joined against the widened windows on (chrom, start, end);
 * the joined pairs are then put in genomic order. A window without reads
 * still has a result, with no reads in it.
 *
 * The join is on the coordinate key itself, so neither side depends on the
 * positional order of the other.
 */
class ResultReconciler {
public:
    /**
     * @param source_name Motif file reported in error messages.
     */
    explicit ResultReconciler(const std::string& source_name);

    /**
     * @param windows Sites with the windows used to build the query.
     * @param results Reads per window, in query order, one per window.
     * @return One entry per site, sorted by window (chrom, start, end).
     * @throws FormatError if a result identifier cannot be parsed.
     * @throws ReconciliationError if two sites share a window, a result
     *         matches no site, a window appears twice in the results, or
     *         the number of results differs from the number of sites.
     */
    std::vector<ReconciledSite> reconcile(const std::vector<SiteWindow>& windows,
                                          std::vector<RegionReads> results) const;

private:
    std::string source_name_;
};

}  // namespace CentiPrep
