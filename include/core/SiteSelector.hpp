#pragma once

#include <string>
#include <vector>

#include "core/DataStructs.hpp"

namespace CentiPrep {

/**
 * @brief Selects significant motif matches and collapses duplicates.
 *
 * 1. Keeps a match iff -log10(p_value) > log10p_threshold (strict).
 * 2. Throws NoSignificantMatchesError when nothing survives.
 * 3. Sorts by (sequence_name, start, stop) ascending, score descending, and
 *    keeps the first row of every identical interval, i.e. the one with the
 *    highest score.
 *
 * Each surviving site carries original_index, its position among the rows
 * that passed step 1.
 */
class SiteSelector {
public:
    static constexpr double kDefaultLog10pThreshold = 4.0;

    explicit SiteSelector(double log10p_threshold = kDefaultLog10pThreshold);

    /**
     * @param matches Raw rows from the motif table.
     * @param source_name File the rows came from, reported on failure.
     * @return Deduplicated sites in (chrom, start, end) order.
     * @throws NoSignificantMatchesError if no row passes the threshold.
     */
    std::vector<MotifSite> select(const std::vector<MotifMatch>& matches, const std::string& source_name) const;

    /**
     * @brief The significance test applied to a single p-value.
     */
    bool is_significant(double p_value) const;

    double threshold() const { return log10p_threshold_; }

private:
    double log10p_threshold_;
};

}  // namespace CentiPrep
