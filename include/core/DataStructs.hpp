#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "Region.hpp"
#include "Types.hpp"

namespace CentiPrep {

/**
 * @brief One row of a motif scan table, as written by FIMO.
 */
struct MotifMatch {
    std::string motif_id;
    std::string motif_alt_id;
    std::string sequence_name;  ///< Chromosome
    int64_t start = 0;          ///< 1-based, inclusive
    int64_t stop = 0;           ///< 1-based, inclusive
    char strand = '.';
    double score = 0.0;
    double p_value = 1.0;
    double q_value = std::numeric_limits<double>::quiet_NaN();  ///< NaN when absent
    std::string matched_sequence;
};

/**
 * @brief A significant, deduplicated motif match.
 */
struct MotifSite {
    Region region;  ///< Motif span (never widened)
    std::string motif_id;
    char strand = '.';
    double score = 0.0;
    double p_value = 1.0;
    double q_value = std::numeric_limits<double>::quiet_NaN();
    std::string matched_sequence;
    int original_index = -1;  ///< Position among the rows that passed the significance filter
};

/**
 * @brief A motif site together with the padded window queried for reads.
 *
 * The site keeps its original span; the window is span +/- flank.
 */
struct SiteWindow {
    MotifSite site;
    Region window;
};

/**
 * @brief The fields of an alignment record consumed by aggregation.
 */
struct AlignedRead {
    int64_t position = 0;     ///< Leftmost aligned base, 1-based
    Strand strand = Strand::FORWARD;
    int32_t query_width = 0;  ///< Length of the query sequence
};

/**
 * @brief Reads returned for one queried window, keyed by its identifier.
 */
struct RegionReads {
    std::string region_id;  ///< "chrom:start-end" of the queried window
    std::vector<AlignedRead> reads;
};

/**
 * @brief A site paired with the reads of its window after reconciliation.
 */
struct ReconciledSite {
    SiteWindow site_window;
    std::string region_id;
    std::vector<AlignedRead> reads;
};

/**
 * @brief An interval with an attached value, read from a bedGraph file.
 */
struct ScoredRegion {
    Region region;
    double score = 0.0;
};

}  // namespace CentiPrep
