#pragma once

#include <htslib/sam.h>

#include "core/DataStructs.hpp"

namespace CentiPrep {

/**
 * @brief Configuration for read filtering criteria.
 *
 * Every filter is off by default, so all mapped records count.
 */
struct ReadFilterConfig {
    int min_mapq = 0;              ///< Minimum mapping quality
    bool skip_duplicates = false;  ///< Drop PCR/optical duplicates (0x400)
    bool skip_secondary = false;   ///< Drop secondary and supplementary alignments
    bool skip_qcfail = false;      ///< Drop reads failing vendor QC (0x200)
};

/**
 * @brief Extracts AlignedRead fields from BAM records.
 * 
 * Thread-safe: This class is stateless and can be used from multiple threads.
 */
class ReadParser {
public:
    explicit ReadParser(const ReadFilterConfig& config = {});
    
    /**
     * @brief Checks if a read passes all filtering criteria.
     * 
     * Unmapped records are always rejected; the other checks follow the
     * configuration.
     */
    bool should_keep(const bam1_t* b) const;
    
    /**
     * @brief Converts a BAM record to the fields used for read-start counting.
     *
     * position is converted from htslib's 0-based pos to 1-based.
     * query_width is the stored sequence length, or the CIGAR query length
     * when SEQ is '*'.
     */
    static AlignedRead parse(const bam1_t* b);
    
    /**
     * @brief Determines strand orientation from BAM FLAG.
     * 
     * @param b BAM record.
     * @return Strand::FORWARD if on positive strand, Strand::REVERSE if on negative strand.
     */
    static Strand determine_strand(const bam1_t* b);
    
    const ReadFilterConfig& get_config() const { return config_; }

private:
    ReadFilterConfig config_;
};

} // namespace CentiPrep
