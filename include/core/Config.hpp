#pragma once

#include <cstdint>
#include <iostream>
#include <string>

#include "Types.hpp"

namespace CentiPrep {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Stores paths to input/output files and the selection thresholds.
 * Validated by both CLI11 (basic checks) and internal validate() method (complex logic).
 */
struct Config {
    // Input/Output
    std::string bam_path;               ///< Path to aligned reads, BAM (Required)
    std::string motif_path;             ///< Path to FIMO match table (Required)
    std::string output_dir = "output";  ///< Output directory for results
    std::string output_prefix;          ///< File prefix; defaults to the motif file stem
    std::string motif_id;               ///< Keep only this motif from the table (Optional)

    // Site selection
    double log10p_threshold = 4.0;  ///< Keep matches with -log10(p) above this
    int64_t flank_size = 100;       ///< Bases added on each side of the motif

    // Read filters (all off by default)
    int min_mapq = 0;              ///< Minimum Mapping Quality to count a read
    bool skip_duplicates = false;  ///< Ignore reads flagged as duplicates
    bool skip_secondary = false;   ///< Ignore secondary/supplementary alignments
    bool skip_qcfail = false;      ///< Ignore reads failing QC

    int threads = 1;  ///< Threads for BAM decompression and per-site counting

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file;                     ///< Also append log lines here (Optional)

    /**
     * @brief Validates configuration logic and file formats.
     *
     * Performs checks that CLI11 cannot handle, such as:
     * - Value ranges that depend on each other
     * - BAM header verification using htslib (a missing index is only a
     *   warning; it is built before querying)
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print() const;

    /**
     * @brief Returns the effective output file prefix.
     */
    std::string get_output_prefix() const;
};

}  // namespace CentiPrep
