#pragma once

#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/DataStructs.hpp"
#include "core/ReadParser.hpp"
#include "core/ReadStartMatrix.hpp"

namespace CentiPrep {

/**
 * @brief Output of one pipeline run.
 *
 * matrix row i, regions[i] and windows[i] describe the same site; rows are
 * in genomic order of the windows.
 */
struct CentipedeData {
    ReadStartMatrix matrix;
    std::vector<MotifSite> regions;  ///< Site metadata with the original motif span
    std::vector<Region> windows;     ///< Widened window of each row

    size_t size() const { return regions.size(); }
};

/**
 * @brief Counts reported by print_summary().
 */
struct PipelineStats {
    size_t num_matches = 0;          ///< Rows read from the motif table
    size_t num_sites = 0;            ///< Sites after significance filter and deduplication
    size_t num_windows_with_reads = 0;
    size_t num_zero_rows = 0;        ///< Sites without a read start inside the window
    int64_t total_forward = 0;       ///< Forward read starts counted
    int64_t total_reverse = 0;       ///< Reverse read starts counted
    bool index_built = false;
    double elapsed_ms = 0.0;
};

/**
 * @brief Runs motif selection and read-start counting for one BAM and one
 *        motif table.
 *
 * Stages, each fully materialized before the next:
 * 1. Read the FIMO table and select significant, unique sites
 * 2. Widen each site by the flank
 * 3. Ensure the BAM index exists and query each window
 * 4. Join the query results back to their sites and sort them
 * 5. Count read starts per site (OpenMP when threads > 1)
 *
 * Any fatal condition throws; no partial result is returned.
 */
class FootprintPipeline {
public:
    explicit FootprintPipeline(const Config& config);

    /**
     * @brief Runs all stages on the configured files.
     * @throws NoSignificantMatchesError, NoOverlapError, ReconciliationError,
     *         FormatError, IndexError, MatrixShapeError.
     */
    CentipedeData run();

    /**
     * @brief Builds the matrix and metadata from reconciled sites.
     *
     * @throws MatrixShapeError if windows differ in length.
     * @throws ReconciliationError if row and metadata counts diverge.
     */
    static CentipedeData build_matrix(const std::vector<ReconciledSite>& sites, int num_threads = 1);

    const PipelineStats& get_stats() const { return stats_; }

    /**
     * @brief Logs the processing summary.
     */
    void print_summary() const;

private:
    std::string bam_path_;
    std::string motif_path_;
    std::string motif_id_;
    double log10p_threshold_;
    int64_t flank_size_;
    int num_threads_;
    ReadFilterConfig filter_config_;

    PipelineStats stats_;
};

}  // namespace CentiPrep
