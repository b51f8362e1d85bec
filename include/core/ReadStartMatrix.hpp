#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace CentiPrep {

/**
 * @brief Sites x positions matrix of read-start counts.
 *
 * Rows are added one site at a time and packed into an Eigen matrix by
 * finalize(). Every row has 2L columns for a window of length L: forward
 * strand counts in [0, L), reverse strand counts in [L, 2L).
 *
 * Row names are the "chrom:start-end" identifiers of the windows.
 */
class ReadStartMatrix {
public:
    ReadStartMatrix() = default;

    /**
     * @brief Appends a row.
     * @return Row index.
     * @throws MatrixShapeError if the width differs from earlier rows or is odd.
     * @throws std::runtime_error after finalize().
     */
    int add_row(const std::string& name, std::vector<int32_t> counts);

    /**
     * @brief Packs all rows into the count matrix. Idempotent.
     */
    void finalize();

    /**
     * @brief Count matrix (rows = sites, cols = 2 * window length).
     */
    const Eigen::MatrixXi& get_matrix() const { return matrix_; }

    const std::vector<std::string>& get_row_names() const { return row_names_; }

    int num_rows() const { return static_cast<int>(row_names_.size()); }
    int num_cols() const { return width_; }

    /// L, the number of genomic positions per strand.
    int window_length() const { return width_ / 2; }

    bool is_finalized() const { return finalized_; }

    /**
     * @brief Total forward (or reverse) read starts in one row.
     */
    int64_t strand_total(int row, bool reverse) const;

    void clear();

private:
    std::vector<std::string> row_names_;
    std::vector<std::vector<int32_t>> pending_rows_;
    Eigen::MatrixXi matrix_;
    int width_ = 0;
    bool finalized_ = false;
};

}  // namespace CentiPrep
