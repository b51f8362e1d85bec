#include "core/ReadStartMatrix.hpp"

#include <stdexcept>

#include "core/Errors.hpp"

namespace CentiPrep {

int ReadStartMatrix::add_row(const std::string& name, std::vector<int32_t> counts) {
    if (finalized_) {
        throw std::runtime_error("ReadStartMatrix::add_row: Cannot add rows after finalize()");
    }
    if (counts.empty() || counts.size() % 2 != 0) {
        throw MatrixShapeError("Row " + name + " has " + std::to_string(counts.size()) +
                               " columns; expected an even, non-zero width");
    }

    int width = static_cast<int>(counts.size());
    if (row_names_.empty()) {
        width_ = width;
    } else if (width != width_) {
        throw MatrixShapeError("Row " + name + " has " + std::to_string(width) + " columns but earlier rows have " +
                               std::to_string(width_) + "; all motif windows must have the same length");
    }

    int row_id = static_cast<int>(row_names_.size());
    row_names_.push_back(name);
    pending_rows_.push_back(std::move(counts));
    return row_id;
}

void ReadStartMatrix::finalize() {
    if (finalized_) {
        return;  // Already finalized
    }

    int num_rows = static_cast<int>(pending_rows_.size());
    matrix_ = Eigen::MatrixXi::Zero(num_rows, width_);
    for (int r = 0; r < num_rows; ++r) {
        const std::vector<int32_t>& row = pending_rows_[r];
        for (int c = 0; c < width_; ++c) {
            matrix_(r, c) = row[c];
        }
    }

    pending_rows_.clear();
    finalized_ = true;
}

int64_t ReadStartMatrix::strand_total(int row, bool reverse) const {
    if (!finalized_) {
        throw std::runtime_error("ReadStartMatrix::strand_total: call finalize() first");
    }
    int len = window_length();
    return matrix_.row(row).segment(reverse ? len : 0, len).cast<int64_t>().sum();
}

void ReadStartMatrix::clear() {
    row_names_.clear();
    pending_rows_.clear();
    matrix_.resize(0, 0);
    width_ = 0;
    finalized_ = false;
}

}  // namespace CentiPrep
