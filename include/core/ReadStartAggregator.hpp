#pragma once

#include <cstdint>
#include <vector>

#include "core/DataStructs.hpp"

namespace CentiPrep {

/**
 * @brief Tabulates read 5' starts inside a window, split by strand.
 *
 * For a window of length L the row has 2L columns. Column i counts forward
 * reads starting at window.start + i; column L + i counts reverse reads
 * starting at the same position.
 *
 * The 5' start of a forward read is its position. A reverse read stores its
 * leftmost coordinate, so its start is position + query_width.
 */
class ReadStartAggregator {
public:
    /**
     * @brief 5' start coordinate of a read (1-based).
     */
    static int64_t true_start(const AlignedRead& read);

    /**
     * @brief Column of a read start within a window row, or -1 if the start
     *        lies outside the window.
     */
    static int64_t column_index(const Region& window, const AlignedRead& read);

    /**
     * @brief Builds the count row for one window.
     *
     * Reads whose start falls outside the window are ignored. With no
     * qualifying read the row is all zeros.
     */
    static std::vector<int32_t> aggregate(const Region& window, const std::vector<AlignedRead>& reads);
};

}  // namespace CentiPrep
