#include "core/ReadStartAggregator.hpp"

#include <stdexcept>

namespace CentiPrep {

int64_t ReadStartAggregator::true_start(const AlignedRead& read) {
    if (read.strand == Strand::REVERSE) {
        return read.position + read.query_width;
    }
    return read.position;
}

int64_t ReadStartAggregator::column_index(const Region& window, const AlignedRead& read) {
    int64_t start = true_start(read);
    if (!window.contains(start)) {
        return -1;
    }
    int64_t offset = start - window.start;
    if (read.strand == Strand::REVERSE) {
        offset += window.length();
    }
    return offset;
}

std::vector<int32_t> ReadStartAggregator::aggregate(const Region& window, const std::vector<AlignedRead>& reads) {
    if (window.length() <= 0) {
        throw std::invalid_argument("Empty window: " + window.chrom);
    }
    std::vector<int32_t> row(static_cast<size_t>(2 * window.length()), 0);
    for (const auto& read : reads) {
        int64_t j = column_index(window, read);
        if (j >= 0) {
            row[static_cast<size_t>(j)]++;
        }
    }
    return row;
}

}  // namespace CentiPrep
