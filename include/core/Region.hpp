#pragma once

#include <cstdint>
#include <string>
#include <tuple>
#include <utility>

namespace CentiPrep {

/**
 * @brief A genomic interval, 1-based and closed on both ends.
 *
 * All modules share this convention. Readers convert at the file boundary
 * (bedGraph is 0-based half-open, htslib records are 0-based) and nowhere else.
 */
struct Region {
    std::string chrom;
    int64_t start = 0;  ///< 1-based, inclusive
    int64_t end = 0;    ///< 1-based, inclusive

    Region() = default;
    Region(std::string c, int64_t s, int64_t e) : chrom(std::move(c)), start(s), end(e) {}

    /// Number of positions covered, end - start + 1.
    int64_t length() const { return end - start + 1; }

    bool contains(int64_t pos) const { return pos >= start && pos <= end; }
};

inline bool operator==(const Region& a, const Region& b) {
    return a.chrom == b.chrom && a.start == b.start && a.end == b.end;
}

inline bool operator!=(const Region& a, const Region& b) {
    return !(a == b);
}

/// Genomic coordinate order: chrom (byte-wise), then start, then end.
inline bool operator<(const Region& a, const Region& b) {
    return std::tie(a.chrom, a.start, a.end) < std::tie(b.chrom, b.start, b.end);
}

/**
 * @brief Converts between Region and its "chrom:start-end" identifier.
 *
 * The identifier is the key that ties alignment query results back to the
 * site metadata.
 */
class RegionCodec {
public:
    /**
     * @brief Parses "chrom:start-end".
     *
     * Splits on the first ':' and then on the '-' that separates the two
     * coordinates. A leading '-' on start is read as a sign so that windows
     * extending past the chromosome start still round-trip.
     *
     * @throws FormatError if either split does not give two parts, a
     *         coordinate is not an integer, or end < start.
     */
    static Region parse(const std::string& text);

    /**
     * @brief Formats a region as "chrom:start-end".
     */
    static std::string format(const Region& region);
};

} // namespace CentiPrep
