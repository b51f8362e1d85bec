#pragma once

#include <istream>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"

namespace CentiPrep {

/**
 * @brief Reads 4-column bedGraph files (chrom, start, end, score).
 *
 * The file is 0-based half-open; returned regions are 1-based closed,
 * i.e. start + 1 and end unchanged. "track" and "browser" lines and '#'
 * comments are skipped.
 */
class BedGraphReader {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     * @throws FormatError on a malformed line.
     */
    static std::vector<ScoredRegion> read(const std::string& path);

    static std::vector<ScoredRegion> read(std::istream& in, const std::string& source_name);
};

}  // namespace CentiPrep
