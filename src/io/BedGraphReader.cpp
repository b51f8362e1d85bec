#include "io/BedGraphReader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace CentiPrep {

std::vector<ScoredRegion> BedGraphReader::read(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open bedGraph file: " + path);
    }
    return read(ifs, path);
}

std::vector<ScoredRegion> BedGraphReader::read(std::istream& in, const std::string& source_name) {
    std::vector<ScoredRegion> regions;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 5, "track") == 0 || line.compare(0, 7, "browser") == 0) continue;

        std::istringstream iss(line);
        std::string chrom;
        int64_t start = 0;
        int64_t end = 0;
        double score = 0.0;
        std::string extra;

        if (!(iss >> chrom >> start >> end >> score) || (iss >> extra)) {
            throw FormatError(source_name + ":" + std::to_string(line_num) +
                              ": expected 4 columns (chrom, start, end, score)");
        }
        if (start < 0 || end <= start) {
            throw FormatError(source_name + ":" + std::to_string(line_num) + ": invalid interval " +
                              std::to_string(start) + "-" + std::to_string(end));
        }

        ScoredRegion sr;
        // 0-based half-open -> 1-based closed
        sr.region = Region(chrom, start + 1, end);
        sr.score = score;
        regions.push_back(std::move(sr));
    }

    LOG_DEBUG("Loaded " + std::to_string(regions.size()) + " bedGraph intervals from " + source_name);
    return regions;
}

}  // namespace CentiPrep
