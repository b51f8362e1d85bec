#include "core/Region.hpp"

#include <cctype>
#include <sstream>

#include "core/Errors.hpp"

namespace CentiPrep {

namespace {

int64_t parse_coordinate(const std::string& field, const std::string& text) {
    if (field.empty() || std::isspace(static_cast<unsigned char>(field[0]))) {
        throw FormatError("Invalid region '" + text + "': bad coordinate '" + field + "'");
    }
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(field, &consumed);
    } catch (const std::exception&) {
        throw FormatError("Invalid region '" + text + "': non-numeric coordinate '" + field + "'");
    }
    if (consumed != field.size()) {
        throw FormatError("Invalid region '" + text + "': non-numeric coordinate '" + field + "'");
    }
    return static_cast<int64_t>(value);
}

}  // namespace

Region RegionCodec::parse(const std::string& text) {
    size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0) {
        throw FormatError("Invalid region '" + text + "': expected chrom:start-end");
    }

    std::string chrom = text.substr(0, colon);
    std::string coords = text.substr(colon + 1);

    // Search from index 1 so a negative start keeps its sign
    size_t dash = coords.find('-', 1);
    if (coords.empty() || dash == std::string::npos) {
        throw FormatError("Invalid region '" + text + "': expected start-end");
    }

    std::string start_str = coords.substr(0, dash);
    std::string end_str = coords.substr(dash + 1);
    if (end_str.find('-') != std::string::npos) {
        throw FormatError("Invalid region '" + text + "': too many '-' separators");
    }

    Region region(chrom, parse_coordinate(start_str, text), parse_coordinate(end_str, text));
    if (region.end < region.start) {
        throw FormatError("Invalid region '" + text + "': end precedes start");
    }
    return region;
}

std::string RegionCodec::format(const Region& region) {
    std::ostringstream ss;
    ss << region.chrom << ":" << region.start << "-" << region.end;
    return ss.str();
}

}  // namespace CentiPrep
