#include "io/MotifTableReader.hpp"

#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace CentiPrep {

namespace {

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss(line);
    while (std::getline(iss, field, '\t')) {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == '\t') {
        fields.emplace_back();
    }
    return fields;
}

std::string location(const std::string& source, int line_num) {
    return source + ":" + std::to_string(line_num);
}

int64_t to_int(const std::string& field, const std::string& column, const std::string& where) {
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(field, &consumed);
    } catch (const std::exception&) {
        throw FormatError(where + ": column '" + column + "' is not an integer: '" + field + "'");
    }
    if (consumed != field.size()) {
        throw FormatError(where + ": column '" + column + "' is not an integer: '" + field + "'");
    }
    return static_cast<int64_t>(value);
}

double to_double(const std::string& field, const std::string& column, const std::string& where) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(field, &consumed);
    } catch (const std::exception&) {
        throw FormatError(where + ": column '" + column + "' is not a number: '" + field + "'");
    }
    if (consumed != field.size()) {
        throw FormatError(where + ": column '" + column + "' is not a number: '" + field + "'");
    }
    return value;
}

}  // namespace

MotifTableReader::MotifTableReader(const std::string& motif_filter) : motif_filter_(motif_filter) {
}

std::string MotifTableReader::normalize_column_name(const std::string& name) {
    std::string out;
    size_t begin = 0;
    while (begin < name.size() && (name[begin] == '#' || std::isspace(static_cast<unsigned char>(name[begin])))) {
        begin++;
    }
    size_t end = name.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(name[end - 1]))) {
        end--;
    }

    for (size_t i = begin; i < end; ++i) {
        char c = name[i];
        if (c == ' ' || c == '-' || c == '.') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    // Classic FIMO header used "pattern name" for the motif column
    if (out == "pattern_name") {
        return "motif_id";
    }
    return out;
}

std::vector<MotifMatch> MotifTableReader::read(const std::string& path) const {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open motif table: " + path);
    }
    LOG_INFO("Loading motif matches from: " + path);
    return read(ifs, path);
}

std::vector<MotifMatch> MotifTableReader::read(std::istream& in, const std::string& source_name) const {
    std::vector<MotifMatch> matches;
    std::map<std::string, size_t> columns;

    std::string line;
    int line_num = 0;
    bool have_header = false;
    int skipped_motif = 0;

    while (std::getline(in, line)) {
        line_num++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        if (!have_header) {
            std::vector<std::string> names = split_tabs(line);
            for (size_t i = 0; i < names.size(); ++i) {
                columns[normalize_column_name(names[i])] = i;
            }
            for (const char* required : {"sequence_name", "start", "stop", "score", "p_value"}) {
                if (columns.find(required) == columns.end()) {
                    throw FormatError(location(source_name, line_num) + ": missing required column '" +
                                      required + "'");
                }
            }
            have_header = true;
            continue;
        }

        // FIMO appends provenance comments after the data rows
        if (line[0] == '#') continue;

        std::vector<std::string> fields = split_tabs(line);
        std::string where = location(source_name, line_num);

        auto field = [&](const char* name) -> const std::string* {
            auto it = columns.find(name);
            if (it == columns.end() || it->second >= fields.size()) {
                return nullptr;
            }
            return &fields[it->second];
        };

        for (const char* required : {"sequence_name", "start", "stop", "score", "p_value"}) {
            if (!field(required)) {
                throw FormatError(where + ": expected " + std::to_string(columns.size()) + " columns, found " +
                                  std::to_string(fields.size()));
            }
        }

        MotifMatch m;
        if (const std::string* f = field("motif_id")) m.motif_id = *f;
        if (const std::string* f = field("motif_alt_id")) m.motif_alt_id = *f;

        if (!motif_filter_.empty() && m.motif_id != motif_filter_ && m.motif_alt_id != motif_filter_) {
            skipped_motif++;
            continue;
        }

        m.sequence_name = *field("sequence_name");
        m.start = to_int(*field("start"), "start", where);
        m.stop = to_int(*field("stop"), "stop", where);
        m.score = to_double(*field("score"), "score", where);
        m.p_value = to_double(*field("p_value"), "p_value", where);

        if (const std::string* f = field("q_value")) {
            if (!f->empty()) {
                m.q_value = to_double(*f, "q_value", where);
            }
        }
        if (const std::string* f = field("strand")) {
            if (!f->empty()) m.strand = (*f)[0];
        }
        if (const std::string* f = field("matched_sequence")) m.matched_sequence = *f;

        if (m.sequence_name.empty()) {
            throw FormatError(where + ": empty sequence_name");
        }
        if (m.stop < m.start) {
            throw FormatError(where + ": stop precedes start");
        }

        matches.push_back(std::move(m));
    }

    if (!have_header) {
        throw FormatError("Motif table is empty: " + source_name);
    }

    if (!motif_filter_.empty()) {
        LOG_INFO("Motif filter '" + motif_filter_ + "' kept " + std::to_string(matches.size()) + " rows, skipped " +
                 std::to_string(skipped_motif));
    }
    LOG_INFO("Loaded " + std::to_string(matches.size()) + " motif matches from " + source_name);
    return matches;
}

}  // namespace CentiPrep
