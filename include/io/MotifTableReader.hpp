#pragma once

#include <istream>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"

namespace CentiPrep {

/**
 * @brief Reads the tab-delimited match table produced by FIMO.
 *
 * Columns are located by header name rather than by position, so both the
 * classic layout ("#pattern name", "sequence name", "p-value", ...) and the
 * current one ("motif_id", "sequence_name", "p-value", ...) are accepted.
 * Header names are normalized: leading '#' removed, lower-cased, and
 * ' ', '-', '.' replaced with '_'.
 *
 * Required columns: sequence_name, start, stop, score, p_value.
 * Optional columns: motif_id, motif_alt_id, strand, q_value, matched_sequence.
 */
class MotifTableReader {
public:
    /**
     * @param motif_filter If non-empty, keep only rows whose motif_id or
     *        motif_alt_id equals this value.
     */
    explicit MotifTableReader(const std::string& motif_filter = "");

    /**
     * @brief Loads all matches from a file.
     * @throws std::runtime_error if the file cannot be opened.
     * @throws FormatError on a missing required column or malformed field.
     */
    std::vector<MotifMatch> read(const std::string& path) const;

    /**
     * @brief Loads matches from an already opened stream.
     * @param source_name Used in error messages only.
     */
    std::vector<MotifMatch> read(std::istream& in, const std::string& source_name) const;

    /**
     * @brief Normalizes a header field, e.g. "#pattern name" -> "pattern_name".
     */
    static std::string normalize_column_name(const std::string& name);

private:
    std::string motif_filter_;
};

}  // namespace CentiPrep
