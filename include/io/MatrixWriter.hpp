#pragma once

#include <ostream>
#include <string>

#include "core/FootprintPipeline.hpp"

namespace CentiPrep {

/**
 * @brief Writes a pipeline result to disk.
 *
 * Output files:
 * ```
 * output/
 *   <prefix>.matrix.tsv    # region_id, then 2L read-start counts per row
 *   <prefix>.regions.tsv   # site metadata, one row per matrix row
 * ```
 * The matrix header names forward columns f0..f{L-1} and reverse columns
 * r0..r{L-1}; fN and rN refer to the same window offset.
 */
class MatrixWriter {
public:
    /**
     * @param output_dir Created if it does not exist.
     * @throws std::runtime_error if the directory cannot be created.
     */
    MatrixWriter(const std::string& output_dir, const std::string& prefix);

    /**
     * @brief Writes both files.
     * @throws std::runtime_error on an I/O failure.
     */
    void write(const CentipedeData& data) const;

    static void write_matrix(std::ostream& out, const ReadStartMatrix& matrix);
    static void write_regions(std::ostream& out, const CentipedeData& data);

    std::string matrix_path() const;
    std::string regions_path() const;

private:
    std::string output_dir_;
    std::string prefix_;
};

}  // namespace CentiPrep
