#include "io/MatrixWriter.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace CentiPrep {

MatrixWriter::MatrixWriter(const std::string& output_dir, const std::string& prefix)
    : output_dir_(output_dir), prefix_(prefix) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + output_dir_ + ": " + ec.message());
    }
}

std::string MatrixWriter::matrix_path() const {
    return (std::filesystem::path(output_dir_) / (prefix_ + ".matrix.tsv")).string();
}

std::string MatrixWriter::regions_path() const {
    return (std::filesystem::path(output_dir_) / (prefix_ + ".regions.tsv")).string();
}

void MatrixWriter::write_matrix(std::ostream& out, const ReadStartMatrix& matrix) {
    const Eigen::MatrixXi& counts = matrix.get_matrix();
    const std::vector<std::string>& names = matrix.get_row_names();
    int len = matrix.window_length();

    out << "region";
    for (int i = 0; i < len; ++i) out << "\tf" << i;
    for (int i = 0; i < len; ++i) out << "\tr" << i;
    out << "\n";

    for (int r = 0; r < counts.rows(); ++r) {
        out << names[r];
        for (int c = 0; c < counts.cols(); ++c) {
            out << "\t" << counts(r, c);
        }
        out << "\n";
    }
}

void MatrixWriter::write_regions(std::ostream& out, const CentipedeData& data) {
    out << "sequence_name\tstart\tstop\tmotif_id\tstrand\tscore\tp_value\tq_value\tmatched_sequence\twindow\n";
    for (size_t i = 0; i < data.regions.size(); ++i) {
        const MotifSite& s = data.regions[i];
        out << s.region.chrom << "\t" << s.region.start << "\t" << s.region.end << "\t" << s.motif_id << "\t"
            << s.strand << "\t" << s.score << "\t" << s.p_value << "\t";
        if (std::isnan(s.q_value)) {
            out << "NA";
        } else {
            out << s.q_value;
        }
        out << "\t" << s.matched_sequence << "\t" << RegionCodec::format(data.windows[i]) << "\n";
    }
}

void MatrixWriter::write(const CentipedeData& data) const {
    std::string mpath = matrix_path();
    std::ofstream mout(mpath);
    if (!mout.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + mpath);
    }
    write_matrix(mout, data.matrix);
    mout.close();
    if (mout.fail()) {
        throw std::runtime_error("Failed to write " + mpath);
    }

    std::string rpath = regions_path();
    std::ofstream rout(rpath);
    if (!rout.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + rpath);
    }
    write_regions(rout, data);
    rout.close();
    if (rout.fail()) {
        throw std::runtime_error("Failed to write " + rpath);
    }

    LOG_INFO("Wrote " + std::to_string(data.matrix.num_rows()) + " x " + std::to_string(data.matrix.num_cols()) +
             " matrix to " + mpath);
    LOG_INFO("Wrote site metadata to " + rpath);
}

}  // namespace CentiPrep
