#pragma once

#include <htslib/kstring.h>
#include <htslib/sam.h>
#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace CentiPrep {
namespace Testing {

/**
 * @brief Creates a unique scratch directory and removes it on destruction.
 */
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "centiprep_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed for " + tmpl);
        }
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const {
        return (std::filesystem::path(path_) / name).string();
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

inline void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot write " + path);
    }
    ofs << content;
}

/// Two chromosomes, coordinate sorted.
inline const char* default_sam_header() {
    return "@HD\tVN:1.6\tSO:coordinate\n"
           "@SQ\tSN:chr1\tLN:10000\n"
           "@SQ\tSN:chr2\tLN:5000\n";
}

/**
 * @brief Writes a BAM file from SAM text records (must be coordinate sorted).
 */
inline void write_bam(const std::string& path, const std::vector<std::string>& records,
                      const std::string& header_text = default_sam_header()) {
    samFile* out = sam_open(path.c_str(), "wb");
    if (!out) {
        throw std::runtime_error("Cannot create BAM " + path);
    }
    sam_hdr_t* hdr = sam_hdr_parse(header_text.size(), header_text.c_str());
    if (!hdr || sam_hdr_write(out, hdr) < 0) {
        if (hdr) sam_hdr_destroy(hdr);
        sam_close(out);
        throw std::runtime_error("Cannot write BAM header to " + path);
    }

    bam1_t* b = bam_init1();
    kstring_t ks = {0, 0, nullptr};
    for (const auto& rec : records) {
        ks.l = 0;
        kputs(rec.c_str(), &ks);
        if (sam_parse1(&ks, hdr, b) < 0 || sam_write1(out, hdr, b) < 0) {
            free(ks.s);
            bam_destroy1(b);
            sam_hdr_destroy(hdr);
            sam_close(out);
            throw std::runtime_error("Cannot write SAM record: " + rec);
        }
    }

    free(ks.s);
    bam_destroy1(b);
    sam_hdr_destroy(hdr);
    if (sam_close(out) != 0) {
        throw std::runtime_error("Cannot close BAM " + path);
    }
}

/**
 * @brief A 10 bp SAM record on the given strand at a 1-based position.
 */
inline std::string sam_record(const std::string& name, const std::string& chrom, long pos, bool reverse,
                              int mapq = 60, int extra_flags = 0) {
    int flag = (reverse ? 16 : 0) | extra_flags;
    return name + "\t" + std::to_string(flag) + "\t" + chrom + "\t" + std::to_string(pos) + "\t" +
           std::to_string(mapq) + "\t10M\t*\t0\t0\tACGTACGTAC\tIIIIIIIIII";
}

inline const char* fimo_header() {
    return "motif_id\tmotif_alt_id\tsequence_name\tstart\tstop\tstrand\tscore\tp-value\tq-value\tmatched_sequence\n";
}

inline std::string fimo_row(const std::string& chrom, long start, long stop, double score, const std::string& p,
                            const std::string& motif = "MA0139.1") {
    return motif + "\tCTCF\t" + chrom + "\t" + std::to_string(start) + "\t" + std::to_string(stop) + "\t+\t" +
           std::to_string(score) + "\t" + p + "\t0.01\tCCGCGNGGNGGCAG\n";
}

}  // namespace Testing
}  // namespace CentiPrep
