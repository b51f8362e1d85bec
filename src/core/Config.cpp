#include "core/Config.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <htslib/hts.h>
#include <htslib/sam.h>

namespace CentiPrep {

bool Config::validate() const {
    bool valid = true;

    if (bam_path.empty()) {
        std::cerr << "Error: BAM path is required." << std::endl;
        valid = false;
    } else {
        // Verify if it's a valid BAM/CRAM/SAM
        samFile* fp = sam_open(bam_path.c_str(), "r");
        if (fp == NULL) {
            std::cerr << "Error: Cannot open BAM file: " << bam_path << std::endl;
            valid = false;
        } else if (hts_get_format(fp)->format != bam && hts_get_format(fp)->format != cram) {
            // Plain text opens as headerless SAM, which cannot be indexed
            std::cerr << "Error: Not a BAM or CRAM file: " << bam_path << std::endl;
            valid = false;
            sam_close(fp);
        } else {
            sam_hdr_t* hdr = sam_hdr_read(fp);
            if (hdr == NULL) {
                std::cerr << "Error: Cannot read header from BAM file." << std::endl;
                valid = false;
            } else {
                sam_hdr_destroy(hdr);

                hts_idx_t* idx = sam_index_load(fp, bam_path.c_str());
                if (idx == NULL) {
                    std::cerr << "Warning: BAM index not found. It will be built before querying." << std::endl;
                } else {
                    hts_idx_destroy(idx);
                }
            }
            sam_close(fp);
        }
    }

    if (motif_path.empty()) {
        std::cerr << "Error: Motif table path is required." << std::endl;
        valid = false;
    } else {
        std::ifstream ifs(motif_path);
        if (!ifs.is_open()) {
            std::cerr << "Error: Cannot open motif table: " << motif_path << std::endl;
            valid = false;
        }
    }

    if (log10p_threshold < 0.0) {
        std::cerr << "Error: log10p_threshold must be non-negative." << std::endl;
        valid = false;
    }

    if (flank_size < 0) {
        std::cerr << "Error: flank_size must be non-negative." << std::endl;
        valid = false;
    }

    if (min_mapq < 0 || min_mapq > 255) {
        std::cerr << "Error: min_mapq must be between 0 and 255." << std::endl;
        valid = false;
    }

    if (threads < 1) {
        std::cerr << "Error: threads must be at least 1." << std::endl;
        valid = false;
    }

    return valid;
}

std::string Config::get_output_prefix() const {
    if (!output_prefix.empty()) {
        return output_prefix;
    }
    std::filesystem::path p(motif_path);
    std::string stem = p.stem().string();
    return stem.empty() ? "centiprep" : stem;
}

void Config::print() const {
    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "BAM: " << bam_path << std::endl;
    std::cout << "Motif table: " << motif_path << std::endl;
    std::cout << "Motif filter: " << (motif_id.empty() ? "None" : motif_id) << std::endl;
    std::cout << "Output Dir: " << output_dir << std::endl;
    std::cout << "Output Prefix: " << get_output_prefix() << std::endl;
    std::cout << "log10(p) threshold: " << log10p_threshold << std::endl;
    std::cout << "Flank Size: " << flank_size << " bp" << std::endl;
    std::cout << "Min MapQ: " << min_mapq << std::endl;
    std::cout << "Skip duplicates/secondary/qcfail: " << skip_duplicates << "/" << skip_secondary << "/"
              << skip_qcfail << std::endl;
    std::cout << "Threads: " << threads << std::endl;
    std::cout << "---------------------" << std::endl;
}

} // namespace CentiPrep
