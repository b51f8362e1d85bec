#include "core/BamReader.hpp"

#include <htslib/hfile.h>

#include <algorithm>
#include <stdexcept>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace CentiPrep {

BamReader::BamReader(const std::string &bam_path, const ReadFilterConfig &filter, int n_threads)
    : bam_path_(bam_path), fp_(nullptr), hdr_(nullptr), idx_(nullptr), parser_(filter) {
    // Open BAM file
    fp_ = sam_open(bam_path.c_str(), "r");
    if (!fp_) {
        throw std::runtime_error("Failed to open BAM file: " + bam_path);
    }

    // Set decompression threads if requested
    if (n_threads > 1) {
        if (hts_set_threads(fp_, n_threads) != 0) {
            sam_close(fp_);
            throw std::runtime_error("Failed to set threads for BAM: " + bam_path);
        }
    }

    // Read header
    hdr_ = sam_hdr_read(fp_);
    if (!hdr_) {
        sam_close(fp_);
        throw std::runtime_error("Failed to read BAM header: " + bam_path);
    }

    // Load index
    idx_ = sam_index_load(fp_, bam_path.c_str());
    if (!idx_) {
        bam_hdr_destroy(hdr_);
        sam_close(fp_);
        throw std::runtime_error("Failed to load BAM index (.bai): " + bam_path);
    }
}

BamReader::~BamReader() {
    if (idx_) hts_idx_destroy(idx_);
    if (hdr_) bam_hdr_destroy(hdr_);
    if (fp_) sam_close(fp_);
}

BamReader::BamReader(BamReader &&other) noexcept
    : bam_path_(std::move(other.bam_path_)),
      fp_(other.fp_),
      hdr_(other.hdr_),
      idx_(other.idx_),
      parser_(other.parser_) {
    other.fp_ = nullptr;
    other.hdr_ = nullptr;
    other.idx_ = nullptr;
}

BamReader &BamReader::operator=(BamReader &&other) noexcept {
    if (this != &other) {
        // Clean up current resources
        if (idx_) hts_idx_destroy(idx_);
        if (hdr_) bam_hdr_destroy(hdr_);
        if (fp_) sam_close(fp_);

        // Move from other
        bam_path_ = std::move(other.bam_path_);
        fp_ = other.fp_;
        hdr_ = other.hdr_;
        idx_ = other.idx_;
        parser_ = other.parser_;

        other.fp_ = nullptr;
        other.hdr_ = nullptr;
        other.idx_ = nullptr;
    }
    return *this;
}

bool BamReader::has_index(const std::string &bam_path) {
    samFile *fp = sam_open(bam_path.c_str(), "r");
    if (!fp) {
        return false;
    }
    hts_idx_t *idx = sam_index_load(fp, bam_path.c_str());
    bool found = (idx != nullptr);
    if (idx) hts_idx_destroy(idx);
    sam_close(fp);
    return found;
}

std::string BamReader::index_path(const std::string &bam_path) {
    hFILE *hf = hopen(bam_path.c_str(), "r");
    if (!hf) {
        throw IndexError("Failed to open alignment file: " + bam_path);
    }
    htsFormat fmt;
    int ret = hts_detect_format(hf, &fmt);
    if (hclose(hf) != 0 || ret < 0) {
        throw IndexError("Failed to detect format of " + bam_path);
    }
    if (fmt.format == cram) {
        return bam_path + ".crai";
    }
    if (fmt.format != bam) {
        throw IndexError("Not a BAM or CRAM file, cannot be indexed: " + bam_path);
    }
    return bam_path + ".bai";
}

bool BamReader::ensure_index(const std::string &bam_path, int n_threads) {
    samFile *fp = sam_open(bam_path.c_str(), "r");
    if (!fp) {
        throw IndexError("Failed to open BAM file for indexing: " + bam_path);
    }
    sam_close(fp);
    std::string idx_path = index_path(bam_path);

    if (has_index(bam_path)) {
        LOG_DEBUG("BAM index found for " + bam_path);
        return false;
    }

    LOG_INFO("Indexing the BAM file... this may take several minutes.");
    // min_shift 0 writes a .bai next to a BAM, a .crai next to a CRAM
    int ret = sam_index_build3(bam_path.c_str(), nullptr, 0, std::max(1, n_threads));
    if (ret != 0) {
        throw IndexError("Failed to build BAM index for " + bam_path + " (htslib code " + std::to_string(ret) +
                         "); is the file coordinate-sorted?");
    }
    LOG_INFO("Index written: " + idx_path);
    return true;
}

std::vector<AlignedRead> BamReader::fetch_reads(const Region &window) {
    std::vector<AlignedRead> reads;

    if (!fp_ || !hdr_ || !idx_) {
        return reads;  // Not initialized
    }

    int tid = sam_hdr_name2tid(hdr_, window.chrom.c_str());
    if (tid < 0) {
        LOG_DEBUG("Chromosome not in BAM header: " + window.chrom);
        return reads;
    }
    if (window.end < 1) {
        return reads;  // Window lies entirely before the chromosome
    }

    // 1-based closed -> 0-based half-open; only the query is clipped at 0
    hts_pos_t beg = std::max<hts_pos_t>(0, window.start - 1);
    hts_pos_t end = window.end;

    hts_itr_t *iter = sam_itr_queryi(idx_, tid, beg, end);
    if (!iter) {
        return reads;
    }

    bam1_t *b = bam_init1();
    int ret;
    while ((ret = sam_itr_next(fp_, iter, b)) >= 0) {
        if (parser_.should_keep(b)) {
            reads.push_back(ReadParser::parse(b));
        }
    }

    bam_destroy1(b);
    hts_itr_destroy(iter);

    // ret < -1 indicates a truncated or corrupt file
    if (ret < -1) {
        throw std::runtime_error("Error reading BAM records in " + RegionCodec::format(window) + " from " +
                                 bam_path_);
    }

    return reads;
}

std::vector<RegionReads> BamReader::overlapping_reads(const std::vector<Region> &windows) {
    std::vector<RegionReads> results;
    results.reserve(windows.size());

    size_t with_reads = 0;
    size_t total_reads = 0;
    for (const auto &window : windows) {
        RegionReads rr;
        rr.region_id = RegionCodec::format(window);
        rr.reads = fetch_reads(window);
        if (!rr.reads.empty()) {
            with_reads++;
            total_reads += rr.reads.size();
        }
        results.push_back(std::move(rr));
    }

    LOG_INFO("Queried " + std::to_string(windows.size()) + " windows: " + std::to_string(with_reads) +
             " with reads, " + std::to_string(total_reads) + " reads total");
    return results;
}

}  // namespace CentiPrep
