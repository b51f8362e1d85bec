#pragma once

#include <string>
#include <vector>
#include <htslib/sam.h>

#include "core/DataStructs.hpp"
#include "core/ReadParser.hpp"

namespace CentiPrep {

/**
 * @brief RAII wrapper for BAM file reading with HTSlib.
 * 
 * Queries the reads overlapping a set of windows and reduces each record to
 * the fields read-start counting needs (AlignedRead). Each thread should
 * maintain its own instance to avoid file pointer contention.
 * 
 * Usage:
 *   BamReader::ensure_index("sample.bam");
 *   BamReader reader("sample.bam");
 *   auto results = reader.overlapping_reads(windows);
 */
class BamReader {
public:
    /**
     * @brief Constructs a BAM reader for the specified file.
     * @param bam_path Path to the BAM file (index must already exist).
     * @param filter Read filters applied to every query.
     * @param n_threads Number of decompression threads (default 1).
     * @throws std::runtime_error if file cannot be opened or indexed.
     */
    explicit BamReader(const std::string& bam_path, const ReadFilterConfig& filter = {}, int n_threads = 1);
    
    /**
     * @brief Destructor - releases all HTSlib resources.
     */
    ~BamReader();
    
    // Disable copy, allow move
    BamReader(const BamReader&) = delete;
    BamReader& operator=(const BamReader&) = delete;
    BamReader(BamReader&&) noexcept;
    BamReader& operator=(BamReader&&) noexcept;

    /**
     * @brief Makes sure an index (.bai/.crai) exists next to the alignment file.
     *
     * Must be called once before any BamReader is constructed for the file.
     *
     * @return false if an index was already present, true if one was built.
     * @throws IndexError if the file cannot be opened or indexing fails.
     */
    static bool ensure_index(const std::string& bam_path, int n_threads = 1);

    /**
     * @brief Path of the index htslib builds for the file.
     *
     * `<path>.bai` for BAM, `<path>.crai` for CRAM.
     * @throws IndexError if the file is missing or neither BAM nor CRAM.
     */
    static std::string index_path(const std::string& bam_path);

    /**
     * @brief Checks whether htslib can load an index for the file.
     */
    static bool has_index(const std::string& bam_path);
    
    /**
     * @brief Fetches all reads overlapping a window.
     * 
     * @param window 1-based closed window. Parts before position 1 or past
     *        the chromosome end simply contain no reads.
     * @return Reads passing the filter. Empty if the chromosome is not in
     *         the header.
     * @throws std::runtime_error on a decoding error while iterating.
     */
    std::vector<AlignedRead> fetch_reads(const Region& window);

    /**
     * @brief Fetches reads for many windows, preserving query order.
     *
     * Returns exactly one entry per window, empty reads included.
     * Each entry's region_id is RegionCodec::format(window).
     */
    std::vector<RegionReads> overlapping_reads(const std::vector<Region>& windows);
    
    /**
     * @brief Gets the BAM header for chromosome name lookups.
     * @return Pointer to the BAM header (valid until BamReader is destroyed).
     */
    const bam_hdr_t* get_header() const { return hdr_; }
    
    /**
     * @brief Checks if the BAM file was successfully opened.
     * @return true if file is open and ready for queries.
     */
    bool is_open() const { return fp_ != nullptr; }
    
    /**
     * @brief Gets the path of the opened BAM file.
     */
    const std::string& get_path() const { return bam_path_; }

private:
    std::string bam_path_;
    samFile* fp_;
    bam_hdr_t* hdr_;
    hts_idx_t* idx_;
    ReadParser parser_;
};

} // namespace CentiPrep
