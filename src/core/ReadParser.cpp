#include "core/ReadParser.hpp"

namespace CentiPrep {

ReadParser::ReadParser(const ReadFilterConfig& config) : config_(config) {
}

Strand ReadParser::determine_strand(const bam1_t* b) {
    // Check BAM_FREVERSE flag (0x10) to determine strand
    if (b->core.flag & BAM_FREVERSE) {
        return Strand::REVERSE;
    }
    return Strand::FORWARD;
}

bool ReadParser::should_keep(const bam1_t* b) const {
    uint16_t flag = b->core.flag;
    if (flag & BAM_FUNMAP) {
        return false;
    }
    if (config_.skip_secondary && (flag & (BAM_FSECONDARY | BAM_FSUPPLEMENTARY))) {
        return false;
    }
    if (config_.skip_duplicates && (flag & BAM_FDUP)) {
        return false;
    }
    if (config_.skip_qcfail && (flag & BAM_FQCFAIL)) {
        return false;
    }
    if (b->core.qual < config_.min_mapq) {
        return false;
    }
    return true;
}

AlignedRead ReadParser::parse(const bam1_t* b) {
    AlignedRead read;
    read.position = static_cast<int64_t>(b->core.pos) + 1;
    read.strand = determine_strand(b);
    read.query_width = b->core.l_qseq;
    if (read.query_width == 0 && b->core.n_cigar > 0) {
        read.query_width = static_cast<int32_t>(bam_cigar2qlen(b->core.n_cigar, bam_get_cigar(b)));
    }
    return read;
}

}  // namespace CentiPrep
