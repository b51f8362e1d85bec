#pragma once

#include <cstdint>

namespace CentiPrep {

/**
 * @brief Strand orientation of a read.
 * 
 * Determined by BAM FLAG bit 0x10 (BAM_FREVERSE):
 * - FORWARD: Read maps to the forward/positive strand
 * - REVERSE: Read maps to the reverse/negative strand
 */
enum class Strand : uint8_t {
    FORWARD = 0,  ///< Forward strand (+)
    REVERSE = 1   ///< Reverse strand (-)
};

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,    ///< Only errors
    LOG_WARN = 1,     ///< Errors and warnings
    LOG_INFO = 2,     ///< Normal operational messages
    LOG_DEBUG = 3     ///< Detailed debug output including per-site counts
};

} // namespace CentiPrep
