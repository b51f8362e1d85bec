#pragma once

#include <sys/resource.h>

#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace CentiPrep {
namespace Utils {

/**
 * @brief Wall-clock timer plus memory usage for progress reports.
 *
 * With jemalloc the currently allocated bytes are reported, otherwise the
 * process peak resident set size from getrusage().
 */
class ResourceMonitor {
public:
    ResourceMonitor() {
        reset();
    }

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    // Returns memory in bytes
    size_t get_memory_usage() const {
        size_t bytes = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // epoch needs to be advanced to get up-to-date stats
        uint64_t epoch = 1;
        mallctl("epoch", &epoch, &sz, &epoch, sizeof(epoch));
        if (mallctl("stats.allocated", &bytes, &sz, NULL, 0) != 0) {
            bytes = 0;
        }
#else
        struct rusage usage;
        if (getrusage(RUSAGE_SELF, &usage) == 0) {
            bytes = static_cast<size_t>(usage.ru_maxrss) * 1024;  // ru_maxrss is in KB on Linux
        }
#endif
        return bytes;
    }

    std::string format_stats(const std::string& label = "Execution") const {
        std::ostringstream ss;
        ss << "[" << label << "] Time: " << std::fixed << std::setprecision(4) << get_elapsed_seconds() << " s";
#ifdef USE_JEMALLOC
        ss << ", Allocated: ";
#else
        ss << ", Peak RSS: ";
#endif
        ss << std::fixed << std::setprecision(2) << (get_memory_usage() / 1024.0 / 1024.0) << " MB";
        return ss.str();
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace Utils
} // namespace CentiPrep
