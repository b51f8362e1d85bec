#pragma once

#include <cstdint>
#include <vector>

#include "core/DataStructs.hpp"

namespace CentiPrep {

/**
 * @brief Pads each motif span symmetrically to form the read query window.
 *
 * window = [start - flank, end + flank]. Windows are not clamped to the
 * chromosome; one that runs off either end is passed through and simply
 * collects fewer (or no) reads.
 */
class WindowExpander {
public:
    static constexpr int64_t kDefaultFlankSize = 100;

    /**
     * @throws std::invalid_argument if flank_size is negative.
     */
    explicit WindowExpander(int64_t flank_size = kDefaultFlankSize);

    std::vector<SiteWindow> expand(const std::vector<MotifSite>& sites) const;

    Region widen(const Region& region) const;

    int64_t flank_size() const { return flank_size_; }

private:
    int64_t flank_size_;
};

}  // namespace CentiPrep
