#include "core/WindowExpander.hpp"

#include <stdexcept>
#include <string>

namespace CentiPrep {

WindowExpander::WindowExpander(int64_t flank_size) : flank_size_(flank_size) {
    if (flank_size_ < 0) {
        throw std::invalid_argument("flank_size must be non-negative, got " + std::to_string(flank_size_));
    }
}

Region WindowExpander::widen(const Region& region) const {
    return Region(region.chrom, region.start - flank_size_, region.end + flank_size_);
}

std::vector<SiteWindow> WindowExpander::expand(const std::vector<MotifSite>& sites) const {
    std::vector<SiteWindow> windows;
    windows.reserve(sites.size());
    for (const auto& site : sites) {
        SiteWindow sw;
        sw.site = site;
        sw.window = widen(site.region);
        windows.push_back(std::move(sw));
    }
    return windows;
}

}  // namespace CentiPrep
