#include "core/FootprintPipeline.hpp"

#include <chrono>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "core/BamReader.hpp"
#include "core/Errors.hpp"
#include "core/ReadStartAggregator.hpp"
#include "core/ResultReconciler.hpp"
#include "core/SiteSelector.hpp"
#include "core/WindowExpander.hpp"
#include "io/MotifTableReader.hpp"
#include "utils/Logger.hpp"

namespace CentiPrep {

FootprintPipeline::FootprintPipeline(const Config& config)
    : bam_path_(config.bam_path),
      motif_path_(config.motif_path),
      motif_id_(config.motif_id),
      log10p_threshold_(config.log10p_threshold),
      flank_size_(config.flank_size),
      num_threads_(config.threads) {
    filter_config_.min_mapq = config.min_mapq;
    filter_config_.skip_duplicates = config.skip_duplicates;
    filter_config_.skip_secondary = config.skip_secondary;
    filter_config_.skip_qcfail = config.skip_qcfail;

    std::stringstream ss;
    ss << "FootprintPipeline initialized:\n"
       << "  Threads: " << num_threads_ << "\n"
       << "  log10(p) threshold: " << log10p_threshold_ << "\n"
       << "  Flank size: " << flank_size_ << " bp";
    if (filter_config_.min_mapq > 0) {
        ss << "\n  Min MAPQ: " << filter_config_.min_mapq;
    }
    LOG_INFO(ss.str());
}

CentipedeData FootprintPipeline::run() {
    auto t_start = std::chrono::steady_clock::now();
    stats_ = PipelineStats();

    std::vector<SiteWindow> windows;
    {
        Utils::ScopedLogger scope("Site selection");
        MotifTableReader reader(motif_id_);
        std::vector<MotifMatch> matches = reader.read(motif_path_);
        stats_.num_matches = matches.size();

        SiteSelector selector(log10p_threshold_);
        std::vector<MotifSite> sites = selector.select(matches, motif_path_);
        stats_.num_sites = sites.size();

        WindowExpander expander(flank_size_);
        windows = expander.expand(sites);
    }

    std::vector<RegionReads> results;
    {
        Utils::ScopedLogger scope("Read query");
        stats_.index_built = BamReader::ensure_index(bam_path_, num_threads_);

        BamReader bam(bam_path_, filter_config_, num_threads_);
        std::vector<Region> queries;
        queries.reserve(windows.size());
        for (const auto& sw : windows) {
            queries.push_back(sw.window);
        }
        results = bam.overlapping_reads(queries);
    }

    size_t total_reads = 0;
    for (const auto& rr : results) {
        total_reads += rr.reads.size();
        if (!rr.reads.empty()) {
            stats_.num_windows_with_reads++;
        }
    }
    if (total_reads == 0) {
        LOG_ERROR("No reads overlap any of " + std::to_string(windows.size()) + " windows; check that " + bam_path_ +
                  " and " + motif_path_ + " use the same genome build");
        throw NoOverlapError(motif_path_);
    }

    ResultReconciler reconciler(motif_path_);
    std::vector<ReconciledSite> reconciled = reconciler.reconcile(windows, std::move(results));

    CentipedeData data;
    {
        Utils::ScopedLogger scope("Read-start counting");
        data = build_matrix(reconciled, num_threads_);
    }

    for (int r = 0; r < data.matrix.num_rows(); ++r) {
        int64_t fwd = data.matrix.strand_total(r, false);
        int64_t rev = data.matrix.strand_total(r, true);
        stats_.total_forward += fwd;
        stats_.total_reverse += rev;
        if (fwd + rev == 0) {
            stats_.num_zero_rows++;
        }
    }

    auto t_end = std::chrono::steady_clock::now();
    stats_.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();
    return data;
}

CentipedeData FootprintPipeline::build_matrix(const std::vector<ReconciledSite>& sites, int num_threads) {
    std::vector<std::vector<int32_t>> rows(sites.size());

    // Row order is fixed by `sites`; each iteration writes only its own row
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic, 64) num_threads(num_threads) if (num_threads > 1)
#endif
    for (long i = 0; i < static_cast<long>(sites.size()); ++i) {
        rows[i] = ReadStartAggregator::aggregate(sites[i].site_window.window, sites[i].reads);
    }
#ifndef _OPENMP
    (void)num_threads;
#endif

    CentipedeData data;
    data.regions.reserve(sites.size());
    data.windows.reserve(sites.size());
    for (size_t i = 0; i < sites.size(); ++i) {
        data.matrix.add_row(sites[i].region_id, std::move(rows[i]));
        data.regions.push_back(sites[i].site_window.site);
        data.windows.push_back(sites[i].site_window.window);
        LOG_DEBUG(sites[i].region_id + ": " + std::to_string(sites[i].reads.size()) + " overlapping reads");
    }
    data.matrix.finalize();

    if (static_cast<size_t>(data.matrix.num_rows()) != data.regions.size()) {
        throw ReconciliationError("Matrix has " + std::to_string(data.matrix.num_rows()) + " rows but " +
                                  std::to_string(data.regions.size()) + " regions");
    }
    return data;
}

void FootprintPipeline::print_summary() const {
    std::stringstream ss;
    ss << "\n=== Processing Summary ===\n"
       << "Motif table rows: " << stats_.num_matches << "\n"
       << "Selected sites: " << stats_.num_sites << "\n"
       << "Sites with overlapping reads: " << stats_.num_windows_with_reads << "\n"
       << "Sites without read starts (zero rows): " << stats_.num_zero_rows << "\n"
       << "Read starts counted: " << (stats_.total_forward + stats_.total_reverse) << "\n"
       << "  Forward strand (+): " << stats_.total_forward << "\n"
       << "  Reverse strand (-): " << stats_.total_reverse << "\n";
    if (stats_.index_built) {
        ss << "BAM index built: yes\n";
    }
    ss << "Total processing time: " << stats_.elapsed_ms << " ms";
    LOG_INFO(ss.str());
}

}  // namespace CentiPrep
