#include <gtest/gtest.h>

#include <vector>

#include "core/Errors.hpp"
#include "core/ResultReconciler.hpp"
#include "core/WindowExpander.hpp"

using namespace CentiPrep;

namespace {

SiteWindow make_window(const std::string& chrom, int64_t start, int64_t end, double score, int64_t flank = 5) {
    MotifSite s;
    s.region = Region(chrom, start, end);
    s.score = score;
    s.p_value = 1e-6;
    s.q_value = 0.01;
    return WindowExpander(flank).expand({s}).front();
}

RegionReads make_result(const Region& window, int n_reads) {
    RegionReads rr;
    rr.region_id = RegionCodec::format(window);
    for (int i = 0; i < n_reads; ++i) {
        AlignedRead r;
        r.position = window.start + i;
        rr.reads.push_back(r);
    }
    return rr;
}

}  // namespace

TEST(ResultReconcilerTest, SortsByGenomicCoordinateAndKeepsPairs) {
    std::vector<SiteWindow> windows = {
        make_window("chr2", 100, 120, 1.0),
        make_window("chr1", 500, 520, 2.0),
        make_window("chr1", 100, 120, 3.0),
    };
    // Query order follows the windows; read counts tag each result
    std::vector<RegionReads> results = {
        make_result(windows[0].window, 1),
        make_result(windows[1].window, 2),
        make_result(windows[2].window, 3),
    };

    auto joined = ResultReconciler("fimo.tsv").reconcile(windows, results);
    ASSERT_EQ(joined.size(), 3u);

    EXPECT_EQ(joined[0].site_window.site.region, Region("chr1", 100, 120));
    EXPECT_EQ(joined[0].reads.size(), 3u);
    EXPECT_DOUBLE_EQ(joined[0].site_window.site.score, 3.0);

    EXPECT_EQ(joined[1].site_window.site.region, Region("chr1", 500, 520));
    EXPECT_EQ(joined[1].reads.size(), 2u);

    EXPECT_EQ(joined[2].site_window.site.region, Region("chr2", 100, 120));
    EXPECT_EQ(joined[2].reads.size(), 1u);

    for (const auto& rs : joined) {
        EXPECT_EQ(rs.region_id, RegionCodec::format(rs.site_window.window));
    }
}

TEST(ResultReconcilerTest, EmptyResultsKeepTheirSites) {
    std::vector<SiteWindow> windows = {
        make_window("chr1", 100, 120, 1.0),
        make_window("chr1", 300, 320, 2.0),
        make_window("chr1", 500, 520, 3.0),
    };
    std::vector<RegionReads> results = {
        make_result(windows[0].window, 4),
        make_result(windows[1].window, 0),
        make_result(windows[2].window, 1),
    };

    auto joined = ResultReconciler("fimo.tsv").reconcile(windows, results);
    ASSERT_EQ(joined.size(), 3u);
    EXPECT_EQ(joined[0].reads.size(), 4u);
    EXPECT_EQ(joined[1].site_window.site.region.start, 300);
    EXPECT_TRUE(joined[1].reads.empty());
    EXPECT_DOUBLE_EQ(joined[1].site_window.site.score, 2.0);
    EXPECT_EQ(joined[2].reads.size(), 1u);
}

TEST(ResultReconcilerTest, MissingResultIsReconciliationError) {
    std::vector<SiteWindow> windows = {
        make_window("chr1", 100, 120, 1.0),
        make_window("chr1", 300, 320, 2.0),
    };
    // A site whose window never came back must not be dropped silently
    std::vector<RegionReads> results = {make_result(windows[0].window, 1)};
    try {
        ResultReconciler("sites.fimo").reconcile(windows, results);
        FAIL() << "Expected ReconciliationError";
    } catch (const ReconciliationError& e) {
        EXPECT_NE(std::string(e.what()).find("2 regions and 1 in bam"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("sites.fimo"), std::string::npos);
    }
}

TEST(ResultReconcilerTest, RecoversMetadataLostInIdentifier) {
    std::vector<SiteWindow> windows = {make_window("chr1", 100, 120, 7.5)};
    windows[0].site.q_value = 0.123;
    windows[0].site.matched_sequence = "ACGT";

    auto joined = ResultReconciler("f").reconcile(windows, {make_result(windows[0].window, 1)});
    ASSERT_EQ(joined.size(), 1u);
    EXPECT_DOUBLE_EQ(joined[0].site_window.site.q_value, 0.123);
    EXPECT_EQ(joined[0].site_window.site.matched_sequence, "ACGT");
    EXPECT_EQ(joined[0].site_window.window, Region("chr1", 95, 125));
}

TEST(ResultReconcilerTest, UnknownResultIsReconciliationError) {
    std::vector<SiteWindow> windows = {make_window("chr1", 100, 120, 1.0)};
    RegionReads stray = make_result(Region("chr1", 1000, 1030), 1);
    try {
        ResultReconciler("sites.fimo").reconcile(windows, {stray});
        FAIL() << "Expected ReconciliationError";
    } catch (const ReconciliationError& e) {
        EXPECT_NE(std::string(e.what()).find("sites.fimo"), std::string::npos);
    }
}

TEST(ResultReconcilerTest, DuplicateResultIsReconciliationError) {
    std::vector<SiteWindow> windows = {make_window("chr1", 100, 120, 1.0)};
    std::vector<RegionReads> results = {make_result(windows[0].window, 1), make_result(windows[0].window, 1)};
    EXPECT_THROW(ResultReconciler("f").reconcile(windows, results), ReconciliationError);
}

TEST(ResultReconcilerTest, DuplicateWindowIsReconciliationError) {
    std::vector<SiteWindow> windows = {make_window("chr1", 100, 120, 1.0), make_window("chr1", 100, 120, 2.0)};
    EXPECT_THROW(ResultReconciler("f").reconcile(windows, {}), ReconciliationError);
}

TEST(ResultReconcilerTest, MalformedIdentifierIsFormatError) {
    std::vector<SiteWindow> windows = {make_window("chr1", 100, 120, 1.0)};
    RegionReads bad;
    bad.region_id = "chr1_95_125";
    EXPECT_THROW(ResultReconciler("f").reconcile(windows, {bad}), FormatError);
}

TEST(ResultReconcilerTest, NegativeWindowStartRoundTrips) {
    std::vector<SiteWindow> windows = {make_window("chr1", 3, 10, 1.0, 100)};
    ASSERT_EQ(windows[0].window.start, -97);
    auto joined = ResultReconciler("f").reconcile(windows, {make_result(windows[0].window, 2)});
    ASSERT_EQ(joined.size(), 1u);
    EXPECT_EQ(joined[0].region_id, "chr1:-97-110");
}
