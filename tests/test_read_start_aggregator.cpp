#include <gtest/gtest.h>

#include <numeric>
#include <vector>

#include "core/ReadStartAggregator.hpp"

using namespace CentiPrep;

namespace {

AlignedRead fwd(int64_t pos, int32_t width = 10) {
    AlignedRead r;
    r.position = pos;
    r.strand = Strand::FORWARD;
    r.query_width = width;
    return r;
}

AlignedRead rev(int64_t pos, int32_t width = 10) {
    AlignedRead r;
    r.position = pos;
    r.strand = Strand::REVERSE;
    r.query_width = width;
    return r;
}

}  // namespace

TEST(ReadStartAggregatorTest, TrueStartDependsOnStrand) {
    EXPECT_EQ(ReadStartAggregator::true_start(fwd(95, 36)), 95);
    EXPECT_EQ(ReadStartAggregator::true_start(rev(115, 10)), 125);
}

TEST(ReadStartAggregatorTest, MotifScenarioRow) {
    // Motif chr1:100-120 with flank 5 -> window 95-125, L = 31
    Region window("chr1", 95, 125);
    std::vector<AlignedRead> reads = {fwd(95), rev(115, 10)};

    auto row = ReadStartAggregator::aggregate(window, reads);
    ASSERT_EQ(row.size(), 62u);
    EXPECT_EQ(row[0], 1);
    EXPECT_EQ(row[61], 1);
    EXPECT_EQ(std::accumulate(row.begin(), row.end(), 0), 2);
}

TEST(ReadStartAggregatorTest, NoReadsGivesZeroRow) {
    Region window("chr1", 95, 125);
    auto row = ReadStartAggregator::aggregate(window, {});
    ASSERT_EQ(row.size(), 62u);
    EXPECT_EQ(std::accumulate(row.begin(), row.end(), 0), 0);
}

TEST(ReadStartAggregatorTest, ReadsStartingOutsideWindowAreIgnored) {
    Region window("chr1", 95, 125);
    std::vector<AlignedRead> reads = {
        fwd(94),       // one base before the window
        fwd(126),      // one base after
        rev(90, 4),    // start 94
        rev(120, 6),   // start 126
        rev(80, 20),   // overlaps the window but starts at 100 -> counted
    };
    auto row = ReadStartAggregator::aggregate(window, reads);
    ASSERT_EQ(row.size(), 62u);
    EXPECT_EQ(std::accumulate(row.begin(), row.end(), 0), 1);
    EXPECT_EQ(row[31 + 5], 1);
}

TEST(ReadStartAggregatorTest, WindowEdgesAreInclusive) {
    Region window("chr1", 95, 125);
    std::vector<AlignedRead> reads = {fwd(95), fwd(125), rev(85, 10), rev(115, 10)};
    auto row = ReadStartAggregator::aggregate(window, reads);
    EXPECT_EQ(row[0], 1);
    EXPECT_EQ(row[30], 1);
    EXPECT_EQ(row[31], 1);
    EXPECT_EQ(row[61], 1);
}

TEST(ReadStartAggregatorTest, CountsStack) {
    Region window("chr1", 1, 10);
    std::vector<AlignedRead> reads = {fwd(3), fwd(3), fwd(3), rev(1, 2), rev(2, 1)};
    auto row = ReadStartAggregator::aggregate(window, reads);
    ASSERT_EQ(row.size(), 20u);
    EXPECT_EQ(row[2], 3);
    EXPECT_EQ(row[10 + 2], 2);
}

TEST(ReadStartAggregatorTest, OppositeStrandColumnsShareOffset) {
    Region window("chr5", 1000, 1019);
    const int64_t len = window.length();
    for (int64_t c = 0; c < len; ++c) {
        int64_t pos = window.start + c;
        EXPECT_EQ(ReadStartAggregator::column_index(window, fwd(pos)), c);
        // A reverse read whose 5' end is at the same position
        EXPECT_EQ(ReadStartAggregator::column_index(window, rev(pos - 10, 10)), c + len);
    }
}

TEST(ReadStartAggregatorTest, ColumnIndexOutsideWindowIsNegative) {
    Region window("chr1", 10, 20);
    EXPECT_EQ(ReadStartAggregator::column_index(window, fwd(9)), -1);
    EXPECT_EQ(ReadStartAggregator::column_index(window, rev(15, 6)), -1);
}

TEST(ReadStartAggregatorTest, WindowBeforeChromosomeStart) {
    // Unclamped window; only starts >= 1 can occur but the layout is unchanged
    Region window("chr1", -4, 5);
    auto row = ReadStartAggregator::aggregate(window, {fwd(1)});
    ASSERT_EQ(row.size(), 20u);
    EXPECT_EQ(row[5], 1);
}
