#include <gtest/gtest.h>
#include "codonbeam/analysis.hpp"
#include "codonbeam/log.hpp"

#include <sstream>

using namespace codonbeam;

// ============================================================================
// Composition Tests
// ============================================================================

TEST(AnalysisTest, GCContent) {
    EXPECT_DOUBLE_EQ(analysis::gcContent("GGCC"), 1.0);
    EXPECT_DOUBLE_EQ(analysis::gcContent("ATGC"), 0.5);
    EXPECT_DOUBLE_EQ(analysis::gcContent("AATT"), 0.0);
    EXPECT_DOUBLE_EQ(analysis::gcContent(""), 0.0);
}

TEST(AnalysisTest, LongestHomopolymer) {
    EXPECT_EQ(analysis::longestHomopolymer(""), 0);
    EXPECT_EQ(analysis::longestHomopolymer("A"), 1);
    EXPECT_EQ(analysis::longestHomopolymer("ATGAAAACC"), 4);
    EXPECT_EQ(analysis::longestHomopolymer("ACGTTTTT"), 5);
}

TEST(AnalysisTest, CpGRatio) {
    EXPECT_DOUBLE_EQ(analysis::cpgRatio("A"), 0.0);
    EXPECT_DOUBLE_EQ(analysis::cpgRatio("AAAA"), 0.0);
    // 2 CpG, C=2, G=2, length 4: 2 / (4 / 4)
    EXPECT_DOUBLE_EQ(analysis::cpgRatio("CGCG"), 2.0);
}

// ============================================================================
// Repeat Tests
// ============================================================================

TEST(AnalysisTest, RepeatedKmers) {
    auto repeats = analysis::repeatedKmers("ATGATGC", 3);
    ASSERT_EQ(repeats.size(), 1);
    EXPECT_EQ(repeats[0].kmer, "ATG");
    EXPECT_EQ(repeats[0].positions, (std::vector<size_t>{0, 3}));
}

TEST(AnalysisTest, RepeatedKmersOverlapping) {
    auto repeats = analysis::repeatedKmers("AAAAAAA", 6);
    ASSERT_EQ(repeats.size(), 1);
    EXPECT_EQ(repeats[0].positions.size(), 2);
}

TEST(AnalysisTest, RepeatedKmersNone) {
    EXPECT_TRUE(analysis::repeatedKmers("ATGAAAACC", 6).empty());
    EXPECT_TRUE(analysis::repeatedKmers("ACG", 6).empty());
}

TEST(AnalysisTest, RepeatedKmersZeroKThrows) {
    EXPECT_THROW((void)analysis::repeatedKmers("ACGT", 0), std::invalid_argument);
}

// ============================================================================
// Report Tests
// ============================================================================

TEST(AnalysisTest, SummarizeCleanSequence) {
    ExclusionSet exclusions = ExclusionSet::parse("GAATTC\n");
    auto report = analysis::summarize("ATGAAAACC", exclusions);

    EXPECT_EQ(report.length, 9);
    EXPECT_EQ(report.longest_homopolymer, 4);
    EXPECT_EQ(report.repeated_sixmers, 0);
    EXPECT_TRUE(report.motif_hits.empty());
    EXPECT_TRUE(report.clean(4));
    EXPECT_FALSE(report.clean(3));
}

TEST(AnalysisTest, SummarizeFindsProblems) {
    ExclusionSet exclusions = ExclusionSet::parse("GAATTC\n");
    auto report = analysis::summarize("GAATTCGAATTC", exclusions);

    EXPECT_EQ(report.motif_hits.size(), 2);
    EXPECT_GT(report.repeated_sixmers, 0);
    EXPECT_FALSE(report.clean(4));
}

// ============================================================================
// Logging Tests
// ============================================================================

TEST(LoggerTest, ThresholdFiltersMessages) {
    std::ostringstream out;
    Logger log(out, LogLevel::Warn);

    log.error("bad");
    log.warn("careful");
    log.info("hidden");
    log.debug("hidden");

    EXPECT_EQ(out.str(), "[error] bad\n[warn] careful\n");
    EXPECT_TRUE(log.enabled(LogLevel::Error));
    EXPECT_FALSE(log.enabled(LogLevel::Info));
}

TEST(LoggerTest, SetThreshold) {
    std::ostringstream out;
    Logger log(out, LogLevel::Error);
    log.setThreshold(LogLevel::Debug);
    log.debug("x");
    EXPECT_EQ(out.str(), "[debug] x\n");
}

TEST(LoggerTest, FormatDuration) {
    using std::chrono::duration;
    using Ms = duration<double, std::milli>;

    EXPECT_EQ(formatDuration(Ms(12.34)), "12.3 ms");
    EXPECT_EQ(formatDuration(Ms(3200.0)), "3.2 s");
    EXPECT_EQ(formatDuration(Ms(250000.0)), "4m 10s");
    EXPECT_EQ(formatDuration(Ms(3723000.0)), "1h 2m 3s");
    EXPECT_EQ(formatDuration(Ms(-5.0)), "0.0 ms");
}
