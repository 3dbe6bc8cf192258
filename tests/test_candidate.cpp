#include <gtest/gtest.h>
#include "codonbeam/candidate.hpp"

#include <array>

using namespace codonbeam;

namespace {

Candidate build(std::string_view dna, bool track_sixmers = true) {
    Candidate c;
    for (size_t i = 0; i + 3 <= dna.length(); i += 3) {
        c = c.extend(*packCodon(dna.substr(i, 3)), 1.0, i / 3, track_sixmers);
    }
    return c;
}

} // namespace

TEST(CandidateTest, EmptyCandidate) {
    Candidate c;
    EXPECT_TRUE(c.empty());
    EXPECT_EQ(c.length(), 0);
    EXPECT_EQ(c.baseCount(), 0);
    EXPECT_EQ(c.runBase(), -1);
    EXPECT_EQ(c.runLength(), 0);
    EXPECT_DOUBLE_EQ(c.score(), 0.0);
    EXPECT_EQ(c.dna(), "");
}

TEST(CandidateTest, ExtendAccumulates) {
    Candidate root;
    auto a = root.extend(*packCodon("ATG"), 0.5, 7, true);
    auto b = a.extend(*packCodon("AAA"), 1.25, 3, true);

    EXPECT_EQ(b.length(), 2);
    EXPECT_EQ(b.baseCount(), 6);
    EXPECT_DOUBLE_EQ(b.score(), 1.75);
    EXPECT_EQ(b.ordinal(), 3);
    EXPECT_EQ(b.dna(), "ATGAAA");
    EXPECT_EQ(b.lastCodon(), *packCodon("AAA"));
}

TEST(CandidateTest, ExtendLeavesParentUntouched) {
    auto parent = build("ATGAAA");
    auto left = parent.extend(*packCodon("ACC"), 1.0, 0, true);
    auto right = parent.extend(*packCodon("ACG"), 2.0, 1, true);

    EXPECT_EQ(parent.dna(), "ATGAAA");
    EXPECT_EQ(parent.length(), 2);
    EXPECT_EQ(left.dna(), "ATGAAAACC");
    EXPECT_EQ(right.dna(), "ATGAAAACG");
}

TEST(CandidateTest, TrailingRun) {
    auto c = build("CAAAAA");
    EXPECT_EQ(c.runBase(), 0);
    EXPECT_EQ(c.runLength(), 5);

    auto d = build("AAAAAG");
    EXPECT_EQ(d.runBase(), 2);
    EXPECT_EQ(d.runLength(), 1);
}

TEST(CandidateTest, RecentBases) {
    EXPECT_EQ(build("ATG").recentBases(), 0b001110u);
}

TEST(CandidateTest, SixmerTracking) {
    // ATGAAA -> 00 11 10 00 00 00
    constexpr uint16_t atgaaa = 0b001110000000;

    auto tracked = build("ATGAAA");
    EXPECT_TRUE(tracked.hasSixmer(atgaaa));

    auto untracked = build("ATGAAA", false);
    EXPECT_FALSE(untracked.hasSixmer(atgaaa));

    // Fewer than 6 bases records nothing
    EXPECT_FALSE(build("ATG").hasSixmer(0));
}

TEST(CandidateTest, CodonsFromEnd) {
    auto c = build("ATGAAAACC");

    std::array<CodonIndex, 2> last{};
    c.codonsFromEnd(last);
    EXPECT_EQ(last[0], *packCodon("AAA"));
    EXPECT_EQ(last[1], *packCodon("ACC"));
}

TEST(CandidateTest, Tail) {
    auto c = build("ATGAAAACC");
    EXPECT_EQ(c.tail(1), "ACC");
    EXPECT_EQ(c.tail(2), "AAAACC");
    EXPECT_EQ(c.tail(10), "ATGAAAACC");
    EXPECT_EQ(c.tail(0), "");
}

TEST(CandidateTest, RanksBefore) {
    Candidate root;
    auto high = root.extend(0, 2.0, 5, false);
    auto low = root.extend(0, 1.0, 0, false);
    auto high_early = root.extend(1, 2.0, 1, false);

    EXPECT_TRUE(ranksBefore(high, low));
    EXPECT_FALSE(ranksBefore(low, high));
    EXPECT_TRUE(ranksBefore(high_early, high));
    EXPECT_FALSE(ranksBefore(high, high));
}

TEST(CandidateTest, LongChainReleases) {
    Candidate c;
    for (size_t i = 0; i < 200000; ++i) {
        c = c.extend(static_cast<CodonIndex>(i % 64), 0.0, i, false);
    }
    EXPECT_EQ(c.length(), 200000);
    c = Candidate();
    EXPECT_TRUE(c.empty());
}
