#include <gtest/gtest.h>
#include "codonbeam/codon_table.hpp"

#include <set>

using namespace codonbeam;

// ============================================================================
// Packing Tests
// ============================================================================

TEST(CodonPackingTest, PackIsLexicographic) {
    EXPECT_EQ(packCodon("AAA"), CodonIndex{0});
    EXPECT_EQ(packCodon("AAC"), CodonIndex{1});
    EXPECT_EQ(packCodon("ATG"), CodonIndex{14});
    EXPECT_EQ(packCodon("TTT"), CodonIndex{63});
}

TEST(CodonPackingTest, PackRejectsMalformedTriplets) {
    EXPECT_FALSE(packCodon("AT").has_value());
    EXPECT_FALSE(packCodon("ATGC").has_value());
    EXPECT_FALSE(packCodon("ANG").has_value());
}

TEST(CodonPackingTest, UnpackInvertsPack) {
    for (int i = 0; i < 64; ++i) {
        auto codon = static_cast<CodonIndex>(i);
        EXPECT_EQ(packCodon(unpackCodon(codon)), codon);
    }
}

TEST(CodonPackingTest, ReverseComplement) {
    EXPECT_EQ(reverseComplement("GGTCTC"), "GAGACC");
    EXPECT_EQ(reverseComplement("GAATTC"), "GAATTC");
    EXPECT_EQ(reverseComplement("acgt"), "ACGT");
    EXPECT_EQ(reverseComplement("RYN"), "NRY");
    EXPECT_EQ(reverseComplement(""), "");
}

// ============================================================================
// Synonym Tests
// ============================================================================

TEST(CodonTableTest, SynonymsOfSingleCodonResidues) {
    const auto& table = CodonTable::standard();

    ASSERT_EQ(table.synonyms('M').size(), 1);
    EXPECT_EQ(table.synonyms('M')[0], "ATG");
    ASSERT_EQ(table.synonyms('W').size(), 1);
    EXPECT_EQ(table.synonyms('W')[0], "TGG");
}

TEST(CodonTableTest, SynonymsAreSorted) {
    const auto& table = CodonTable::standard();

    std::vector<std::string> expected{"CTA", "CTC", "CTG", "CTT", "TTA", "TTG"};
    EXPECT_EQ(table.synonyms('L'), expected);

    std::vector<std::string> stops{"TAA", "TAG", "TGA"};
    EXPECT_EQ(table.synonyms('*'), stops);
}

TEST(CodonTableTest, SynonymIndicesMatchSynonyms) {
    const auto& table = CodonTable::standard();

    for (char aa : kResidueAlphabet) {
        auto indices = table.synonymIndices(aa);
        const auto& codons = table.synonyms(aa);
        ASSERT_EQ(indices.size(), codons.size());
        for (size_t i = 0; i < codons.size(); ++i) {
            EXPECT_EQ(unpackCodon(indices[i]), codons[i]);
        }
    }
}

TEST(CodonTableTest, LowercaseResidueAccepted) {
    EXPECT_EQ(CodonTable::standard().synonymCount('k'), 2);
}

TEST(CodonTableTest, UnknownResidueThrows) {
    const auto& table = CodonTable::standard();
    EXPECT_THROW((void)table.synonyms('X'), UnknownResidueError);
    EXPECT_THROW((void)table.synonymIndices('B'), UnknownResidueError);
    EXPECT_THROW((void)table.synonymCount('1'), CodonTableError);
}

TEST(CodonTableTest, EveryCodonAssignedOnce) {
    const auto& table = CodonTable::standard();

    std::set<std::string> seen;
    size_t total = 0;
    for (char aa : kResidueAlphabet) {
        for (const auto& codon : table.synonyms(aa)) {
            seen.insert(codon);
            ++total;
        }
    }
    EXPECT_EQ(total, kCodonCount);
    EXPECT_EQ(seen.size(), kCodonCount);
}

// ============================================================================
// Translation Tests
// ============================================================================

TEST(CodonTableTest, TranslateSimple) {
    const auto& table = CodonTable::standard();
    EXPECT_EQ(table.translate("ATGAAAACC"), "MKT");
    EXPECT_EQ(table.translate(""), "");
}

TEST(CodonTableTest, TranslateDoesNotTruncateAtStop) {
    const auto& table = CodonTable::standard();
    EXPECT_EQ(table.translate("ATGTAAGGG"), "M*G");
}

TEST(CodonTableTest, TranslateBadLengthThrows) {
    EXPECT_THROW((void)CodonTable::standard().translate("ATGA"), InvalidLengthError);
}

TEST(CodonTableTest, TranslateUnknownCodonThrows) {
    EXPECT_THROW((void)CodonTable::standard().translate("ATGNNN"), UnknownCodonError);
}

TEST(CodonTableTest, TranslateCodonByIndex) {
    const auto& table = CodonTable::standard();
    EXPECT_EQ(table.translateCodon(*packCodon("TGG")), 'W');
    EXPECT_EQ(table.translateCodon(std::string_view("TGA")), '*');
    EXPECT_FALSE(table.translateCodon(std::string_view("XYZ")).has_value());
}

TEST(CodonTableTest, SynonymsRoundTrip) {
    const auto& table = CodonTable::standard();
    for (char aa : kResidueAlphabet) {
        for (const auto& codon : table.synonyms(aa)) {
            EXPECT_EQ(table.translate(codon), std::string(1, aa)) << codon;
        }
    }
}

// ============================================================================
// Custom Table Tests
// ============================================================================

TEST(CodonTableTest, IncompleteTableThrows) {
    const std::pair<std::string_view, char> partial[] = {{"ATG", 'M'}};
    EXPECT_THROW(CodonTable{partial}, CodonTableError);
}

TEST(CodonTableTest, MalformedAssignmentThrows) {
    const std::pair<std::string_view, char> bad[] = {{"AT", 'M'}};
    EXPECT_THROW(CodonTable{bad}, CodonTableError);
}
