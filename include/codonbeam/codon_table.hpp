#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace codonbeam {

/**
 * @brief Base class for codon table errors
 */
class CodonTableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Residue is not one of the 20 standard amino acids or '*'
 */
class UnknownResidueError : public CodonTableError {
public:
    using CodonTableError::CodonTableError;
};

/**
 * @brief DNA length is not a multiple of three
 */
class InvalidLengthError : public CodonTableError {
public:
    using CodonTableError::CodonTableError;
};

/**
 * @brief Triplet does not encode any residue in the table
 */
class UnknownCodonError : public CodonTableError {
public:
    using CodonTableError::CodonTableError;
};

// Packed codon: 2 bits per base (A=0, C=1, G=2, T=3), first base most significant.
// Numeric order equals lexicographic order of the triplets.
using CodonIndex = uint8_t;

inline constexpr size_t kCodonCount = 64;
inline constexpr char kStopResidue = '*';

// Residue alphabet in canonical order; position is the residue index.
inline constexpr std::string_view kResidueAlphabet = "ACDEFGHIKLMNPQRSTVWY*";
inline constexpr size_t kResidueCount = kResidueAlphabet.size();

[[nodiscard]] constexpr int baseIndex(char c) noexcept {
    switch (c) {
        case 'A': case 'a': return 0;
        case 'C': case 'c': return 1;
        case 'G': case 'g': return 2;
        case 'T': case 't': return 3;
        default: return -1;
    }
}

[[nodiscard]] constexpr char baseAt(int index) noexcept {
    constexpr char bases[] = {'A', 'C', 'G', 'T'};
    return bases[index & 3];
}

/**
 * @brief Residue index in kResidueAlphabet, or -1
 */
[[nodiscard]] constexpr int residueIndex(char aa) noexcept {
    if (aa >= 'a' && aa <= 'z') {
        aa = static_cast<char>(aa - 'a' + 'A');
    }
    auto pos = kResidueAlphabet.find(aa);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

[[nodiscard]] constexpr bool isResidue(char aa) noexcept {
    return residueIndex(aa) >= 0;
}

/**
 * @brief Pack a triplet into its codon index
 * @return std::nullopt if the triplet is not exactly three of A/C/G/T
 */
[[nodiscard]] std::optional<CodonIndex> packCodon(std::string_view triplet) noexcept;

/**
 * @brief Unpack a codon index into its three bases
 */
[[nodiscard]] std::string unpackCodon(CodonIndex codon);

/**
 * @brief Reverse complement of a DNA string (IUPAC codes complemented,
 *        bracket classes are not supported)
 */
[[nodiscard]] std::string reverseComplement(std::string_view dna);

/**
 * @brief Mapping between residues and their synonymous codons
 *
 * Built explicitly (standard() for the standard genetic code) and shared
 * read-only by every search. Synonym lists are kept in lexicographic order
 * so that iteration, and therefore tie-breaking, is reproducible.
 */
class CodonTable {
public:
    /**
     * @brief Build a table from (codon, residue) assignments
     * @param assignments Each entry maps a triplet to a residue in kResidueAlphabet
     * @throws CodonTableError on a malformed triplet or residue, or a
     *         residue left without codons
     */
    explicit CodonTable(std::span<const std::pair<std::string_view, char>> assignments);

    /**
     * @brief The standard genetic code (NCBI translation table 1)
     */
    [[nodiscard]] static const CodonTable& standard();

    /**
     * @brief Synonymous codons of a residue, lexicographically ordered
     * @throws UnknownResidueError if aa is not in the alphabet
     */
    [[nodiscard]] const std::vector<std::string>& synonyms(char aa) const;

    /**
     * @brief Synonymous codon indices of a residue, same order as synonyms()
     * @throws UnknownResidueError if aa is not in the alphabet
     */
    [[nodiscard]] std::span<const CodonIndex> synonymIndices(char aa) const;

    /**
     * @brief Translate DNA to residues; stop codons become '*'
     * @throws InvalidLengthError if dna.length() % 3 != 0
     * @throws UnknownCodonError if any triplet is not in the table
     */
    [[nodiscard]] std::string translate(std::string_view dna) const;

    /**
     * @brief Residue encoded by a packed codon
     */
    [[nodiscard]] char translateCodon(CodonIndex codon) const noexcept {
        return residue_of_[codon & 63];
    }

    /**
     * @brief Residue encoded by a triplet, or std::nullopt
     */
    [[nodiscard]] std::optional<char> translateCodon(std::string_view triplet) const noexcept;

    [[nodiscard]] size_t synonymCount(char aa) const;

private:
    std::array<char, kCodonCount> residue_of_{};
    std::array<std::vector<CodonIndex>, kResidueCount> indices_;
    std::array<std::vector<std::string>, kResidueCount> codons_;

    [[nodiscard]] size_t requireResidue(char aa) const;
};

} // namespace codonbeam
