#include "codonbeam/codon_table.hpp"
#include <algorithm>

namespace codonbeam {

namespace {

constexpr std::pair<std::string_view, char> kStandardCode[] = {
    {"TTT", 'F'}, {"TTC", 'F'}, {"TTA", 'L'}, {"TTG", 'L'},
    {"TCT", 'S'}, {"TCC", 'S'}, {"TCA", 'S'}, {"TCG", 'S'},
    {"TAT", 'Y'}, {"TAC", 'Y'}, {"TAA", '*'}, {"TAG", '*'},
    {"TGT", 'C'}, {"TGC", 'C'}, {"TGA", '*'}, {"TGG", 'W'},
    {"CTT", 'L'}, {"CTC", 'L'}, {"CTA", 'L'}, {"CTG", 'L'},
    {"CCT", 'P'}, {"CCC", 'P'}, {"CCA", 'P'}, {"CCG", 'P'},
    {"CAT", 'H'}, {"CAC", 'H'}, {"CAA", 'Q'}, {"CAG", 'Q'},
    {"CGT", 'R'}, {"CGC", 'R'}, {"CGA", 'R'}, {"CGG", 'R'},
    {"ATT", 'I'}, {"ATC", 'I'}, {"ATA", 'I'}, {"ATG", 'M'},
    {"ACT", 'T'}, {"ACC", 'T'}, {"ACA", 'T'}, {"ACG", 'T'},
    {"AAT", 'N'}, {"AAC", 'N'}, {"AAA", 'K'}, {"AAG", 'K'},
    {"AGT", 'S'}, {"AGC", 'S'}, {"AGA", 'R'}, {"AGG", 'R'},
    {"GTT", 'V'}, {"GTC", 'V'}, {"GTA", 'V'}, {"GTG", 'V'},
    {"GCT", 'A'}, {"GCC", 'A'}, {"GCA", 'A'}, {"GCG", 'A'},
    {"GAT", 'D'}, {"GAC", 'D'}, {"GAA", 'E'}, {"GAG", 'E'},
    {"GGT", 'G'}, {"GGC", 'G'}, {"GGA", 'G'}, {"GGG", 'G'},
};

constexpr char complementIupac(char c) noexcept {
    switch (c) {
        case 'A': return 'T';
        case 'T': return 'A';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'R': return 'Y';
        case 'Y': return 'R';
        case 'M': return 'K';
        case 'K': return 'M';
        case 'B': return 'V';
        case 'V': return 'B';
        case 'D': return 'H';
        case 'H': return 'D';
        case 'S': case 'W': case 'N': return c;
        default: return 'N';
    }
}

} // namespace

// ============================================================================
// Codon Packing
// ============================================================================

std::optional<CodonIndex> packCodon(std::string_view triplet) noexcept {
    if (triplet.length() != 3) return std::nullopt;

    int packed = 0;
    for (char c : triplet) {
        int b = baseIndex(c);
        if (b < 0) return std::nullopt;
        packed = (packed << 2) | b;
    }
    return static_cast<CodonIndex>(packed);
}

std::string unpackCodon(CodonIndex codon) {
    std::string triplet(3, 'A');
    triplet[0] = baseAt(codon >> 4);
    triplet[1] = baseAt(codon >> 2);
    triplet[2] = baseAt(codon);
    return triplet;
}

std::string reverseComplement(std::string_view dna) {
    std::string rc;
    rc.reserve(dna.length());

    std::transform(dna.rbegin(), dna.rend(), std::back_inserter(rc),
                   [](char c) {
                       if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
                       return complementIupac(c);
                   });
    return rc;
}

// ============================================================================
// CodonTable Implementation
// ============================================================================

CodonTable::CodonTable(std::span<const std::pair<std::string_view, char>> assignments) {
    residue_of_.fill('\0');

    for (const auto& [triplet, aa] : assignments) {
        auto codon = packCodon(triplet);
        if (!codon) {
            throw CodonTableError("Invalid codon '" + std::string(triplet) + "'");
        }
        int r = residueIndex(aa);
        if (r < 0) {
            throw CodonTableError("Invalid residue '" + std::string(1, aa) +
                                  "' for codon " + std::string(triplet));
        }
        residue_of_[*codon] = kResidueAlphabet[static_cast<size_t>(r)];
        indices_[static_cast<size_t>(r)].push_back(*codon);
    }

    for (size_t r = 0; r < kResidueCount; ++r) {
        auto& idx = indices_[r];
        if (idx.empty()) {
            throw CodonTableError("No codons assigned to residue '" +
                                  std::string(1, kResidueAlphabet[r]) + "'");
        }
        std::ranges::sort(idx);
        idx.erase(std::unique(idx.begin(), idx.end()), idx.end());

        codons_[r].reserve(idx.size());
        for (CodonIndex c : idx) {
            codons_[r].push_back(unpackCodon(c));
        }
    }
}

const CodonTable& CodonTable::standard() {
    static const CodonTable table(kStandardCode);
    return table;
}

size_t CodonTable::requireResidue(char aa) const {
    int r = residueIndex(aa);
    if (r < 0) {
        throw UnknownResidueError("Unknown residue '" + std::string(1, aa) + "'");
    }
    return static_cast<size_t>(r);
}

const std::vector<std::string>& CodonTable::synonyms(char aa) const {
    return codons_[requireResidue(aa)];
}

std::span<const CodonIndex> CodonTable::synonymIndices(char aa) const {
    return indices_[requireResidue(aa)];
}

size_t CodonTable::synonymCount(char aa) const {
    return indices_[requireResidue(aa)].size();
}

std::optional<char> CodonTable::translateCodon(std::string_view triplet) const noexcept {
    auto codon = packCodon(triplet);
    if (!codon) return std::nullopt;

    char aa = residue_of_[*codon];
    if (aa == '\0') return std::nullopt;
    return aa;
}

std::string CodonTable::translate(std::string_view dna) const {
    if (dna.length() % 3 != 0) {
        throw InvalidLengthError("DNA length " + std::to_string(dna.length()) +
                                 " is not a multiple of 3");
    }

    std::string protein;
    protein.reserve(dna.length() / 3);

    for (size_t i = 0; i < dna.length(); i += 3) {
        auto aa = translateCodon(dna.substr(i, 3));
        if (!aa) {
            throw UnknownCodonError("Unknown codon '" + std::string(dna.substr(i, 3)) +
                                    "' at position " + std::to_string(i));
        }
        protein += *aa;
    }

    return protein;
}

} // namespace codonbeam
