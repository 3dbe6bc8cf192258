#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace codonbeam {

/**
 * @brief Exception class for malformed exclusion motifs
 */
class ExclusionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A forbidden DNA motif
 *
 * Each position is a 4-bit mask of allowed bases (A=1, C=2, G=4, T=8), so
 * literal bases, IUPAC codes and bracket classes share one representation.
 */
struct Motif {
    std::string name;
    std::string pattern;
    std::vector<uint8_t> masks;
    bool codon_aligned = false;  // only occurrences starting in frame 0 count

    [[nodiscard]] size_t length() const noexcept { return masks.size(); }

    // Match at dna[pos..pos+length()); caller guarantees bounds
    [[nodiscard]] bool matchesAt(std::string_view dna, size_t pos) const noexcept;
};

// Longest motif accepted, in bases after {n} expansion
constexpr size_t kMaxMotifLength = 100;

/**
 * @brief Parse one motif
 *
 * Accepted syntax: A C G T, IUPAC codes N R Y M K S W B V D H, '.' for any
 * base, bracket classes such as [AG] or [ACGT], and a {n} repeat after any
 * element. Case-insensitive.
 *
 * @throws ExclusionError on anything else, or beyond kMaxMotifLength bases
 */
[[nodiscard]] Motif parseMotif(std::string_view pattern, std::string name = {},
                               bool codon_aligned = false);

/**
 * @brief Where a motif was found
 */
struct MotifHit {
    size_t position;
    size_t motif;  // index into ExclusionSet::motifs()
};

/**
 * @brief Ordered collection of forbidden motifs, read-only during search
 */
class ExclusionSet {
public:
    ExclusionSet() = default;

    /**
     * @brief Parse newline-delimited motif text
     *
     * '#' starts a comment, blank lines are skipped, a ">name" line names the
     * motif on the next line, and a trailing "@codon" marks a codon-aligned
     * motif.
     *
     * @throws ExclusionError naming the offending line
     */
    [[nodiscard]] static ExclusionSet parse(std::string_view text);

    /**
     * @throws ExclusionError if the file cannot be read or a line is malformed
     */
    [[nodiscard]] static ExclusionSet fromFile(const std::filesystem::path& path);

    void add(Motif motif);

    /**
     * @brief Append every motif of another set
     */
    void merge(const ExclusionSet& other);

    /**
     * @brief True if an occurrence overlaps dna[first_new..]
     *
     * Only occurrences reaching into the new suffix are examined, so a
     * prefix that was already checked is not rescanned.
     *
     * @param dna        Sequence tail; dna[0] sits at absolute position offset
     * @param first_new  Index in dna of the first newly added base
     * @param offset     Absolute position of dna[0], used for codon alignment
     */
    [[nodiscard]] bool matchesEndingIn(std::string_view dna, size_t first_new,
                                       size_t offset = 0) const noexcept;

    /**
     * @brief First motif overlapping the new suffix, if any
     */
    [[nodiscard]] std::optional<MotifHit> firstHitEndingIn(std::string_view dna, size_t first_new,
                                                           size_t offset = 0) const noexcept;

    /**
     * @brief Every occurrence of every motif, ordered by position then motif
     */
    [[nodiscard]] std::vector<MotifHit> findAll(std::string_view dna) const;

    [[nodiscard]] const std::vector<Motif>& motifs() const noexcept { return motifs_; }
    [[nodiscard]] size_t size() const noexcept { return motifs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return motifs_.empty(); }

    // Longest motif; bases of context needed before a new codon is (maxLength() - 1)
    [[nodiscard]] size_t maxLength() const noexcept { return max_length_; }

private:
    std::vector<Motif> motifs_;
    size_t max_length_ = 0;
};

} // namespace codonbeam
