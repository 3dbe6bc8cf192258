#pragma once

#include "codonbeam/codon_table.hpp"
#include <bitset>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace codonbeam {

// Number of distinct 6-nt windows (4^6)
inline constexpr size_t kSixmerCount = 4096;

/**
 * @brief Immutable link in a candidate's codon chain
 *
 * Candidates extended from the same parent share everything up to the
 * parent's last codon. Destruction unlinks the chain iteratively so that
 * releasing a long sequence does not recurse once per codon.
 */
struct CodonNode {
    CodonIndex codon;
    std::shared_ptr<const CodonNode> parent;

    CodonNode(CodonIndex c, std::shared_ptr<const CodonNode> p)
        : codon(c), parent(std::move(p)) {}
    CodonNode(const CodonNode&) = delete;
    CodonNode& operator=(const CodonNode&) = delete;
    ~CodonNode();
};

/**
 * @brief A partial DNA sequence during search
 *
 * Value type. extend() returns a new candidate and leaves this one
 * untouched, so siblings grown from one parent never see each other's
 * codons. The per-candidate state is the codon chain head, the cumulative
 * score, the trailing homopolymer run, the last 32 bases packed 2 bits
 * each, and the set of 6-nt windows used so far.
 */
class Candidate {
public:
    Candidate() = default;

    /**
     * @brief New candidate with one more codon
     * @param codon         Codon appended
     * @param score_delta   Added to the cumulative score
     * @param ordinal       Generation order, the tie-break for equal scores
     * @param track_sixmers Record the 6-nt windows ending in the new codon
     */
    [[nodiscard]] Candidate extend(CodonIndex codon, double score_delta, size_t ordinal,
                                   bool track_sixmers) const;

    // Codons placed so far
    [[nodiscard]] size_t length() const noexcept { return length_; }
    [[nodiscard]] size_t baseCount() const noexcept { return 3 * length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }
    [[nodiscard]] double score() const noexcept { return score_; }
    [[nodiscard]] size_t ordinal() const noexcept { return ordinal_; }

    // Trailing run of one base; runBase() is -1 when empty
    [[nodiscard]] int runBase() const noexcept { return run_base_; }
    [[nodiscard]] size_t runLength() const noexcept { return run_length_; }

    // Last min(32, baseCount()) bases, 2 bits each, newest in the low bits
    [[nodiscard]] uint64_t recentBases() const noexcept { return recent_; }

    [[nodiscard]] bool hasSixmer(uint16_t code) const noexcept { return sixmers_.test(code & 0xFFF); }

    /**
     * @brief The last codon; candidate must not be empty
     */
    [[nodiscard]] CodonIndex lastCodon() const noexcept { return head_->codon; }

    /**
     * @brief Fill out with the last out.size() codons, oldest first
     *
     * Walks the shared chain; out.size() must not exceed length().
     */
    void codonsFromEnd(std::span<CodonIndex> out) const noexcept;

    /**
     * @brief Last n codons as DNA (fewer if the candidate is shorter)
     */
    [[nodiscard]] std::string tail(size_t n) const;

    /**
     * @brief The whole DNA sequence
     */
    [[nodiscard]] std::string dna() const;

private:
    std::shared_ptr<const CodonNode> head_;
    size_t length_ = 0;
    double score_ = 0.0;
    size_t ordinal_ = 0;
    int run_base_ = -1;
    size_t run_length_ = 0;
    uint64_t recent_ = 0;
    std::bitset<kSixmerCount> sixmers_;
};

/**
 * @brief Ranking order of the beam: higher score first, then lower ordinal
 */
[[nodiscard]] inline bool ranksBefore(const Candidate& a, const Candidate& b) noexcept {
    if (a.score() != b.score()) return a.score() > b.score();
    return a.ordinal() < b.ordinal();
}

} // namespace codonbeam
