#pragma once

#include "codonbeam/score_table.hpp"
#include <span>

namespace codonbeam {

/**
 * @brief How codons with fewer than two predecessors are scored
 */
enum class BoundaryPolicy {
    FixedPrior,     // constant prior, no table lookup
    PartialContext  // look up the 1- or 2-residue context with its 3- or 6-nt window
};

/**
 * @brief Table lookups that found or missed an entry
 */
struct ScoreCounters {
    size_t hits = 0;
    size_t misses = 0;
};

/**
 * @brief Scores a newly placed codon against the codons preceding it
 *
 * Borrows the ScoreTable; the table must outlive the scorer. A missing entry
 * scores 0.0 and is not an error.
 */
class ContextScorer {
public:
    explicit ContextScorer(const ScoreTable& table,
                           BoundaryPolicy policy = BoundaryPolicy::FixedPrior,
                           double boundary_prior = 0.0) noexcept
        : table_(&table), policy_(policy), boundary_prior_(boundary_prior) {}

    /**
     * @brief Score one codon placement
     * @param previous Up to two preceding codons, oldest first
     * @param codon    The codon being placed
     * @param context  Residues of previous + codon (same count, same order)
     * @param counters Optional hit/miss accounting
     */
    [[nodiscard]] double score(std::span<const CodonIndex> previous, CodonIndex codon,
                               ContextKey context, ScoreCounters* counters = nullptr) const noexcept;

    /**
     * @brief String form of score(), for callers outside the search loop
     *
     * previous_codons holds 0, 1 or 2 whole codons; context the residues of
     * previous_codons + codon. Malformed input scores as a miss.
     */
    [[nodiscard]] double score(std::string_view previous_codons, std::string_view codon,
                               std::string_view context) const noexcept;

    [[nodiscard]] BoundaryPolicy policy() const noexcept { return policy_; }
    [[nodiscard]] double boundaryPrior() const noexcept { return boundary_prior_; }

private:
    const ScoreTable* table_;
    BoundaryPolicy policy_;
    double boundary_prior_;
};

} // namespace codonbeam
