#pragma once

#include "codonbeam/candidate.hpp"
#include "codonbeam/codon_table.hpp"
#include "codonbeam/config.hpp"
#include "codonbeam/constraints.hpp"
#include "codonbeam/context_scorer.hpp"
#include "codonbeam/exclusion.hpp"
#include "codonbeam/protein.hpp"
#include "codonbeam/score_table.hpp"
#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace codonbeam {

/**
 * @brief Why an optimization did not produce a sequence
 */
enum class ErrorCode {
    None = 0,
    EmptyInput,
    InvalidResidue,
    MisplacedStop,
    NoValidSequence,
    TranslationMismatch
};

[[nodiscard]] std::string_view errorCodeName(ErrorCode code) noexcept;

/**
 * @brief Counters collected during one search
 */
struct SearchStats {
    size_t steps = 0;
    size_t generated = 0;   // extensions considered
    size_t accepted = 0;    // extensions passing every rule
    size_t peak_beam = 0;
    size_t score_hits = 0;
    size_t score_misses = 0;
    std::array<size_t, kRuleCount> rejected{};

    [[nodiscard]] size_t rejectedBy(Rule rule) const noexcept {
        return rejected[static_cast<size_t>(rule)];
    }
    [[nodiscard]] size_t totalRejected() const noexcept;
};

/**
 * @brief Outcome of BeamSearchOptimizer::optimize()
 */
struct OptimizationResult {
    bool success = false;
    std::optional<std::string> dna;
    std::optional<double> score;
    std::chrono::duration<double, std::milli> elapsed{0};
    ErrorCode error = ErrorCode::None;
    std::string message;
    // 1-based residue position where the beam emptied
    std::optional<size_t> failed_at;
    SearchStats stats;

    [[nodiscard]] double elapsedMs() const noexcept { return elapsed.count(); }
    [[nodiscard]] explicit operator bool() const noexcept { return success; }
};

/**
 * @brief Beam search over synonymous codons
 *
 * Builds the DNA one residue at a time. Each live candidate is extended by
 * every synonym of the next residue; extensions are scored by the context
 * scorer, filtered by the constraint engine, and the survivors are cut back
 * to beam_width by score (ties go to the earlier-generated candidate). The
 * best candidate after the last residue is the result.
 *
 * The codon table, score table and exclusion set are borrowed and must
 * outlive the optimizer. optimize() keeps no state between calls, so one
 * optimizer may serve concurrent callers.
 */
class BeamSearchOptimizer {
public:
    /**
     * @throws ConfigError if config fails validation
     */
    BeamSearchOptimizer(const CodonTable& codons, const ScoreTable& scores,
                        const ExclusionSet& exclusions, OptimizerConfig config);

    BeamSearchOptimizer(const ScoreTable& scores, const ExclusionSet& exclusions,
                        OptimizerConfig config)
        : BeamSearchOptimizer(scores.codons(), scores, exclusions, std::move(config)) {}

    /**
     * @brief Optimize a protein given as one-letter codes
     *
     * Input problems (empty, unknown residue, misplaced stop) are reported
     * before any search work. Never throws for input or search failures;
     * inspect OptimizationResult::error instead.
     */
    [[nodiscard]] OptimizationResult optimize(std::string_view protein) const;

    [[nodiscard]] OptimizationResult optimize(const ProteinSequence& protein) const {
        return optimize(protein.residues());
    }

    [[nodiscard]] const OptimizerConfig& config() const noexcept { return config_; }

private:
    const CodonTable* codons_;
    const ScoreTable* scores_;
    const ExclusionSet* exclusions_;
    OptimizerConfig config_;
    ContextScorer scorer_;
    ConstraintEngine constraints_;

    [[nodiscard]] OptimizationResult search(const std::string& residues) const;
    void prune(std::vector<Candidate>& beam) const;
};

} // namespace codonbeam
