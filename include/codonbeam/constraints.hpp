#pragma once

#include "codonbeam/candidate.hpp"
#include "codonbeam/exclusion.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codonbeam {

/**
 * @brief Rule toggles; a disabled rule always passes
 */
struct ConstraintConfig {
    bool enforce_exclusions = true;
    bool enforce_homopolymer_diversity = true;
    size_t max_homopolymer_run = 4;
    bool enforce_unique_sixmers = true;

    // Inside a run of 4+ identical residues, no 4 identical codons in a row
    bool enforce_codon_run_diversity = false;
    // Repeated amino-acid 6-mers must not share their 18-nt encoding
    bool enforce_distinct_repeats = false;
};

/**
 * @brief Rule that rejected an extension
 */
enum class Rule : uint8_t {
    None = 0,
    Exclusion,
    Homopolymer,
    UniqueSixmer,
    CodonRun,
    RepeatEncoding
};

inline constexpr size_t kRuleCount = 6;

[[nodiscard]] std::string_view ruleName(Rule rule) noexcept;

struct Verdict {
    Rule rule = Rule::None;

    [[nodiscard]] bool accepted() const noexcept { return rule == Rule::None; }
    [[nodiscard]] explicit operator bool() const noexcept { return accepted(); }
};

/**
 * @brief Per-protein facts the residue-level rules need
 */
class ConstraintPlan {
public:
    ConstraintPlan() = default;
    explicit ConstraintPlan(std::string_view residues, size_t min_run = 4);

    // Position lies in a run of >= min_run identical residues (M and W excluded)
    [[nodiscard]] bool inLongRun(size_t position) const noexcept {
        return position < in_long_run_.size() && in_long_run_[position] != 0;
    }

    /**
     * @brief Earlier start positions of the amino-acid 6-mer starting at start
     */
    [[nodiscard]] const std::vector<size_t>& earlierRepeats(size_t start) const noexcept;

    [[nodiscard]] bool hasLongRuns() const noexcept { return has_long_runs_; }
    [[nodiscard]] bool hasRepeats() const noexcept { return has_repeats_; }
    [[nodiscard]] const std::string& residues() const noexcept { return residues_; }

private:
    std::string residues_;
    std::vector<uint8_t> in_long_run_;
    std::vector<std::vector<size_t>> earlier_repeats_;
    bool has_long_runs_ = false;
    bool has_repeats_ = false;
};

/**
 * @brief Decides whether a candidate may be extended by a codon
 *
 * Every rule is checked incrementally against the parent's state and the
 * new codon; the accepted prefix is never rescanned. Rejection is normal
 * pruning: evaluate() does not throw.
 */
class ConstraintEngine {
public:
    /**
     * @param exclusions Borrowed; must outlive the engine
     */
    ConstraintEngine(const ExclusionSet& exclusions, ConstraintConfig config);

    /**
     * @brief Check parent + codon, placed at residue position
     */
    [[nodiscard]] Verdict evaluate(const Candidate& parent, CodonIndex codon, size_t position,
                                   const ConstraintPlan& plan) const;

    [[nodiscard]] bool accepts(const Candidate& parent, CodonIndex codon, size_t position,
                               const ConstraintPlan& plan) const {
        return evaluate(parent, codon, position, plan).accepted();
    }

    [[nodiscard]] const ConstraintConfig& config() const noexcept { return config_; }

    // Whether candidates must carry their 6-mer set
    [[nodiscard]] bool tracksSixmers() const noexcept { return config_.enforce_unique_sixmers; }

private:
    const ExclusionSet* exclusions_;
    ConstraintConfig config_;
    size_t exclusion_context_codons_ = 0;

    [[nodiscard]] bool violatesExclusions(const Candidate& parent, CodonIndex codon) const;
    [[nodiscard]] bool violatesHomopolymer(const Candidate& parent, CodonIndex codon) const noexcept;
    [[nodiscard]] bool violatesUniqueSixmers(const Candidate& parent, CodonIndex codon) const noexcept;
    [[nodiscard]] bool violatesCodonRun(const Candidate& parent, CodonIndex codon, size_t position,
                                        const ConstraintPlan& plan) const noexcept;
    [[nodiscard]] bool violatesDistinctRepeats(const Candidate& parent, CodonIndex codon,
                                               size_t position, const ConstraintPlan& plan) const;
};

} // namespace codonbeam
