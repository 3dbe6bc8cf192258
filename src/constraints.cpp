#include "codonbeam/constraints.hpp"
#include <algorithm>
#include <unordered_map>

namespace codonbeam {

namespace {

constexpr size_t kPeptideRepeatLength = 6;

bool singleCodonResidue(char aa) noexcept {
    return aa == 'M' || aa == 'W';
}

} // namespace

std::string_view ruleName(Rule rule) noexcept {
    switch (rule) {
        case Rule::None: return "none";
        case Rule::Exclusion: return "exclusion";
        case Rule::Homopolymer: return "homopolymer";
        case Rule::UniqueSixmer: return "unique-sixmer";
        case Rule::CodonRun: return "codon-run";
        case Rule::RepeatEncoding: return "repeat-encoding";
    }
    return "unknown";
}

// ============================================================================
// ConstraintPlan Implementation
// ============================================================================

ConstraintPlan::ConstraintPlan(std::string_view residues, size_t min_run)
    : residues_(residues), in_long_run_(residues.length(), 0) {
    const size_t n = residues.length();

    size_t i = 0;
    while (i < n) {
        size_t j = i + 1;
        while (j < n && residues[j] == residues[i]) ++j;

        if (j - i >= min_run && !singleCodonResidue(residues[i])) {
            std::fill(in_long_run_.begin() + static_cast<std::ptrdiff_t>(i),
                      in_long_run_.begin() + static_cast<std::ptrdiff_t>(j), uint8_t{1});
            has_long_runs_ = true;
        }
        i = j;
    }

    if (n < kPeptideRepeatLength) return;

    earlier_repeats_.resize(n - kPeptideRepeatLength + 1);
    std::unordered_map<std::string_view, std::vector<size_t>> starts;
    for (size_t s = 0; s + kPeptideRepeatLength <= n; ++s) {
        auto peptide = residues.substr(s, kPeptideRepeatLength);
        if (std::ranges::all_of(peptide, singleCodonResidue)) continue;

        auto& seen = starts[peptide];
        if (!seen.empty()) {
            earlier_repeats_[s] = seen;
            has_repeats_ = true;
        }
        seen.push_back(s);
    }
}

const std::vector<size_t>& ConstraintPlan::earlierRepeats(size_t start) const noexcept {
    static const std::vector<size_t> none;
    return start < earlier_repeats_.size() ? earlier_repeats_[start] : none;
}

// ============================================================================
// ConstraintEngine Implementation
// ============================================================================

ConstraintEngine::ConstraintEngine(const ExclusionSet& exclusions, ConstraintConfig config)
    : exclusions_(&exclusions), config_(config) {
    // Codons before the new one that a motif ending in it can reach back into
    if (exclusions.maxLength() > 1) {
        exclusion_context_codons_ = (exclusions.maxLength() - 1 + 2) / 3;
    }
}

Verdict ConstraintEngine::evaluate(const Candidate& parent, CodonIndex codon, size_t position,
                                   const ConstraintPlan& plan) const {
    if (config_.enforce_homopolymer_diversity && violatesHomopolymer(parent, codon)) {
        return {Rule::Homopolymer};
    }
    if (config_.enforce_unique_sixmers && violatesUniqueSixmers(parent, codon)) {
        return {Rule::UniqueSixmer};
    }
    if (config_.enforce_codon_run_diversity && violatesCodonRun(parent, codon, position, plan)) {
        return {Rule::CodonRun};
    }
    if (config_.enforce_distinct_repeats && violatesDistinctRepeats(parent, codon, position, plan)) {
        return {Rule::RepeatEncoding};
    }
    if (config_.enforce_exclusions && violatesExclusions(parent, codon)) {
        return {Rule::Exclusion};
    }
    return {};
}

bool ConstraintEngine::violatesExclusions(const Candidate& parent, CodonIndex codon) const {
    if (exclusions_->empty()) return false;

    const size_t k = std::min(parent.length(), exclusion_context_codons_);
    std::string window = parent.tail(k);
    window += unpackCodon(codon);

    const size_t offset = 3 * (parent.length() - k);
    return exclusions_->matchesEndingIn(window, window.length() - 3, offset);
}

bool ConstraintEngine::violatesHomopolymer(const Candidate& parent, CodonIndex codon) const noexcept {
    int run_base = parent.runBase();
    size_t run_length = parent.runLength();

    for (int shift = 4; shift >= 0; shift -= 2) {
        int b = (codon >> shift) & 3;
        if (b == run_base) {
            ++run_length;
        } else {
            run_base = b;
            run_length = 1;
        }
        if (run_length > config_.max_homopolymer_run) return true;
    }
    return false;
}

bool ConstraintEngine::violatesUniqueSixmers(const Candidate& parent, CodonIndex codon) const noexcept {
    uint64_t recent = parent.recentBases();
    size_t bases = parent.baseCount();

    std::array<uint16_t, 3> fresh{};
    size_t fresh_count = 0;

    for (int shift = 4; shift >= 0; shift -= 2) {
        recent = (recent << 2) | static_cast<uint64_t>((codon >> shift) & 3);
        ++bases;
        if (bases < 6) continue;

        auto code = static_cast<uint16_t>(recent & 0xFFF);
        if (parent.hasSixmer(code)) return true;
        for (size_t i = 0; i < fresh_count; ++i) {
            if (fresh[i] == code) return true;
        }
        fresh[fresh_count++] = code;
    }
    return false;
}

bool ConstraintEngine::violatesCodonRun(const Candidate& parent, CodonIndex codon, size_t position,
                                        const ConstraintPlan& plan) const noexcept {
    if (position < 3 || !plan.inLongRun(position) || parent.length() < 3) return false;

    const auto& residues = plan.residues();
    for (size_t p = position - 3; p < position; ++p) {
        if (residues[p] != residues[position]) return false;
    }

    std::array<CodonIndex, 3> last{};
    parent.codonsFromEnd(last);
    return std::ranges::all_of(last, [codon](CodonIndex c) { return c == codon; });
}

bool ConstraintEngine::violatesDistinctRepeats(const Candidate& parent, CodonIndex codon,
                                               size_t position, const ConstraintPlan& plan) const {
    if (position + 1 < kPeptideRepeatLength) return false;

    const size_t start = position + 1 - kPeptideRepeatLength;
    const auto& earlier = plan.earlierRepeats(start);
    if (earlier.empty()) return false;

    // Codons from the earliest repeat up to the parent's last codon
    const size_t first = earlier.front();
    std::vector<CodonIndex> codons(parent.length() - first);
    parent.codonsFromEnd(codons);
    codons.push_back(codon);

    const auto current = codons.begin() + static_cast<std::ptrdiff_t>(start - first);
    for (size_t q : earlier) {
        const auto other = codons.begin() + static_cast<std::ptrdiff_t>(q - first);
        if (std::equal(other, other + kPeptideRepeatLength, current)) {
            return true;
        }
    }
    return false;
}

} // namespace codonbeam
