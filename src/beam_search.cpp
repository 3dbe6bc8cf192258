#include "codonbeam/beam_search.hpp"
#include <algorithm>
#include <array>
#include <numeric>
#include <span>
#include <unordered_map>

namespace codonbeam {

namespace {

using Clock = std::chrono::steady_clock;

ErrorCode toErrorCode(ProteinErrorKind kind) noexcept {
    switch (kind) {
        case ProteinErrorKind::Empty: return ErrorCode::EmptyInput;
        case ProteinErrorKind::InvalidResidue: return ErrorCode::InvalidResidue;
        case ProteinErrorKind::MisplacedStop: return ErrorCode::MisplacedStop;
    }
    return ErrorCode::InvalidResidue;
}

// Last-two-codon state used by StateGrouped pruning
uint32_t stateKey(const Candidate& c) {
    std::array<CodonIndex, 2> last{};
    const size_t k = std::min<size_t>(c.length(), 2);
    c.codonsFromEnd(std::span<CodonIndex>(last.data() + (2 - k), k));
    return (static_cast<uint32_t>(k) << 12) | (static_cast<uint32_t>(last[0]) << 6) | last[1];
}

// Outcome of one (parent, codon) slot
struct Expansion {
    std::optional<Candidate> candidate;
    Rule rejected_by = Rule::None;
    ScoreCounters lookups;
};

} // namespace

std::string_view errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::EmptyInput: return "EmptyInput";
        case ErrorCode::InvalidResidue: return "InvalidResidue";
        case ErrorCode::MisplacedStop: return "MisplacedStop";
        case ErrorCode::NoValidSequence: return "NoValidSequence";
        case ErrorCode::TranslationMismatch: return "TranslationMismatch";
    }
    return "Unknown";
}

size_t SearchStats::totalRejected() const noexcept {
    return std::accumulate(rejected.begin(), rejected.end(), size_t{0});
}

// ============================================================================
// BeamSearchOptimizer Implementation
// ============================================================================

BeamSearchOptimizer::BeamSearchOptimizer(const CodonTable& codons, const ScoreTable& scores,
                                         const ExclusionSet& exclusions, OptimizerConfig config)
    : codons_(&codons),
      scores_(&scores),
      exclusions_(&exclusions),
      config_(std::move(config)),
      scorer_(scores, config_.boundary_policy, config_.boundary_prior),
      constraints_(exclusions, config_.constraints) {
    config_.validate();
}

OptimizationResult BeamSearchOptimizer::optimize(std::string_view protein) const {
    const auto start = Clock::now();

    std::string residues;
    try {
        residues = ProteinSequence(protein).residues();
    } catch (const ProteinError& e) {
        OptimizationResult failed;
        failed.error = toErrorCode(e.kind());
        failed.message = e.what();
        failed.elapsed = Clock::now() - start;
        return failed;
    }

    OptimizationResult result = search(residues);
    result.elapsed = Clock::now() - start;
    return result;
}

OptimizationResult BeamSearchOptimizer::search(const std::string& residues) const {
    OptimizationResult result;
    SearchStats& stats = result.stats;

    const size_t n = residues.length();
    const ConstraintPlan plan(residues);
    const bool track_sixmers = constraints_.tracksSixmers();

    std::vector<Candidate> beam(1);
    std::vector<Expansion> slots;

    for (size_t pos = 0; pos < n; ++pos) {
        const auto synonyms = codons_->synonymIndices(residues[pos]);
        const size_t width = synonyms.size();

        // Residues of the codons forming the scored window
        const size_t ctx_begin = pos >= 2 ? pos - 2 : 0;
        const auto context = packContext(std::string_view(residues).substr(ctx_begin, pos - ctx_begin + 1));

        slots.clear();
        slots.resize(beam.size() * width);
        const auto slot_count = static_cast<std::ptrdiff_t>(slots.size());

        // Slot i is (parent i / width, synonym i % width); i doubles as the
        // generation ordinal, so the outcome does not depend on thread timing.
#pragma omp parallel for schedule(static) num_threads(static_cast<int>(config_.threads)) if (config_.threads > 1)
        for (std::ptrdiff_t i = 0; i < slot_count; ++i) {
            const auto idx = static_cast<size_t>(i);
            const Candidate& parent = beam[idx / width];
            const CodonIndex codon = synonyms[idx % width];
            Expansion& slot = slots[idx];

            Verdict verdict = constraints_.evaluate(parent, codon, pos, plan);
            if (!verdict) {
                slot.rejected_by = verdict.rule;
                continue;
            }

            std::array<CodonIndex, 2> previous{};
            const size_t k = std::min<size_t>(parent.length(), 2);
            parent.codonsFromEnd(std::span<CodonIndex>(previous.data(), k));

            double delta = scorer_.score(std::span<const CodonIndex>(previous.data(), k),
                                         codon, *context, &slot.lookups);
            slot.candidate = parent.extend(codon, delta, idx, track_sixmers);
        }

        std::vector<Candidate> next;
        next.reserve(slots.size());
        for (auto& slot : slots) {
            stats.score_hits += slot.lookups.hits;
            stats.score_misses += slot.lookups.misses;
            if (slot.candidate) {
                next.push_back(std::move(*slot.candidate));
            } else {
                stats.rejected[static_cast<size_t>(slot.rejected_by)]++;
            }
        }

        stats.steps++;
        stats.generated += slots.size();
        stats.accepted += next.size();

        if (next.empty()) {
            result.error = ErrorCode::NoValidSequence;
            result.failed_at = pos + 1;
            result.message = "All candidates excluded at position " + std::to_string(pos + 1) +
                             "/" + std::to_string(n) + ". Constraints may be too restrictive.";
            return result;
        }

        prune(next);
        beam = std::move(next);
        stats.peak_beam = std::max(stats.peak_beam, beam.size());
    }

    const Candidate& best = beam.front();
    std::string dna = best.dna();

    std::string translated;
    try {
        translated = codons_->translate(dna);
    } catch (const CodonTableError& e) {
        result.error = ErrorCode::TranslationMismatch;
        result.message = std::string("Translation verification failed: ") + e.what();
        return result;
    }
    if (translated != residues) {
        result.error = ErrorCode::TranslationMismatch;
        result.message = "Translation verification failed. Expected " + std::to_string(n) +
                         " residues matching the input, got '" + translated + "'";
        return result;
    }

    result.success = true;
    result.dna = std::move(dna);
    result.score = best.score();
    return result;
}

void BeamSearchOptimizer::prune(std::vector<Candidate>& beam) const {
    const size_t keep = std::min(config_.beam_width, beam.size());

    if (config_.pruning == PruningStrategy::Global) {
        std::partial_sort(beam.begin(), beam.begin() + static_cast<std::ptrdiff_t>(keep),
                          beam.end(), ranksBefore);
        beam.resize(keep);
        return;
    }

    std::sort(beam.begin(), beam.end(), ranksBefore);

    std::unordered_map<uint32_t, size_t> per_state;
    std::vector<Candidate> kept;
    kept.reserve(keep);
    for (auto& c : beam) {
        if (kept.size() == keep) break;
        size_t& count = per_state[stateKey(c)];
        if (count >= config_.paths_per_state) continue;
        ++count;
        kept.push_back(std::move(c));
    }
    beam = std::move(kept);
}

} // namespace codonbeam
