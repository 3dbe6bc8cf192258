#include "codonbeam/context_scorer.hpp"
#include <algorithm>
#include <array>

namespace codonbeam {

double ContextScorer::score(std::span<const CodonIndex> previous, CodonIndex codon,
                            ContextKey context, ScoreCounters* counters) const noexcept {
    if (previous.size() < 2 && policy_ == BoundaryPolicy::FixedPrior) {
        return boundary_prior_;
    }

    WindowKey window = 0;
    for (CodonIndex c : previous.last(std::min<size_t>(previous.size(), 2))) {
        window = (window << 6) | c;
    }
    window = (window << 6) | codon;

    auto found = table_->lookup(context, window);
    if (counters) {
        if (found) {
            counters->hits++;
        } else {
            counters->misses++;
        }
    }
    return found.value_or(0.0);
}

double ContextScorer::score(std::string_view previous_codons, std::string_view codon,
                            std::string_view context) const noexcept {
    if (previous_codons.length() % 3 != 0 || previous_codons.length() > 6) return 0.0;

    std::array<CodonIndex, 2> prev{};
    size_t count = 0;
    for (size_t i = 0; i < previous_codons.length(); i += 3) {
        auto packed = packCodon(previous_codons.substr(i, 3));
        if (!packed) return 0.0;
        prev[count++] = *packed;
    }

    auto packed = packCodon(codon);
    auto ctx = packContext(context);
    if (!packed || !ctx || context.length() != count + 1) return 0.0;

    return score(std::span<const CodonIndex>(prev.data(), count), *packed, *ctx);
}

} // namespace codonbeam
