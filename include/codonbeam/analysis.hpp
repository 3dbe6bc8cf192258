#pragma once

#include "codonbeam/exclusion.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace codonbeam {

/**
 * @brief Statistics of designed DNA sequences
 */
namespace analysis {

/**
 * @brief Fraction of G and C among all bases, 0.0 for empty input
 */
[[nodiscard]] double gcContent(std::string_view dna) noexcept;

/**
 * @brief Length of the longest run of one repeated base
 */
[[nodiscard]] size_t longestHomopolymer(std::string_view dna) noexcept;

/**
 * @brief K-mer occurring more than once, with its start positions
 */
struct RepeatedKmer {
    std::string kmer;
    std::vector<size_t> positions;
};

/**
 * @brief Every k-mer seen at two or more positions, in order of first occurrence
 * @throws std::invalid_argument if k is 0
 */
[[nodiscard]] std::vector<RepeatedKmer> repeatedKmers(std::string_view dna, size_t k);

/**
 * @brief CpG observed/expected ratio
 */
[[nodiscard]] double cpgRatio(std::string_view dna) noexcept;

/**
 * @brief Summary of a designed sequence
 */
struct DesignReport {
    size_t length = 0;
    double gc_content = 0.0;
    size_t longest_homopolymer = 0;
    size_t repeated_sixmers = 0;  // distinct 6-mers seen more than once
    double cpg_ratio = 0.0;
    std::vector<MotifHit> motif_hits;

    [[nodiscard]] bool clean(size_t max_homopolymer_run) const noexcept {
        return repeated_sixmers == 0 && motif_hits.empty() &&
               longest_homopolymer <= max_homopolymer_run;
    }
};

[[nodiscard]] DesignReport summarize(std::string_view dna, const ExclusionSet& exclusions);

} // namespace analysis
} // namespace codonbeam
