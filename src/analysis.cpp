#include "codonbeam/analysis.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace codonbeam {
namespace analysis {

double gcContent(std::string_view dna) noexcept {
    if (dna.empty()) return 0.0;

    auto gc = std::ranges::count_if(dna, [](char c) { return c == 'G' || c == 'C'; });
    return static_cast<double>(gc) / dna.length();
}

size_t longestHomopolymer(std::string_view dna) noexcept {
    size_t longest = 0;
    size_t run = 0;

    for (size_t i = 0; i < dna.length(); ++i) {
        run = (i > 0 && dna[i] == dna[i - 1]) ? run + 1 : 1;
        longest = std::max(longest, run);
    }

    return longest;
}

std::vector<RepeatedKmer> repeatedKmers(std::string_view dna, size_t k) {
    if (k == 0) {
        throw std::invalid_argument("K-mer length must be greater than 0");
    }
    if (dna.length() < k) return {};

    std::unordered_map<std::string_view, size_t> index;
    std::vector<RepeatedKmer> seen;

    for (size_t i = 0; i <= dna.length() - k; ++i) {
        auto kmer = dna.substr(i, k);
        auto [it, inserted] = index.try_emplace(kmer, seen.size());
        if (inserted) {
            seen.push_back({std::string(kmer), {i}});
        } else {
            seen[it->second].positions.push_back(i);
        }
    }

    std::erase_if(seen, [](const RepeatedKmer& r) { return r.positions.size() < 2; });
    return seen;
}

double cpgRatio(std::string_view dna) noexcept {
    if (dna.length() < 2) return 0.0;

    size_t cpg_count = 0;
    size_t c_count = 0;
    size_t g_count = 0;

    for (size_t i = 0; i < dna.length(); ++i) {
        if (dna[i] == 'C') {
            c_count++;
            if (i + 1 < dna.length() && dna[i + 1] == 'G') {
                cpg_count++;
            }
        } else if (dna[i] == 'G') {
            g_count++;
        }
    }

    // CpG O/E = (CpG count * length) / (C count * G count)
    if (c_count == 0 || g_count == 0) return 0.0;

    double expected = static_cast<double>(c_count * g_count) / dna.length();
    return cpg_count / expected;
}

DesignReport summarize(std::string_view dna, const ExclusionSet& exclusions) {
    DesignReport report;
    report.length = dna.length();
    report.gc_content = gcContent(dna);
    report.longest_homopolymer = longestHomopolymer(dna);
    report.repeated_sixmers = repeatedKmers(dna, 6).size();
    report.cpg_ratio = cpgRatio(dna);
    report.motif_hits = exclusions.findAll(dna);
    return report;
}

} // namespace analysis
} // namespace codonbeam
