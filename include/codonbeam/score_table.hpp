#pragma once

#include "codonbeam/codon_table.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace codonbeam {

/**
 * @brief Exception class for malformed scoring tables
 */
class ScoreTableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Packed amino-acid context: length in bits 15-16, then 5 bits per residue
 */
using ContextKey = uint32_t;

/**
 * @brief Packed DNA window: 6 bits per codon, first codon most significant
 */
using WindowKey = uint32_t;

/**
 * @brief Pack 1-3 residues into a ContextKey
 * @return std::nullopt for an empty or over-long context or an unknown residue
 */
[[nodiscard]] std::optional<ContextKey> packContext(std::string_view residues) noexcept;

/**
 * @brief Pack 1-3 codons (3-9 nt) into a WindowKey
 * @return std::nullopt if the length is not 3, 6 or 9 or a base is not ACGT
 */
[[nodiscard]] std::optional<WindowKey> packWindow(std::string_view dna) noexcept;

[[nodiscard]] constexpr WindowKey windowOf(CodonIndex c0, CodonIndex c1, CodonIndex c2) noexcept {
    return (static_cast<WindowKey>(c0) << 12) | (static_cast<WindowKey>(c1) << 6) | c2;
}

/**
 * @brief Context scores keyed by amino-acid context and realized DNA window
 *
 * The main entries are 3-residue contexts with 9-nt windows. Shorter 1- and
 * 2-residue contexts (3- and 6-nt windows) hold optional boundary priors
 * used at the start of a sequence. Built once, then shared read-only by
 * every search that borrows it.
 */
class ScoreTable {
public:
    explicit ScoreTable(const CodonTable& codons = CodonTable::standard());

    /**
     * @brief Build from JSON: either {"AAA": {"GCTGCTGCT": 1.5, ...}, ...}
     *        or the same mapping under a "ninemer_scores" member
     * @throws ScoreTableError naming the first malformed entry
     */
    [[nodiscard]] static ScoreTable fromJson(const nlohmann::json& doc,
                                             const CodonTable& codons = CodonTable::standard());

    /**
     * @brief Add or overwrite one entry
     * @throws ScoreTableError if the context or window is malformed, or the
     *         window does not encode the context
     */
    void insert(std::string_view context, std::string_view window, double score);

    /**
     * @brief Score of a window in a context, std::nullopt when absent
     */
    [[nodiscard]] std::optional<double> lookup(std::string_view context,
                                               std::string_view window) const noexcept;

    [[nodiscard]] std::optional<double> lookup(ContextKey context, WindowKey window) const noexcept {
        auto it = scores_.find(combine(context, window));
        if (it == scores_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] bool containsContext(std::string_view context) const noexcept;

    // Number of (context, window) entries
    [[nodiscard]] size_t size() const noexcept { return scores_.size(); }
    [[nodiscard]] size_t contextCount() const noexcept { return contexts_.size(); }
    [[nodiscard]] bool empty() const noexcept { return scores_.empty(); }
    [[nodiscard]] const CodonTable& codons() const noexcept { return *codons_; }

private:
    const CodonTable* codons_;
    std::unordered_map<uint64_t, double> scores_;
    std::unordered_map<ContextKey, size_t> contexts_;

    [[nodiscard]] static constexpr uint64_t combine(ContextKey c, WindowKey w) noexcept {
        return (static_cast<uint64_t>(c) << 18) | w;
    }
};

/**
 * @brief Load a JSON scoring table from disk
 * @throws ScoreTableError if the file cannot be read or parsed
 */
[[nodiscard]] ScoreTable loadScoreTable(const std::filesystem::path& path,
                                        const CodonTable& codons = CodonTable::standard());

} // namespace codonbeam
