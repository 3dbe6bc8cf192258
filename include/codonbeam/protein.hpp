#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace codonbeam {

/**
 * @brief What made a protein sequence unusable
 */
enum class ProteinErrorKind {
    Empty,
    InvalidResidue,
    MisplacedStop
};

/**
 * @brief Exception class for protein sequence errors
 */
class ProteinError : public std::runtime_error {
public:
    ProteinError(ProteinErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ProteinErrorKind kind() const noexcept { return kind_; }

private:
    ProteinErrorKind kind_;
};

/**
 * @brief Optional requirements checked by ProteinSequence::check()
 */
struct ValidationOptions {
    bool require_methionine = false;
    bool require_stop = false;
    size_t minimum_length = 2;
};

/**
 * @brief Validated amino-acid sequence
 *
 * Input is cleaned (whitespace removed, upper-cased) and validated against
 * the 20 standard residues plus an optional terminal stop '*'.
 */
class ProteinSequence {
public:
    explicit ProteinSequence(std::string_view residues);
    ProteinSequence(std::string_view residues, std::string id);

    ProteinSequence(const ProteinSequence&) = default;
    ProteinSequence(ProteinSequence&&) noexcept = default;
    ProteinSequence& operator=(const ProteinSequence&) = default;
    ProteinSequence& operator=(ProteinSequence&&) noexcept = default;
    ~ProteinSequence() = default;

    // Getters
    [[nodiscard]] const std::string& residues() const noexcept { return residues_; }
    [[nodiscard]] size_t length() const noexcept { return residues_.length(); }
    [[nodiscard]] const std::optional<std::string>& id() const noexcept { return id_; }

    [[nodiscard]] auto begin() const noexcept { return residues_.begin(); }
    [[nodiscard]] auto end() const noexcept { return residues_.end(); }

    [[nodiscard]] char operator[](size_t index) const { return residues_[index]; }
    [[nodiscard]] char at(size_t index) const { return residues_.at(index); }

    // Content
    [[nodiscard]] bool startsWithMethionine() const noexcept;
    [[nodiscard]] bool endsWithStop() const noexcept;
    [[nodiscard]] std::map<char, size_t> composition() const;

    // Average residue mass of 110 Da, stop symbol excluded
    [[nodiscard]] double estimatedMolecularWeight() const noexcept;

    /**
     * @brief Composition-based warnings that may affect expression
     *
     * High cysteine (> 10%), proline or glycine runs of 4+, and hydrophobic
     * fraction above 50%. Warnings, not errors.
     */
    [[nodiscard]] std::vector<std::string> expressionWarnings() const;

    /**
     * @brief Problems with respect to the given options, empty if none
     */
    [[nodiscard]] std::vector<std::string> check(const ValidationOptions& options) const;

    /**
     * @brief Copy with a leading 'M' and/or trailing '*' added when missing
     */
    [[nodiscard]] ProteinSequence normalized(bool add_methionine = true,
                                             bool add_stop = true) const;

    [[nodiscard]] bool operator==(const ProteinSequence& other) const = default;

private:
    std::string residues_;
    std::optional<std::string> id_;

    static std::string clean(std::string_view residues);
    static void validate(const std::string& residues);
};

/**
 * @brief Format a weight in Daltons for display ("12.5 kDa", "880 Da")
 */
[[nodiscard]] std::string formatMolecularWeight(double weight_da);

} // namespace codonbeam
