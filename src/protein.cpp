#include "codonbeam/protein.hpp"
#include "codonbeam/codon_table.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace codonbeam {

namespace {

constexpr double kAverageResidueMassDa = 110.0;

bool hasRun(const std::string& residues, char aa, size_t min_length) {
    size_t run = 0;
    for (char c : residues) {
        run = (c == aa) ? run + 1 : 0;
        if (run >= min_length) return true;
    }
    return false;
}

std::string percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (fraction * 100.0) << "%";
    return oss.str();
}

} // namespace

// ============================================================================
// Constructors
// ============================================================================

ProteinSequence::ProteinSequence(std::string_view residues)
    : residues_(clean(residues)) {
    validate(residues_);
}

ProteinSequence::ProteinSequence(std::string_view residues, std::string id)
    : ProteinSequence(residues) {
    id_ = std::move(id);
}

std::string ProteinSequence::clean(std::string_view residues) {
    std::string cleaned;
    cleaned.reserve(residues.length());
    for (char c : residues) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        cleaned += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return cleaned;
}

void ProteinSequence::validate(const std::string& residues) {
    if (residues.empty()) {
        throw ProteinError(ProteinErrorKind::Empty, "Protein sequence is empty");
    }

    for (size_t i = 0; i < residues.length(); ++i) {
        char c = residues[i];
        if (!isResidue(c)) {
            throw ProteinError(ProteinErrorKind::InvalidResidue,
                               "Invalid amino acid '" + std::string(1, c) +
                               "' at position " + std::to_string(i + 1));
        }
        if (c == kStopResidue && i + 1 != residues.length()) {
            throw ProteinError(ProteinErrorKind::MisplacedStop,
                               "Stop '*' at position " + std::to_string(i + 1) +
                               " is not the final residue");
        }
    }
}

// ============================================================================
// Content
// ============================================================================

bool ProteinSequence::startsWithMethionine() const noexcept {
    return !residues_.empty() && residues_.front() == 'M';
}

bool ProteinSequence::endsWithStop() const noexcept {
    return !residues_.empty() && residues_.back() == kStopResidue;
}

std::map<char, size_t> ProteinSequence::composition() const {
    std::map<char, size_t> counts;
    for (char c : residues_) {
        counts[c]++;
    }
    return counts;
}

double ProteinSequence::estimatedMolecularWeight() const noexcept {
    size_t n = residues_.length() - (endsWithStop() ? 1 : 0);
    return static_cast<double>(n) * kAverageResidueMassDa;
}

std::vector<std::string> ProteinSequence::expressionWarnings() const {
    std::vector<std::string> warnings;
    const double n = static_cast<double>(residues_.length());

    auto cys = static_cast<double>(std::ranges::count(residues_, 'C'));
    if (cys / n > 0.1) {
        warnings.push_back("High cysteine content (" + percent(cys / n) +
                           ") - may form disulfide bonds");
    }

    if (hasRun(residues_, 'P', 4)) {
        warnings.emplace_back("Contains proline runs (4+) - may affect folding");
    }
    if (hasRun(residues_, 'G', 4)) {
        warnings.emplace_back("Contains glycine runs (4+) - may affect structure");
    }

    auto hydrophobic = static_cast<double>(std::ranges::count_if(residues_, [](char c) {
        return c == 'A' || c == 'V' || c == 'I' || c == 'L' ||
               c == 'M' || c == 'F' || c == 'W';
    }));
    if (hydrophobic / n > 0.5) {
        warnings.push_back("High hydrophobic content (" + percent(hydrophobic / n) +
                           ") - may have solubility issues");
    }

    return warnings;
}

std::vector<std::string> ProteinSequence::check(const ValidationOptions& options) const {
    std::vector<std::string> problems;

    if (options.require_methionine && !startsWithMethionine()) {
        problems.emplace_back("Must start with methionine (M)");
    }
    if (options.require_stop && !endsWithStop()) {
        problems.emplace_back("Must end with stop codon (*)");
    }
    if (residues_.length() < options.minimum_length) {
        problems.push_back("Must be at least " + std::to_string(options.minimum_length) +
                           " amino acids long");
    }

    return problems;
}

ProteinSequence ProteinSequence::normalized(bool add_methionine, bool add_stop) const {
    std::string result = residues_;
    if (add_methionine && !startsWithMethionine()) {
        result.insert(result.begin(), 'M');
    }
    if (add_stop && !endsWithStop()) {
        result += kStopResidue;
    }

    ProteinSequence seq(result);
    seq.id_ = id_;
    return seq;
}

std::string formatMolecularWeight(double weight_da) {
    std::ostringstream oss;
    if (weight_da >= 1000.0) {
        oss << std::fixed << std::setprecision(1) << (weight_da / 1000.0) << " kDa";
    } else {
        oss << static_cast<long long>(std::llround(weight_da)) << " Da";
    }
    return oss.str();
}

} // namespace codonbeam
