#pragma once

#include "codonbeam/exclusion.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace codonbeam {

enum class EnzymeType {
    TypeII,
    TypeIIS  // cuts outside its site; used for Golden Gate assembly
};

/**
 * @brief A restriction enzyme and its recognition site (IUPAC)
 */
struct RestrictionEnzyme {
    std::string_view name;
    std::string_view site;
    EnzymeType type;
};

/**
 * @brief All registered enzymes, in registry order
 */
[[nodiscard]] std::span<const RestrictionEnzyme> restrictionEnzymes() noexcept;

[[nodiscard]] std::optional<RestrictionEnzyme> findEnzyme(std::string_view name) noexcept;

/**
 * @brief Enzymes excluded when Golden Gate assembly is used
 */
[[nodiscard]] std::vector<std::string> goldenGateEnzymes();

/**
 * @brief Enzymes whose sites occur in the named promoter; empty if unknown
 */
[[nodiscard]] std::vector<std::string> enzymesForPromoter(std::string_view promoter);

/**
 * @brief Exclusion list text for the named enzymes
 *
 * A ">name" line before each motif. Non-palindromic
 * sites also get their reverse complement. Duplicates are written once.
 *
 * @throws ExclusionError for an unknown enzyme name
 */
[[nodiscard]] std::string exclusionTextForEnzymes(std::span<const std::string> names);

/**
 * @brief Parsed form of exclusionTextForEnzymes()
 */
[[nodiscard]] ExclusionSet exclusionsForEnzymes(std::span<const std::string> names);

} // namespace codonbeam
