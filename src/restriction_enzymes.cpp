#include "codonbeam/restriction_enzymes.hpp"
#include "codonbeam/codon_table.hpp"
#include <algorithm>
#include <array>
#include <set>
#include <sstream>

namespace codonbeam {

namespace {

constexpr std::array kEnzymes = {
    RestrictionEnzyme{"PmeI",  "GTTTAAAC",   EnzymeType::TypeII},
    RestrictionEnzyme{"SwaI",  "ATTTAAAT",   EnzymeType::TypeII},
    RestrictionEnzyme{"EcoRI", "GAATTC",     EnzymeType::TypeII},
    RestrictionEnzyme{"BamHI", "GGATCC",     EnzymeType::TypeII},
    RestrictionEnzyme{"NotI",  "GCGGCCGC",   EnzymeType::TypeII},
    RestrictionEnzyme{"XhoI",  "CTCGAG",     EnzymeType::TypeII},
    RestrictionEnzyme{"XbaI",  "TCTAGA",     EnzymeType::TypeII},
    RestrictionEnzyme{"SacII", "CCGCGG",     EnzymeType::TypeII},
    RestrictionEnzyme{"KpnI",  "GGTACC",     EnzymeType::TypeII},
    RestrictionEnzyme{"AvrII", "CCTAGG",     EnzymeType::TypeII},
    RestrictionEnzyme{"EcoRV", "GATATC",     EnzymeType::TypeII},
    RestrictionEnzyme{"AleI",  "CACNNNNGTG", EnzymeType::TypeII},
    RestrictionEnzyme{"BsaI",  "GGTCTC",     EnzymeType::TypeIIS},
    RestrictionEnzyme{"BbsI",  "GAAGAC",     EnzymeType::TypeIIS},
    RestrictionEnzyme{"BsmBI", "CGTCTC",     EnzymeType::TypeIIS},
    RestrictionEnzyme{"SapI",  "GCTCTTC",    EnzymeType::TypeIIS},
};

struct PromoterSites {
    std::string_view promoter;
    std::array<std::string_view, 2> enzymes;
};

// Sites present in the promoter that must not appear in the insert
constexpr std::array kPromoterSites = {
    PromoterSites{"AOX1", {"PmeI", "SwaI"}},
    PromoterSites{"GAP",  {"PmeI", ""}},
    PromoterSites{"PGK1", {"PmeI", ""}},
    PromoterSites{"FLD1", {"PmeI", ""}},
    PromoterSites{"TEF1", {"PmeI", ""}},
};

} // namespace

std::span<const RestrictionEnzyme> restrictionEnzymes() noexcept {
    return kEnzymes;
}

std::optional<RestrictionEnzyme> findEnzyme(std::string_view name) noexcept {
    auto it = std::ranges::find(kEnzymes, name, &RestrictionEnzyme::name);
    if (it == kEnzymes.end()) return std::nullopt;
    return *it;
}

std::vector<std::string> goldenGateEnzymes() {
    std::vector<std::string> names;
    for (const auto& e : kEnzymes) {
        if (e.type == EnzymeType::TypeIIS) names.emplace_back(e.name);
    }
    return names;
}

std::vector<std::string> enzymesForPromoter(std::string_view promoter) {
    std::vector<std::string> names;
    auto it = std::ranges::find(kPromoterSites, promoter, &PromoterSites::promoter);
    if (it == kPromoterSites.end()) return names;

    for (auto name : it->enzymes) {
        if (!name.empty()) names.emplace_back(name);
    }
    return names;
}

std::string exclusionTextForEnzymes(std::span<const std::string> names) {
    std::ostringstream text;
    std::set<std::string> seen;

    for (const auto& name : names) {
        auto enzyme = findEnzyme(name);
        if (!enzyme) {
            throw ExclusionError("Unknown restriction enzyme '" + name + "'");
        }

        std::string forward(enzyme->site);
        std::string reverse = reverseComplement(forward);

        if (seen.insert(forward).second) {
            text << '>' << enzyme->name << '\n' << forward << '\n';
        }
        if (reverse != forward && seen.insert(reverse).second) {
            text << '>' << enzyme->name << " (reverse complement)\n" << reverse << '\n';
        }
    }

    return text.str();
}

ExclusionSet exclusionsForEnzymes(std::span<const std::string> names) {
    return ExclusionSet::parse(exclusionTextForEnzymes(names));
}

} // namespace codonbeam
