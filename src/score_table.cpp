#include "codonbeam/score_table.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>

namespace codonbeam {

// ============================================================================
// Key Packing
// ============================================================================

std::optional<ContextKey> packContext(std::string_view residues) noexcept {
    if (residues.empty() || residues.length() > 3) return std::nullopt;

    ContextKey key = static_cast<ContextKey>(residues.length()) << 15;
    for (size_t i = 0; i < residues.length(); ++i) {
        int r = residueIndex(residues[i]);
        if (r < 0) return std::nullopt;
        key |= static_cast<ContextKey>(r) << (10 - 5 * i);
    }
    return key;
}

std::optional<WindowKey> packWindow(std::string_view dna) noexcept {
    if (dna.empty() || dna.length() > 9 || dna.length() % 3 != 0) return std::nullopt;

    WindowKey key = 0;
    for (size_t i = 0; i < dna.length(); i += 3) {
        auto codon = packCodon(dna.substr(i, 3));
        if (!codon) return std::nullopt;
        key = (key << 6) | *codon;
    }
    return key;
}

// ============================================================================
// ScoreTable Implementation
// ============================================================================

ScoreTable::ScoreTable(const CodonTable& codons) : codons_(&codons) {}

void ScoreTable::insert(std::string_view context, std::string_view window, double score) {
    auto ctx = packContext(context);
    if (!ctx) {
        throw ScoreTableError("Invalid amino-acid context '" + std::string(context) + "'");
    }
    auto win = packWindow(window);
    if (!win || window.length() != 3 * context.length()) {
        throw ScoreTableError("Invalid window '" + std::string(window) +
                              "' for context '" + std::string(context) + "'");
    }

    for (size_t i = 0; i < context.length(); ++i) {
        auto aa = codons_->translateCodon(window.substr(3 * i, 3));
        char expected = static_cast<char>(std::toupper(static_cast<unsigned char>(context[i])));
        if (!aa || *aa != expected) {
            throw ScoreTableError("Window '" + std::string(window) +
                                  "' does not encode context '" + std::string(context) + "'");
        }
    }

    if (scores_.insert_or_assign(combine(*ctx, *win), score).second) {
        contexts_[*ctx]++;
    }
}

std::optional<double> ScoreTable::lookup(std::string_view context,
                                         std::string_view window) const noexcept {
    auto ctx = packContext(context);
    auto win = packWindow(window);
    if (!ctx || !win) return std::nullopt;
    return lookup(*ctx, *win);
}

bool ScoreTable::containsContext(std::string_view context) const noexcept {
    auto ctx = packContext(context);
    return ctx && contexts_.contains(*ctx);
}

ScoreTable ScoreTable::fromJson(const nlohmann::json& doc, const CodonTable& codons) {
    const nlohmann::json& body =
        (doc.is_object() && doc.contains("ninemer_scores")) ? doc.at("ninemer_scores") : doc;

    if (!body.is_object()) {
        throw ScoreTableError("Scoring table must be a JSON object");
    }

    ScoreTable table(codons);
    for (const auto& [context, windows] : body.items()) {
        if (!windows.is_object()) {
            throw ScoreTableError("Entry for context '" + context + "' is not an object");
        }
        for (const auto& [window, score] : windows.items()) {
            if (!score.is_number()) {
                throw ScoreTableError("Score for " + context + "/" + window + " is not a number");
            }
            table.insert(context, window, score.get<double>());
        }
    }

    return table;
}

ScoreTable loadScoreTable(const std::filesystem::path& path, const CodonTable& codons) {
    std::ifstream in(path);
    if (!in) {
        throw ScoreTableError("Cannot open scoring table " + path.string());
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ScoreTableError("Cannot parse scoring table " + path.string() + ": " + e.what());
    }

    return ScoreTable::fromJson(doc, codons);
}

} // namespace codonbeam
