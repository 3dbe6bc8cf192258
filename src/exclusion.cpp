#include "codonbeam/exclusion.hpp"
#include "codonbeam/codon_table.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace codonbeam {

namespace {

constexpr std::string_view kCodonAlignedSuffix = "@codon";

constexpr uint8_t maskOf(char c) noexcept {
    switch (c) {
        case 'A': return 0b0001;
        case 'C': return 0b0010;
        case 'G': return 0b0100;
        case 'T': case 'U': return 0b1000;
        case 'R': return 0b0101;
        case 'Y': return 0b1010;
        case 'M': return 0b0011;
        case 'K': return 0b1100;
        case 'S': return 0b0110;
        case 'W': return 0b1001;
        case 'B': return 0b1110;
        case 'V': return 0b0111;
        case 'D': return 0b1101;
        case 'H': return 0b1011;
        case 'N': case '.': return 0b1111;
        default: return 0;
    }
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

char upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

} // namespace

// ============================================================================
// Motif
// ============================================================================

bool Motif::matchesAt(std::string_view dna, size_t pos) const noexcept {
    for (size_t i = 0; i < masks.size(); ++i) {
        int b = baseIndex(dna[pos + i]);
        if (b < 0 || (masks[i] & (1u << b)) == 0) return false;
    }
    return true;
}

Motif parseMotif(std::string_view pattern, std::string name, bool codon_aligned) {
    Motif motif;
    motif.pattern = std::string(pattern);
    motif.name = name.empty() ? motif.pattern : std::move(name);
    motif.codon_aligned = codon_aligned;

    auto fail = [&](const std::string& why) {
        return ExclusionError("Invalid motif '" + std::string(pattern) + "': " + why);
    };

    size_t i = 0;
    while (i < pattern.length()) {
        char c = upper(pattern[i]);
        uint8_t mask = 0;

        if (c == '[') {
            auto close = pattern.find(']', i);
            if (close == std::string_view::npos) throw fail("unterminated '['");
            for (size_t j = i + 1; j < close; ++j) {
                uint8_t m = maskOf(upper(pattern[j]));
                if (m == 0) throw fail("unsupported character in class");
                mask |= m;
            }
            if (mask == 0) throw fail("empty class");
            i = close + 1;
        } else {
            mask = maskOf(c);
            if (mask == 0) throw fail("unsupported character '" + std::string(1, pattern[i]) + "'");
            ++i;
        }

        size_t repeat = 1;
        if (i < pattern.length() && pattern[i] == '{') {
            auto close = pattern.find('}', i);
            if (close == std::string_view::npos) throw fail("unterminated '{'");
            auto digits = pattern.substr(i + 1, close - i - 1);
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), repeat);
            if (ec == std::errc::result_out_of_range) throw fail("repeat count too large");
            if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
                throw fail("repeat count must be a number");
            }
            if (repeat == 0) throw fail("repeat count must be positive");
            i = close + 1;
        }

        if (repeat > kMaxMotifLength - motif.masks.size()) {
            throw fail("longer than " + std::to_string(kMaxMotifLength) + " bases");
        }
        motif.masks.insert(motif.masks.end(), repeat, mask);
    }

    if (motif.masks.empty()) throw fail("empty motif");
    return motif;
}

// ============================================================================
// ExclusionSet Implementation
// ============================================================================

ExclusionSet ExclusionSet::parse(std::string_view text) {
    ExclusionSet set;
    std::string pending_name;

    size_t line_no = 0;
    size_t pos = 0;
    while (pos < text.length()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.length();
        std::string_view line = text.substr(pos, eol - pos);
        pos = eol + 1;
        ++line_no;

        if (auto hash = line.find('#'); hash != std::string_view::npos) {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '>') {
            pending_name = std::string(trim(line.substr(1)));
            continue;
        }

        bool aligned = false;
        if (line.ends_with(kCodonAlignedSuffix)) {
            aligned = true;
            line = trim(line.substr(0, line.length() - kCodonAlignedSuffix.length()));
        }

        try {
            set.add(parseMotif(line, std::move(pending_name), aligned));
        } catch (const ExclusionError& e) {
            throw ExclusionError("Line " + std::to_string(line_no) + ": " + e.what());
        }
        pending_name.clear();
    }

    return set;
}

ExclusionSet ExclusionSet::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ExclusionError("Cannot open exclusion list " + path.string());
    }
    std::ostringstream content;
    content << in.rdbuf();
    return parse(content.str());
}

void ExclusionSet::add(Motif motif) {
    max_length_ = std::max(max_length_, motif.length());
    motifs_.push_back(std::move(motif));
}

void ExclusionSet::merge(const ExclusionSet& other) {
    for (const auto& m : other.motifs_) {
        add(m);
    }
}

std::optional<MotifHit> ExclusionSet::firstHitEndingIn(std::string_view dna, size_t first_new,
                                                       size_t offset) const noexcept {
    for (size_t idx = 0; idx < motifs_.size(); ++idx) {
        const Motif& m = motifs_[idx];
        const size_t len = m.length();
        if (len > dna.length()) continue;

        size_t start = first_new + 1 > len ? first_new + 1 - len : 0;
        for (size_t s = start; s + len <= dna.length(); ++s) {
            if (m.codon_aligned && (offset + s) % 3 != 0) continue;
            if (m.matchesAt(dna, s)) {
                return MotifHit{offset + s, idx};
            }
        }
    }
    return std::nullopt;
}

bool ExclusionSet::matchesEndingIn(std::string_view dna, size_t first_new,
                                   size_t offset) const noexcept {
    return firstHitEndingIn(dna, first_new, offset).has_value();
}

std::vector<MotifHit> ExclusionSet::findAll(std::string_view dna) const {
    std::vector<MotifHit> hits;

    for (size_t idx = 0; idx < motifs_.size(); ++idx) {
        const Motif& m = motifs_[idx];
        if (m.length() > dna.length()) continue;

        for (size_t s = 0; s + m.length() <= dna.length(); ++s) {
            if (m.codon_aligned && s % 3 != 0) continue;
            if (m.matchesAt(dna, s)) {
                hits.push_back({s, idx});
            }
        }
    }

    std::ranges::sort(hits, [](const MotifHit& a, const MotifHit& b) {
        return a.position != b.position ? a.position < b.position : a.motif < b.motif;
    });
    return hits;
}

} // namespace codonbeam
