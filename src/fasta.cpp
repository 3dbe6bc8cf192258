#include "codonbeam/fasta.hpp"
#include "codonbeam/codon_table.hpp"
#include <algorithm>
#include <cctype>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>

namespace codonbeam {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

struct Header {
    std::string name;
    std::string description;
};

Header parseHeader(std::string_view header) {
    Header h;

    size_t name_end = 0;
    while (name_end < header.length()) {
        char c = header[name_end];
        if (std::isspace(static_cast<unsigned char>(c)) || c == '[' || c == '|') break;
        ++name_end;
    }
    h.name = name_end > 0 ? std::string(header.substr(0, name_end)) : "Protein";

    auto open = header.find('[');
    auto close = open == std::string_view::npos ? open : header.find(']', open);
    if (open != std::string_view::npos && close != std::string_view::npos) {
        h.description = std::string(trim(header.substr(open + 1, close - open - 1)));
    } else if (auto bar = header.find('|'); bar != std::string_view::npos) {
        h.description = std::string(trim(header.substr(bar + 1)));
    } else {
        // Remaining words, single-space separated
        std::istringstream words{std::string(header.substr(name_end))};
        std::string word;
        while (words >> word) {
            if (!h.description.empty()) h.description += ' ';
            h.description += word;
        }
    }

    return h;
}

void finishRecord(FastaParseResult& result, std::string_view header,
                  const std::string& raw, const FastaOptions& options) {
    const size_t order = result.records.size() + result.errors.size() + 1;
    Header h = parseHeader(header);
    const std::string label = "Protein " + std::to_string(order) + " (" + h.name + ")";

    std::string cleaned;
    cleaned.reserve(raw.length());
    for (char c : raw) {
        char up = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (isResidue(up)) cleaned += up;
    }

    const bool had_met = !cleaned.empty() && cleaned.front() == 'M';
    const bool had_stop = !cleaned.empty() && cleaned.back() == kStopResidue;
    if (options.add_methionine && !had_met) {
        cleaned.insert(cleaned.begin(), 'M');
    }
    if (options.add_stop && !had_stop) {
        cleaned += kStopResidue;
    }

    if (cleaned.length() < options.minimum_length) {
        result.errors.push_back(label + ": sequence too short (minimum " +
                                std::to_string(options.minimum_length) + " amino acids)");
        return;
    }

    try {
        FastaRecord record{h.name, h.description, raw,
                           ProteinSequence(cleaned, h.name), order};
        result.records.push_back(std::move(record));
    } catch (const ProteinError& e) {
        result.errors.push_back(label + ": " + e.what());
        return;
    }

    if (options.add_methionine && !had_met) {
        result.warnings.push_back(label + ": did not start with methionine (M) - added automatically");
    }
    if (options.add_stop && !had_stop) {
        result.warnings.push_back(label + ": did not end with stop codon (*) - added automatically");
    }
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

FastaParseResult parseFasta(std::string_view content, const FastaOptions& options) {
    if (trim(content).empty()) {
        throw FastaError("FASTA input is empty");
    }
    if (content.find('>') == std::string_view::npos) {
        throw FastaError("Input does not appear to be FASTA (no header lines found)");
    }

    FastaParseResult result;
    std::optional<std::string> header;
    std::string residues;

    size_t pos = 0;
    while (pos <= content.length()) {
        size_t eol = content.find('\n', pos);
        if (eol == std::string_view::npos) eol = content.length();
        std::string_view line = trim(content.substr(pos, eol - pos));
        pos = eol + 1;

        if (!line.empty() && line.front() == '>') {
            if (header && !residues.empty()) {
                finishRecord(result, *header, residues, options);
            }
            header = std::string(line.substr(1));
            residues.clear();
        } else if (!line.empty() && header) {
            for (char c : line) {
                if (!std::isspace(static_cast<unsigned char>(c))) residues += c;
            }
        }
    }

    if (header && !residues.empty()) {
        finishRecord(result, *header, residues, options);
    }

    if (result.records.empty() && result.errors.empty()) {
        result.errors.emplace_back("No valid sequences found in input");
    }

    return result;
}

FastaParseResult readFasta(std::istream& in, const FastaOptions& options) {
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        throw FastaError("Failed to read FASTA input");
    }
    return parseFasta(content, options);
}

// ============================================================================
// Writing
// ============================================================================

void writeFasta(std::ostream& os, std::string_view header,
                std::string_view sequence, size_t width) {
    os << '>' << header << '\n';
    if (width == 0) width = sequence.length();

    for (size_t i = 0; i < sequence.length(); i += width) {
        os << sequence.substr(i, width) << '\n';
    }
}

} // namespace codonbeam
