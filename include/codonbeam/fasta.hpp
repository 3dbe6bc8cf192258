#pragma once

#include "codonbeam/protein.hpp"
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace codonbeam {

/**
 * @brief Exception class for FASTA input errors
 */
class FastaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief One protein record read from FASTA
 */
struct FastaRecord {
    std::string name;
    std::string description;
    std::string original;       // residues as read, whitespace removed
    ProteinSequence protein;    // cleaned and normalized
    size_t order;               // 1-based position in the file
};

/**
 * @brief Records plus the auto-corrections and problems found on the way
 */
struct FastaParseResult {
    std::vector<FastaRecord> records;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

struct FastaOptions {
    bool add_methionine = true;
    bool add_stop = true;
    size_t minimum_length = 3;
};

/**
 * @brief Parse protein FASTA text
 *
 * Header forms accepted: ">Name [description]", ">Name|description" and
 * ">Name description". Characters outside the residue alphabet are dropped
 * from sequence lines. Per-record problems go to errors; the record is then
 * skipped.
 *
 * @throws FastaError if the text is empty or has no header line
 */
[[nodiscard]] FastaParseResult parseFasta(std::string_view content,
                                          const FastaOptions& options = {});

[[nodiscard]] FastaParseResult readFasta(std::istream& in,
                                         const FastaOptions& options = {});

/**
 * @brief Write one FASTA record with sequence lines wrapped at width
 */
void writeFasta(std::ostream& os, std::string_view header,
                std::string_view sequence, size_t width = 60);

} // namespace codonbeam
