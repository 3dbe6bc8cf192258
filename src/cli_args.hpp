#pragma once

#include "codonbeam/config.hpp"
#include "codonbeam/log.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace codonbeam {
namespace cli {

/**
 * @brief Thrown to stop argument parsing with an exit status
 *
 * Status 0 for --help, 2 for usage errors. what() holds the message to
 * print, empty for --help.
 */
class ArgsExit : public std::runtime_error {
public:
    explicit ArgsExit(int code, const std::string& message = {})
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};

struct Options {
    std::string input_file;       // protein FASTA, "-" for stdin
    std::string protein;          // single sequence given with --protein
    std::string scores_file;
    std::string exclusions_file;
    std::vector<std::string> enzymes;
    bool golden_gate = false;
    std::string promoter;
    std::string config_file;
    bool normalize = true;        // add missing leading M and trailing *
    LogLevel log_level = LogLevel::Info;

    // Overrides applied on top of the config file
    std::optional<size_t> beam_width;
    std::optional<size_t> max_homopolymer;
    std::optional<size_t> paths_per_state;  // --state-grouped N
    std::optional<size_t> threads;
    bool no_unique_sixmers = false;
    bool no_homopolymer = false;
    bool codon_run_diversity = false;
    bool distinct_repeats = false;
    bool partial_context = false;
};

void printUsage(std::ostream& os, const char* program_name);

/**
 * @brief Parse command-line arguments
 * @throws ArgsExit for --help and for any usage error
 */
[[nodiscard]] Options parseArgs(int argc, const char* const argv[]);

/**
 * @brief Engine configuration: config file (if any), then flag overrides
 * @throws ConfigError if the file is unreadable or the result is invalid
 */
[[nodiscard]] OptimizerConfig buildConfig(const Options& opts);

/**
 * @brief Enzymes from --enzymes, --golden-gate and --promoter, first mention kept
 */
[[nodiscard]] std::vector<std::string> requestedEnzymes(const Options& opts);

} // namespace cli
} // namespace codonbeam
