#include "cli_args.hpp"
#include "codonbeam/restriction_enzymes.hpp"
#include <algorithm>
#include <charconv>
#include <ostream>
#include <string_view>

namespace codonbeam {
namespace cli {

namespace {

std::vector<std::string> splitList(std::string_view text) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.length()) {
        size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) comma = text.length();
        auto item = text.substr(start, comma - start);
        if (!item.empty()) items.emplace_back(item);
        start = comma + 1;
    }
    return items;
}

} // namespace

void printUsage(std::ostream& os, const char* program_name) {
    os << "Usage: " << program_name << " --scores <file> [options] [input.fasta]\n";
    os << "       " << program_name << " --scores <file> [options] --protein <sequence>\n\n";
    os << "Input:\n";
    os << "  --scores <file>          JSON context score table (required)\n";
    os << "  --protein <sequence>     Optimize one protein given on the command line\n";
    os << "  input.fasta              Protein FASTA file, '-' for stdin\n";
    os << "  --no-normalize           Do not add a missing start M or trailing stop\n";
    os << "\nExcluded sequences:\n";
    os << "  --exclusions <file>      Motif file, one pattern per line\n";
    os << "  --enzymes <A,B,...>      Exclude restriction enzyme sites\n";
    os << "  --golden-gate            Exclude every Type IIS site (BsaI, BsmBI, ...)\n";
    os << "  --promoter <name>        Exclude the linearization sites of a promoter\n";
    os << "\nSearch:\n";
    os << "  --config <file>          JSON optimizer configuration\n";
    os << "  --beam-width <int>       Candidates kept per step (default: 100)\n";
    os << "  --max-homopolymer <int>  Longest allowed single-base run (default: 4)\n";
    os << "  --no-homopolymer         Disable the homopolymer limit\n";
    os << "  --no-unique-sixmers      Allow repeated 6-nt windows\n";
    os << "  --codon-run-diversity    Vary codons inside long amino-acid runs\n";
    os << "  --distinct-repeats       Encode repeated peptides differently\n";
    os << "  --partial-context        Score the first two codons from shorter contexts\n";
    os << "  --state-grouped <int>    Keep at most N candidates per last-two-codon state\n";
    os << "  -t, --threads <int>      Expansion threads (default: serial)\n";
    os << "\n";
    os << "  -v, --verbose            Report search statistics\n";
    os << "  -q, --quiet              Errors only\n";
    os << "  -h, --help               Show this help message\n";
}

Options parseArgs(int argc, const char* const argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ArgsExit(2, "Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_size = [&](const std::string& flag, const std::string& value) -> size_t {
            size_t parsed = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                throw ArgsExit(2, "Invalid integer for " + flag + ": " + value);
            }
            return parsed;
        };

        if (arg == "-h" || arg == "--help") {
            throw ArgsExit(0);
        } else if (arg == "--scores") {
            opts.scores_file = require_value(arg);
        } else if (arg == "--protein") {
            opts.protein = require_value(arg);
        } else if (arg == "--exclusions") {
            opts.exclusions_file = require_value(arg);
        } else if (arg == "--enzymes") {
            for (auto& name : splitList(require_value(arg))) {
                if (!findEnzyme(name)) {
                    throw ArgsExit(2, "Unknown restriction enzyme '" + name + "'");
                }
                opts.enzymes.push_back(std::move(name));
            }
        } else if (arg == "--golden-gate") {
            opts.golden_gate = true;
        } else if (arg == "--promoter") {
            opts.promoter = require_value(arg);
            if (enzymesForPromoter(opts.promoter).empty()) {
                throw ArgsExit(2, "Unknown promoter '" + opts.promoter + "'");
            }
        } else if (arg == "--config") {
            opts.config_file = require_value(arg);
        } else if (arg == "--beam-width") {
            opts.beam_width = parse_size(arg, require_value(arg));
            if (*opts.beam_width < 1) {
                throw ArgsExit(2, "--beam-width must be >= 1");
            }
        } else if (arg == "--max-homopolymer") {
            opts.max_homopolymer = parse_size(arg, require_value(arg));
            if (*opts.max_homopolymer < 1) {
                throw ArgsExit(2, "--max-homopolymer must be >= 1");
            }
        } else if (arg == "--no-homopolymer") {
            opts.no_homopolymer = true;
        } else if (arg == "--no-unique-sixmers") {
            opts.no_unique_sixmers = true;
        } else if (arg == "--codon-run-diversity") {
            opts.codon_run_diversity = true;
        } else if (arg == "--distinct-repeats") {
            opts.distinct_repeats = true;
        } else if (arg == "--partial-context") {
            opts.partial_context = true;
        } else if (arg == "--state-grouped") {
            opts.paths_per_state = parse_size(arg, require_value(arg));
            if (*opts.paths_per_state < 1) {
                throw ArgsExit(2, "--state-grouped must be >= 1");
            }
        } else if (arg == "-t" || arg == "--threads") {
            opts.threads = parse_size(arg, require_value(arg));
        } else if (arg == "--no-normalize") {
            opts.normalize = false;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.log_level = LogLevel::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.log_level = LogLevel::Error;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw ArgsExit(2, "Unknown option: " + arg);
        } else if (opts.input_file.empty()) {
            opts.input_file = arg;
        } else {
            throw ArgsExit(2, "Unexpected argument: " + arg);
        }
    }

    if (opts.scores_file.empty()) {
        throw ArgsExit(2, "--scores is required");
    }
    if (opts.input_file.empty() == opts.protein.empty()) {
        throw ArgsExit(2, "Give either an input FASTA file or --protein, not both or neither");
    }

    return opts;
}

OptimizerConfig buildConfig(const Options& opts) {
    OptimizerConfig config;
    if (!opts.config_file.empty()) {
        config = loadConfig(opts.config_file);
    }

    if (opts.beam_width) config.beam_width = *opts.beam_width;
    if (opts.max_homopolymer) config.constraints.max_homopolymer_run = *opts.max_homopolymer;
    if (opts.no_homopolymer) config.constraints.enforce_homopolymer_diversity = false;
    if (opts.no_unique_sixmers) config.constraints.enforce_unique_sixmers = false;
    if (opts.codon_run_diversity) config.constraints.enforce_codon_run_diversity = true;
    if (opts.distinct_repeats) config.constraints.enforce_distinct_repeats = true;
    if (opts.partial_context) config.boundary_policy = BoundaryPolicy::PartialContext;
    if (opts.paths_per_state) {
        config.pruning = PruningStrategy::StateGrouped;
        config.paths_per_state = *opts.paths_per_state;
    }
    if (opts.threads) config.threads = *opts.threads;

    config.validate();
    return config;
}

std::vector<std::string> requestedEnzymes(const Options& opts) {
    std::vector<std::string> names = opts.enzymes;
    if (opts.golden_gate) {
        auto gg = goldenGateEnzymes();
        names.insert(names.end(), gg.begin(), gg.end());
    }
    if (!opts.promoter.empty()) {
        auto sites = enzymesForPromoter(opts.promoter);
        names.insert(names.end(), sites.begin(), sites.end());
    }

    std::vector<std::string> unique;
    for (auto& name : names) {
        if (std::ranges::find(unique, name) == unique.end()) {
            unique.push_back(std::move(name));
        }
    }
    return unique;
}

} // namespace cli
} // namespace codonbeam
