#include "cli_args.hpp"
#include "codonbeam/analysis.hpp"
#include "codonbeam/beam_search.hpp"
#include "codonbeam/fasta.hpp"
#include "codonbeam/log.hpp"
#include "codonbeam/restriction_enzymes.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace codonbeam;

namespace {

struct Job {
    std::string name;
    std::string residues;
};

std::vector<Job> collectJobs(const cli::Options& opts, const Logger& log, bool& input_ok) {
    std::vector<Job> jobs;

    if (!opts.protein.empty()) {
        ProteinSequence protein(opts.protein);
        if (opts.normalize) protein = protein.normalized();
        jobs.push_back({"protein", protein.residues()});
        return jobs;
    }

    FastaOptions fasta_options;
    fasta_options.add_methionine = opts.normalize;
    fasta_options.add_stop = opts.normalize;

    FastaParseResult parsed;
    if (opts.input_file == "-") {
        parsed = readFasta(std::cin, fasta_options);
    } else {
        std::ifstream in(opts.input_file);
        if (!in) {
            throw FastaError("Cannot open input file " + opts.input_file);
        }
        parsed = readFasta(in, fasta_options);
    }

    for (const auto& warning : parsed.warnings) log.warn(warning);
    for (const auto& error : parsed.errors) log.error(error);
    input_ok = parsed.ok();

    for (auto& record : parsed.records) {
        jobs.push_back({std::move(record.name), record.protein.residues()});
    }
    return jobs;
}

ExclusionSet collectExclusions(const cli::Options& opts, const Logger& log) {
    ExclusionSet exclusions;
    if (!opts.exclusions_file.empty()) {
        exclusions = ExclusionSet::fromFile(opts.exclusions_file);
    }

    auto enzymes = cli::requestedEnzymes(opts);
    if (!enzymes.empty()) {
        exclusions.merge(exclusionsForEnzymes(enzymes));
        std::string list;
        for (const auto& name : enzymes) {
            if (!list.empty()) list += ", ";
            list += name;
        }
        log.info("Excluding restriction sites: " + list);
    }
    return exclusions;
}

std::string resultHeader(const Job& job, const OptimizationResult& result) {
    std::ostringstream oss;
    oss << job.name << std::fixed << std::setprecision(4)
        << " score=" << *result.score
        << std::setprecision(3) << " gc=" << analysis::gcContent(*result.dna)
        << " time=" << formatDuration(result.elapsed);
    return oss.str();
}

void reportStats(const Logger& log, const Job& job, const OptimizationResult& result) {
    if (!log.enabled(LogLevel::Debug)) return;

    const auto& stats = result.stats;
    std::ostringstream oss;
    oss << job.name << ": " << stats.steps << " steps, "
        << stats.generated << " extensions, "
        << stats.accepted << " accepted, peak beam " << stats.peak_beam
        << ", score hits " << stats.score_hits << "/" << (stats.score_hits + stats.score_misses);
    log.debug(oss.str());

    for (size_t r = 1; r < kRuleCount; ++r) {
        auto rule = static_cast<Rule>(r);
        if (stats.rejectedBy(rule) == 0) continue;
        log.debug("  rejected by " + std::string(ruleName(rule)) + ": " +
                  std::to_string(stats.rejectedBy(rule)));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    cli::Options opts;
    try {
        opts = cli::parseArgs(argc, argv);
    } catch (const cli::ArgsExit& e) {
        if (e.code() == 0) {
            cli::printUsage(std::cout, argv[0]);
            return 0;
        }
        std::cerr << "Error: " << e.what() << "\n\n";
        cli::printUsage(std::cerr, argv[0]);
        return e.code();
    }

    Logger log(std::cerr, opts.log_level);
    bool all_ok = true;

    try {
        OptimizerConfig config = cli::buildConfig(opts);

        ScoreTable scores = loadScoreTable(opts.scores_file);
        log.info("Loaded " + std::to_string(scores.size()) + " scores across " +
                 std::to_string(scores.contextCount()) + " contexts");
        if (scores.empty()) {
            log.warn("Score table is empty; every candidate will score 0");
        }

        ExclusionSet exclusions = collectExclusions(opts, log);
        log.debug("Beam width " + std::to_string(config.beam_width) + ", boundary " +
                  std::string(boundaryPolicyName(config.boundary_policy)) + ", pruning " +
                  std::string(pruningName(config.pruning)) + ", " +
                  std::to_string(exclusions.size()) + " excluded motifs");

        bool input_ok = true;
        auto jobs = collectJobs(opts, log, input_ok);
        all_ok = input_ok;

        BeamSearchOptimizer optimizer(scores, exclusions, config);

        for (const auto& job : jobs) {
            for (const auto& warning : ProteinSequence(job.residues).expressionWarnings()) {
                log.warn(job.name + ": " + warning);
            }

            auto result = optimizer.optimize(job.residues);
            if (!result) {
                all_ok = false;
                log.error(job.name + ": " + std::string(errorCodeName(result.error)) + ": " +
                          result.message);
                continue;
            }

            writeFasta(std::cout, resultHeader(job, result), *result.dna);
            reportStats(log, job, result);
        }

        log.info("Optimized " + std::to_string(jobs.size()) + " sequence(s)");

    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }

    return all_ok ? 0 : 1;
}
