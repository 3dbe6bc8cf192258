#include <gtest/gtest.h>
#include "cli_args.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace codonbeam;
using namespace codonbeam::cli;

namespace {

Options parse(std::vector<const char*> args) {
    args.insert(args.begin(), "codonbeam");
    return parseArgs(static_cast<int>(args.size()), args.data());
}

int exitCode(std::vector<const char*> args) {
    try {
        (void)parse(std::move(args));
    } catch (const ArgsExit& e) {
        return e.code();
    }
    return -1;
}

} // namespace

// ============================================================================
// Parsing Tests
// ============================================================================

TEST(CliArgsTest, MinimalProtein) {
    auto opts = parse({"--scores", "s.json", "--protein", "MKT"});
    EXPECT_EQ(opts.scores_file, "s.json");
    EXPECT_EQ(opts.protein, "MKT");
    EXPECT_TRUE(opts.input_file.empty());
    EXPECT_TRUE(opts.normalize);
    EXPECT_EQ(opts.log_level, LogLevel::Info);
}

TEST(CliArgsTest, PositionalInput) {
    auto opts = parse({"in.fasta", "--scores", "s.json", "-q"});
    EXPECT_EQ(opts.input_file, "in.fasta");
    EXPECT_EQ(opts.log_level, LogLevel::Error);
}

TEST(CliArgsTest, AllSearchFlags) {
    auto opts = parse({"--scores", "s.json", "--protein", "MKT",
                       "--beam-width", "50", "--max-homopolymer", "3",
                       "--no-unique-sixmers", "--codon-run-diversity", "--distinct-repeats",
                       "--partial-context", "--state-grouped", "4", "-t", "8",
                       "--no-normalize", "--verbose"});

    EXPECT_EQ(opts.beam_width, 50);
    EXPECT_EQ(opts.max_homopolymer, 3);
    EXPECT_TRUE(opts.no_unique_sixmers);
    EXPECT_TRUE(opts.codon_run_diversity);
    EXPECT_TRUE(opts.distinct_repeats);
    EXPECT_TRUE(opts.partial_context);
    EXPECT_EQ(opts.paths_per_state, 4);
    EXPECT_EQ(opts.threads, 8);
    EXPECT_FALSE(opts.normalize);
    EXPECT_EQ(opts.log_level, LogLevel::Debug);
}

TEST(CliArgsTest, EnzymeList) {
    auto opts = parse({"--scores", "s.json", "--protein", "MKT", "--enzymes", "BsaI,EcoRI"});
    EXPECT_EQ(opts.enzymes, (std::vector<std::string>{"BsaI", "EcoRI"}));
}

TEST(CliArgsTest, HelpExitsZero) {
    EXPECT_EQ(exitCode({"--help"}), 0);
    EXPECT_EQ(exitCode({"-h", "--bogus"}), 0);
}

TEST(CliArgsTest, UsageErrors) {
    EXPECT_EQ(exitCode({"--protein", "MKT"}), 2);
    EXPECT_EQ(exitCode({"--scores", "s.json"}), 2);
    EXPECT_EQ(exitCode({"--scores", "s.json", "--protein", "MKT", "in.fasta"}), 2);
    EXPECT_EQ(exitCode({"--scores", "s.json", "a.fasta", "b.fasta"}), 2);
    EXPECT_EQ(exitCode({"--scores"}), 2);
    EXPECT_EQ(exitCode({"--scores", "s.json", "--protein", "MKT", "--beam-width", "ten"}), 2);
    EXPECT_EQ(exitCode({"--scores", "s.json", "--protein", "MKT", "--beam-width", "0"}), 2);
    EXPECT_EQ(exitCode({"--scores", "s.json", "--protein", "MKT", "--enzymes", "Nope"}), 2);
    EXPECT_EQ(exitCode({"--scores", "s.json", "--protein", "MKT", "--promoter", "CMV"}), 2);
    EXPECT_EQ(exitCode({"--scores", "s.json", "--protein", "MKT", "--frobnicate"}), 2);
}

TEST(CliArgsTest, StdinInput) {
    auto opts = parse({"--scores", "s.json", "-"});
    EXPECT_EQ(opts.input_file, "-");
}

TEST(CliArgsTest, PrintUsageMentionsScores) {
    std::ostringstream out;
    printUsage(out, "codonbeam");
    EXPECT_NE(out.str().find("--scores"), std::string::npos);
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST(CliArgsTest, BuildConfigDefaults) {
    auto config = buildConfig(parse({"--scores", "s.json", "--protein", "MKT"}));
    EXPECT_EQ(config.beam_width, 100);
    EXPECT_EQ(config.pruning, PruningStrategy::Global);
}

TEST(CliArgsTest, BuildConfigOverrides) {
    auto config = buildConfig(parse({"--scores", "s.json", "--protein", "MKT",
                                     "--beam-width", "5", "--no-homopolymer",
                                     "--state-grouped", "3", "--partial-context"}));
    EXPECT_EQ(config.beam_width, 5);
    EXPECT_FALSE(config.constraints.enforce_homopolymer_diversity);
    EXPECT_EQ(config.pruning, PruningStrategy::StateGrouped);
    EXPECT_EQ(config.paths_per_state, 3);
    EXPECT_EQ(config.boundary_policy, BoundaryPolicy::PartialContext);
}

TEST(CliArgsTest, FlagsOverrideConfigFile) {
    auto path = std::filesystem::temp_directory_path() / "codonbeam_cli_config.json";
    {
        std::ofstream out(path);
        out << R"({"beam_width": 40, "threads": 2})";
    }

    auto config = buildConfig(parse({"--scores", "s.json", "--protein", "MKT",
                                     "--config", path.c_str(), "--beam-width", "8"}));
    EXPECT_EQ(config.beam_width, 8);
    EXPECT_EQ(config.threads, 2);
    std::filesystem::remove(path);
}

TEST(CliArgsTest, MissingConfigFileThrows) {
    auto opts = parse({"--scores", "s.json", "--protein", "MKT",
                       "--config", "/nonexistent/config.json"});
    EXPECT_THROW((void)buildConfig(opts), ConfigError);
}

// ============================================================================
// Enzyme Selection Tests
// ============================================================================

TEST(CliArgsTest, RequestedEnzymesMergedInOrder) {
    auto opts = parse({"--scores", "s.json", "--protein", "MKT",
                       "--enzymes", "PmeI,EcoRI", "--promoter", "AOX1", "--golden-gate"});
    auto names = requestedEnzymes(opts);

    EXPECT_EQ(names, (std::vector<std::string>{
        "PmeI", "EcoRI", "BsaI", "BbsI", "BsmBI", "SapI", "SwaI"}));
}
