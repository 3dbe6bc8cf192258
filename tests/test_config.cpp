#include <gtest/gtest.h>
#include "codonbeam/config.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace codonbeam;

TEST(OptimizerConfigTest, Defaults) {
    OptimizerConfig config;
    EXPECT_EQ(config.beam_width, 100);
    EXPECT_TRUE(config.constraints.enforce_unique_sixmers);
    EXPECT_TRUE(config.constraints.enforce_homopolymer_diversity);
    EXPECT_EQ(config.constraints.max_homopolymer_run, 4);
    EXPECT_TRUE(config.constraints.enforce_exclusions);
    EXPECT_FALSE(config.constraints.enforce_codon_run_diversity);
    EXPECT_FALSE(config.constraints.enforce_distinct_repeats);
    EXPECT_EQ(config.boundary_policy, BoundaryPolicy::FixedPrior);
    EXPECT_DOUBLE_EQ(config.boundary_prior, 0.0);
    EXPECT_EQ(config.pruning, PruningStrategy::Global);
    EXPECT_EQ(config.threads, 0);
    EXPECT_NO_THROW(config.validate());
}

TEST(OptimizerConfigTest, ValidateRejectsZeroBeam) {
    OptimizerConfig config;
    config.beam_width = 0;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(OptimizerConfigTest, ValidateHomopolymerLimit) {
    OptimizerConfig config;
    config.constraints.max_homopolymer_run = 0;
    EXPECT_THROW(config.validate(), ConfigError);

    config.constraints.enforce_homopolymer_diversity = false;
    EXPECT_NO_THROW(config.validate());
}

TEST(OptimizerConfigTest, ValidateThreadLimit) {
    OptimizerConfig config;
    config.threads = OptimizerConfig::kMaxThreads;
    EXPECT_NO_THROW(config.validate());

    config.threads = OptimizerConfig::kMaxThreads + 1;
    EXPECT_THROW(config.validate(), ConfigError);

    auto doc = nlohmann::json::parse(R"({"threads": 4294967296})");
    EXPECT_THROW((void)OptimizerConfig::fromJson(doc), ConfigError);
}

TEST(OptimizerConfigTest, ValidatePathsPerState) {
    OptimizerConfig config;
    config.paths_per_state = 0;
    EXPECT_NO_THROW(config.validate());

    config.pruning = PruningStrategy::StateGrouped;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(OptimizerConfigTest, FromJsonSnakeCase) {
    auto doc = nlohmann::json::parse(R"({
        "beam_width": 25,
        "enforce_unique_sixmers": false,
        "max_homopolymer_run": 3,
        "boundary_policy": "partial_context",
        "pruning": "state_grouped",
        "paths_per_state": 4,
        "threads": 2
    })");

    auto config = OptimizerConfig::fromJson(doc);
    EXPECT_EQ(config.beam_width, 25);
    EXPECT_FALSE(config.constraints.enforce_unique_sixmers);
    EXPECT_EQ(config.constraints.max_homopolymer_run, 3);
    EXPECT_EQ(config.boundary_policy, BoundaryPolicy::PartialContext);
    EXPECT_EQ(config.pruning, PruningStrategy::StateGrouped);
    EXPECT_EQ(config.paths_per_state, 4);
    EXPECT_EQ(config.threads, 2);
}

TEST(OptimizerConfigTest, FromJsonCamelCase) {
    auto doc = nlohmann::json::parse(R"({
        "beamWidth": 12,
        "enforceHomopolymerDiversity": false,
        "enforceDistinctRepeats": true,
        "boundaryPrior": -0.25
    })");

    auto config = OptimizerConfig::fromJson(doc);
    EXPECT_EQ(config.beam_width, 12);
    EXPECT_FALSE(config.constraints.enforce_homopolymer_diversity);
    EXPECT_TRUE(config.constraints.enforce_distinct_repeats);
    EXPECT_DOUBLE_EQ(config.boundary_prior, -0.25);
}

TEST(OptimizerConfigTest, FromJsonDefaultBase) {
    auto config = OptimizerConfig::fromJson(nlohmann::json::parse(R"({"pruning": "state_grouped"})"));
    EXPECT_EQ(config.beam_width, 100);
    EXPECT_EQ(config.pruning, PruningStrategy::StateGrouped);
    EXPECT_EQ(config.paths_per_state, 8);

    EXPECT_EQ(OptimizerConfig::fromJson(nlohmann::json::object()).beam_width, 100);
}

TEST(OptimizerConfigTest, FromJsonOverlaysBase) {
    OptimizerConfig base;
    base.beam_width = 7;
    base.threads = 3;

    auto config = OptimizerConfig::fromJson(nlohmann::json::parse(R"({"threads": 1})"), base);
    EXPECT_EQ(config.beam_width, 7);
    EXPECT_EQ(config.threads, 1);
}

TEST(OptimizerConfigTest, FromJsonRejectsBadInput) {
    using nlohmann::json;
    EXPECT_THROW((void)OptimizerConfig::fromJson(json::array()), ConfigError);
    EXPECT_THROW((void)OptimizerConfig::fromJson(json::parse(R"({"beam": 5})")), ConfigError);
    EXPECT_THROW((void)OptimizerConfig::fromJson(json::parse(R"({"beam_width": -1})")), ConfigError);
    EXPECT_THROW((void)OptimizerConfig::fromJson(json::parse(R"({"beam_width": 0})")), ConfigError);
    EXPECT_THROW((void)OptimizerConfig::fromJson(json::parse(R"({"beam_width": "wide"})")), ConfigError);
    EXPECT_THROW((void)OptimizerConfig::fromJson(json::parse(R"({"enforce_exclusions": 1})")), ConfigError);
    EXPECT_THROW((void)OptimizerConfig::fromJson(json::parse(R"({"pruning": "random"})")), ConfigError);
    EXPECT_THROW((void)OptimizerConfig::fromJson(json::parse(R"({"boundary_policy": "zero"})")), ConfigError);
}

TEST(OptimizerConfigTest, LoadConfigFile) {
    auto path = std::filesystem::temp_directory_path() / "codonbeam_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"beam_width": 33})";
    }

    EXPECT_EQ(loadConfig(path).beam_width, 33);
    std::filesystem::remove(path);

    EXPECT_THROW((void)loadConfig(path), ConfigError);
}

TEST(OptimizerConfigTest, Names) {
    EXPECT_EQ(boundaryPolicyName(BoundaryPolicy::FixedPrior), "fixed_prior");
    EXPECT_EQ(boundaryPolicyName(BoundaryPolicy::PartialContext), "partial_context");
    EXPECT_EQ(pruningName(PruningStrategy::Global), "global");
    EXPECT_EQ(pruningName(PruningStrategy::StateGrouped), "state_grouped");
}
