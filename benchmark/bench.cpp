#include <benchmark/benchmark.h>
#include "codonbeam/analysis.hpp"
#include "codonbeam/beam_search.hpp"
#include "codonbeam/restriction_enzymes.hpp"

#include <random>
#include <string>
#include <vector>

using namespace codonbeam;

// ============================================================================
// Helper Functions
// ============================================================================

static std::string generateRandomProtein(size_t length, unsigned seed = 42) {
    // No stop and no methionine inside the chain
    static const char residues[] = "ACDEFGHIKLNPQRSTVWY";
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 18);

    std::string result = "M";
    result.reserve(length);
    while (result.length() < length) {
        result += residues[dist(rng)];
    }
    return result;
}

static std::string generateRandomDna(const std::string& protein, unsigned seed = 42) {
    const auto& codons = CodonTable::standard();
    std::mt19937 rng(seed);

    std::string dna;
    dna.reserve(3 * protein.length());
    for (char aa : protein) {
        const auto& synonyms = codons.synonyms(aa);
        std::uniform_int_distribution<size_t> dist(0, synonyms.size() - 1);
        dna += synonyms[dist(rng)];
    }
    return dna;
}

// Scores for every synonymous window of every context in protein
static ScoreTable generateScoreTable(const std::string& protein, unsigned seed = 7) {
    const auto& codons = CodonTable::standard();
    ScoreTable table(codons);
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);

    for (size_t i = 2; i < protein.length(); ++i) {
        auto ctx = protein.substr(i - 2, 3);
        if (table.containsContext(ctx)) continue;

        for (const auto& a : codons.synonyms(ctx[0])) {
            for (const auto& b : codons.synonyms(ctx[1])) {
                for (const auto& c : codons.synonyms(ctx[2])) {
                    table.insert(ctx, a + b + c, dist(rng));
                }
            }
        }
    }
    return table;
}

static ExclusionSet commonExclusions() {
    const std::vector<std::string> names = {"BsaI", "BsmBI", "EcoRI", "XhoI", "NotI", "PmeI"};
    return exclusionsForEnzymes(names);
}

// ============================================================================
// Codon Table Benchmarks
// ============================================================================

static void BM_Translate(benchmark::State& state) {
    auto protein = generateRandomProtein(static_cast<size_t>(state.range(0)));
    auto dna = generateRandomDna(protein);
    const auto& codons = CodonTable::standard();

    for (auto _ : state) {
        auto translated = codons.translate(dna);
        benchmark::DoNotOptimize(translated);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(dna.length()));
}
BENCHMARK(BM_Translate)->Range(100, 10000);

// ============================================================================
// Scoring Benchmarks
// ============================================================================

static void BM_ContextScore(benchmark::State& state) {
    auto protein = generateRandomProtein(300);
    auto dna = generateRandomDna(protein);
    auto table = generateScoreTable(protein);
    ContextScorer scorer(table);

    for (auto _ : state) {
        double total = 0.0;
        for (size_t i = 2; i < protein.length(); ++i) {
            total += scorer.score(std::string_view(dna).substr(3 * (i - 2), 6),
                                  std::string_view(dna).substr(3 * i, 3),
                                  std::string_view(protein).substr(i - 2, 3));
        }
        benchmark::DoNotOptimize(total);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(protein.length() - 2));
}
BENCHMARK(BM_ContextScore);

// ============================================================================
// Constraint Benchmarks
// ============================================================================

static void BM_ConstraintEvaluate(benchmark::State& state) {
    auto protein = generateRandomProtein(200);
    auto dna = generateRandomDna(protein);
    auto exclusions = commonExclusions();
    ConstraintEngine engine(exclusions, ConstraintConfig{});
    ConstraintPlan plan(protein);

    Candidate parent;
    for (size_t i = 0; i + 1 < protein.length(); ++i) {
        parent = parent.extend(*packCodon(std::string_view(dna).substr(3 * i, 3)), 0.0, i, true);
    }
    const auto& next = CodonTable::standard().synonymIndices(protein.back());

    for (auto _ : state) {
        size_t accepted = 0;
        for (auto codon : next) {
            if (engine.accepts(parent, codon, protein.length() - 1, plan)) ++accepted;
        }
        benchmark::DoNotOptimize(accepted);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(next.size()));
}
BENCHMARK(BM_ConstraintEvaluate);

static void BM_ExclusionScan(benchmark::State& state) {
    auto protein = generateRandomProtein(static_cast<size_t>(state.range(0)));
    auto dna = generateRandomDna(protein);
    auto exclusions = commonExclusions();

    for (auto _ : state) {
        auto hits = exclusions.findAll(dna);
        benchmark::DoNotOptimize(hits);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(dna.length()));
}
BENCHMARK(BM_ExclusionScan)->Range(1000, 100000);

// ============================================================================
// Search Benchmarks
// ============================================================================

static void BM_Optimize(benchmark::State& state) {
    auto protein = generateRandomProtein(150);
    auto table = generateScoreTable(protein);
    auto exclusions = commonExclusions();

    OptimizerConfig config;
    config.beam_width = static_cast<size_t>(state.range(0));
    BeamSearchOptimizer optimizer(table, exclusions, config);

    for (auto _ : state) {
        auto result = optimizer.optimize(protein);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(protein.length()));
}
BENCHMARK(BM_Optimize)->RangeMultiplier(4)->Range(4, 256)->Unit(benchmark::kMillisecond);

static void BM_OptimizeStateGrouped(benchmark::State& state) {
    auto protein = generateRandomProtein(150);
    auto table = generateScoreTable(protein);
    auto exclusions = commonExclusions();

    OptimizerConfig config;
    config.beam_width = 128;
    config.pruning = PruningStrategy::StateGrouped;
    config.paths_per_state = static_cast<size_t>(state.range(0));
    BeamSearchOptimizer optimizer(table, exclusions, config);

    for (auto _ : state) {
        auto result = optimizer.optimize(protein);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_OptimizeStateGrouped)->Arg(1)->Arg(4)->Arg(16)->Unit(benchmark::kMillisecond);

static void BM_OptimizeThreads(benchmark::State& state) {
    auto protein = generateRandomProtein(300);
    auto table = generateScoreTable(protein);
    ExclusionSet exclusions;

    OptimizerConfig config;
    config.beam_width = 256;
    config.threads = static_cast<size_t>(state.range(0));
    BeamSearchOptimizer optimizer(table, exclusions, config);

    for (auto _ : state) {
        auto result = optimizer.optimize(protein);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_OptimizeThreads)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMillisecond)->UseRealTime();

// ============================================================================
// Report Benchmarks
// ============================================================================

static void BM_Summarize(benchmark::State& state) {
    auto protein = generateRandomProtein(static_cast<size_t>(state.range(0)));
    auto dna = generateRandomDna(protein);
    auto exclusions = commonExclusions();

    for (auto _ : state) {
        auto report = analysis::summarize(dna, exclusions);
        benchmark::DoNotOptimize(report);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(dna.length()));
}
BENCHMARK(BM_Summarize)->Range(100, 10000);

// ============================================================================
// Main
// ============================================================================

BENCHMARK_MAIN();
