#pragma once

#include "codonbeam/constraints.hpp"
#include "codonbeam/context_scorer.hpp"
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <stdexcept>
#include <string_view>

namespace codonbeam {

/**
 * @brief Exception class for invalid optimizer configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief How the beam is cut back after each step
 */
enum class PruningStrategy {
    Global,       // top beam_width by score
    StateGrouped  // at most paths_per_state per last-two-codon state, then top beam_width
};

/**
 * @brief Engine configuration, fixed at construction
 */
struct OptimizerConfig {
    size_t beam_width = 100;
    ConstraintConfig constraints;
    BoundaryPolicy boundary_policy = BoundaryPolicy::FixedPrior;
    double boundary_prior = 0.0;
    PruningStrategy pruning = PruningStrategy::Global;
    size_t paths_per_state = 8;
    // Worker threads for candidate expansion; 0 or 1 runs serially, at most kMaxThreads
    size_t threads = 0;

    static constexpr size_t kMaxThreads = 1024;

    /**
     * @throws ConfigError describing the first invalid field
     */
    void validate() const;

    /**
     * @brief Overlay the keys present in a JSON object onto base
     *
     * Keys: beam_width, enforce_exclusions, enforce_unique_sixmers,
     * enforce_homopolymer_diversity, max_homopolymer_run,
     * enforce_codon_run_diversity, enforce_distinct_repeats,
     * boundary_policy ("fixed_prior" | "partial_context"), boundary_prior,
     * pruning ("global" | "state_grouped"), paths_per_state, threads.
     * camelCase spellings (beamWidth, enforceUniqueSixmers, ...) are accepted.
     *
     * @throws ConfigError on an unknown key or a value of the wrong type
     */
    [[nodiscard]] static OptimizerConfig fromJson(const nlohmann::json& doc,
                                                  const OptimizerConfig& base);

    /**
     * @brief fromJson() over the default configuration
     */
    [[nodiscard]] static OptimizerConfig fromJson(const nlohmann::json& doc);
};

/**
 * @brief Read a JSON configuration file over base
 * @throws ConfigError if the file cannot be read or parsed
 */
[[nodiscard]] OptimizerConfig loadConfig(const std::filesystem::path& path,
                                         const OptimizerConfig& base = {});

[[nodiscard]] std::string_view boundaryPolicyName(BoundaryPolicy policy) noexcept;
[[nodiscard]] std::string_view pruningName(PruningStrategy pruning) noexcept;

} // namespace codonbeam
