#include "codonbeam/config.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>

namespace codonbeam {

namespace {

// beamWidth -> beam_width
std::string snakeCase(std::string_view key) {
    std::string out;
    out.reserve(key.length() + 4);
    for (char c : key) {
        if (std::isupper(static_cast<unsigned char>(c))) {
            out += '_';
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            out += c;
        }
    }
    return out;
}

bool readBool(const std::string& key, const nlohmann::json& value) {
    if (!value.is_boolean()) {
        throw ConfigError("Config key '" + key + "' must be true or false");
    }
    return value.get<bool>();
}

size_t readCount(const std::string& key, const nlohmann::json& value) {
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ConfigError("Config key '" + key + "' must be a non-negative integer");
    }
    return value.get<size_t>();
}

double readNumber(const std::string& key, const nlohmann::json& value) {
    if (!value.is_number()) {
        throw ConfigError("Config key '" + key + "' must be a number");
    }
    return value.get<double>();
}

std::string readString(const std::string& key, const nlohmann::json& value) {
    if (!value.is_string()) {
        throw ConfigError("Config key '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

} // namespace

std::string_view boundaryPolicyName(BoundaryPolicy policy) noexcept {
    switch (policy) {
        case BoundaryPolicy::FixedPrior: return "fixed_prior";
        case BoundaryPolicy::PartialContext: return "partial_context";
    }
    return "unknown";
}

std::string_view pruningName(PruningStrategy pruning) noexcept {
    switch (pruning) {
        case PruningStrategy::Global: return "global";
        case PruningStrategy::StateGrouped: return "state_grouped";
    }
    return "unknown";
}

void OptimizerConfig::validate() const {
    if (beam_width == 0) {
        throw ConfigError("beam_width must be a positive integer");
    }
    if (constraints.enforce_homopolymer_diversity && constraints.max_homopolymer_run == 0) {
        throw ConfigError("max_homopolymer_run must be at least 1");
    }
    if (threads > kMaxThreads) {
        throw ConfigError("threads must be at most " + std::to_string(kMaxThreads));
    }
    if (pruning == PruningStrategy::StateGrouped && paths_per_state == 0) {
        throw ConfigError("paths_per_state must be positive with state_grouped pruning");
    }
}

OptimizerConfig OptimizerConfig::fromJson(const nlohmann::json& doc, const OptimizerConfig& base) {
    if (!doc.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    OptimizerConfig config = base;
    for (const auto& [raw_key, value] : doc.items()) {
        const std::string key = snakeCase(raw_key);

        if (key == "beam_width") {
            config.beam_width = readCount(key, value);
        } else if (key == "enforce_exclusions") {
            config.constraints.enforce_exclusions = readBool(key, value);
        } else if (key == "enforce_unique_sixmers") {
            config.constraints.enforce_unique_sixmers = readBool(key, value);
        } else if (key == "enforce_homopolymer_diversity") {
            config.constraints.enforce_homopolymer_diversity = readBool(key, value);
        } else if (key == "max_homopolymer_run") {
            config.constraints.max_homopolymer_run = readCount(key, value);
        } else if (key == "enforce_codon_run_diversity") {
            config.constraints.enforce_codon_run_diversity = readBool(key, value);
        } else if (key == "enforce_distinct_repeats") {
            config.constraints.enforce_distinct_repeats = readBool(key, value);
        } else if (key == "boundary_policy") {
            auto name = readString(key, value);
            if (name == "fixed_prior") {
                config.boundary_policy = BoundaryPolicy::FixedPrior;
            } else if (name == "partial_context") {
                config.boundary_policy = BoundaryPolicy::PartialContext;
            } else {
                throw ConfigError("Unknown boundary_policy '" + name + "'");
            }
        } else if (key == "boundary_prior") {
            config.boundary_prior = readNumber(key, value);
        } else if (key == "pruning") {
            auto name = readString(key, value);
            if (name == "global") {
                config.pruning = PruningStrategy::Global;
            } else if (name == "state_grouped") {
                config.pruning = PruningStrategy::StateGrouped;
            } else {
                throw ConfigError("Unknown pruning '" + name + "'");
            }
        } else if (key == "paths_per_state") {
            config.paths_per_state = readCount(key, value);
        } else if (key == "threads") {
            config.threads = readCount(key, value);
        } else {
            throw ConfigError("Unknown config key '" + std::string(raw_key) + "'");
        }
    }

    config.validate();
    return config;
}

OptimizerConfig OptimizerConfig::fromJson(const nlohmann::json& doc) {
    return fromJson(doc, OptimizerConfig{});
}

OptimizerConfig loadConfig(const std::filesystem::path& path, const OptimizerConfig& base) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file " + path.string());
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse config file " + path.string() + ": " + e.what());
    }
    return OptimizerConfig::fromJson(doc, base);
}

} // namespace codonbeam
