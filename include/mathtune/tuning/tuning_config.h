#pragma once

#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "mathtune/core/structured_log.h"
#include "mathtune/tuning/search_space.h"

namespace mathtune::tuning {

struct SamplerConfig {
    std::string algorithm{"tpe"};
    // Completed trials required before the Parzen model replaces uniform sampling.
    int n_startup_trials{5};
    int n_ei_candidates{24};
    double gamma{0.25};
    double prior_weight{1.0};
};

struct PrunerConfig {
    std::string algorithm{"median"};
    int n_startup_trials{3};
    int n_warmup_steps{2};
};

struct ScoringConfig {
    double time_budget_per_problem{180.0};
    double time_penalty_weight{0.1};
    double penalty_exponent{1.0};
    double penalty_cap{std::numeric_limits<double>::infinity()};
};

struct TuningConfig {
    int k_min{4};
    int k_max{16};
    double temperature_min{0.3};
    double temperature_max{1.0};
    int max_tokens_min{1024};
    int max_tokens_max{4096};
    int max_tokens_step{512};
    double top_p_min{0.8};
    double top_p_max{1.0};

    std::vector<std::string> prompt_styles{"strict_final", "tir"};
    std::vector<std::string> selection_strategies{"majority_vote", "verifier_weighted",
                                                  "consensus"};

    int quick_trials{10};
    int full_trials{30};
    double timeout_quick{1800.0};
    double timeout_full{3600.0};

    std::string config_save_path{"runtime/tuning/best_config.json"};

    ScoringConfig scoring;
    SamplerConfig sampler;
    PrunerConfig pruner;
    LogConfig logging;

    // Replaces DefaultSearchSpace() when non-empty.
    std::vector<ParameterSpec> parameters;

    // Collaborator settings read by the CLI.
    std::string problems_csv;
    std::string solver_command;
};

struct ModeBudget {
    int max_trials{0};
    double timeout_sec{0.0};
};

// "quick" or "full"; any other mode is rejected.
bool ResolveModeBudget(const TuningConfig& config,
                       const std::string& mode,
                       ModeBudget* out,
                       std::string* error);

bool BuildSearchSpace(const TuningConfig& config, SearchSpace* out, std::string* error);

// Checks budgets, scoring, sampler/pruner choices, log settings and that the
// search space can be built.
bool ValidateTuningConfig(const TuningConfig& config, std::string* error);

// Reads the YAML subset written by hand for tuning runs. Fields not present
// keep their TuningConfig defaults.
bool LoadTuningConfig(const std::string& yaml_path, TuningConfig* out, std::string* error);
bool ParseTuningConfig(const std::string& yaml_text, TuningConfig* out, std::string* error);

std::vector<std::string> PresetNames();
bool PresetConfiguration(const std::string& name, Configuration* out, std::string* error);

}  // namespace mathtune::tuning
