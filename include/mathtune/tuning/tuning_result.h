#pragma once

#include <string>
#include <vector>

#include "mathtune/tuning/search_space.h"

namespace mathtune::tuning {

// Snapshot of a finished study, handed to the config store.
struct TuningResult {
    bool has_best{false};
    Configuration best_config;
    double best_score{0.0};
    int best_trial_id{-1};

    int n_trials{0};
    int n_complete{0};
    int n_pruned{0};
    int n_failed{0};
    bool interrupted{false};

    std::string mode;
    std::string timestamp;
    std::vector<std::string> solver_errors;
};

}  // namespace mathtune::tuning
