#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mathtune/tuning/search_space.h"

namespace mathtune::tuning {

enum class TrialState {
    kRunning,
    kComplete,
    kPruned,
    kFailed,
};

struct IntermediateReport {
    int step{0};
    double value{0.0};
};

struct Trial {
    int trial_id{0};
    Configuration config;
    TrialState state{TrialState::kRunning};
    std::vector<IntermediateReport> reports;
    std::optional<double> score;
    std::string error_msg;
    // Pruned because the operator interrupted the study, not by the pruner.
    bool interrupted{false};

    int correct{0};
    int problems_evaluated{0};
    double total_elapsed_sec{0.0};
    double duration_sec{0.0};

    bool IsFinished() const { return state != TrialState::kRunning; }
    const IntermediateReport* ReportAt(int step) const;
};

// Terminal result of one evaluation, applied to the study by Study::FinishTrial.
struct TrialOutcome {
    TrialState state{TrialState::kFailed};
    std::optional<double> score;
    std::string error_msg;
    bool interrupted{false};
    int correct{0};
    int problems_evaluated{0};
    double total_elapsed_sec{0.0};
    double duration_sec{0.0};
};

std::string TrialStateName(TrialState state);

}  // namespace mathtune::tuning
