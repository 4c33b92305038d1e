#include "mathtune/tuning/study.h"

#include <stdexcept>
#include <utility>

namespace mathtune::tuning {

const IntermediateReport* Trial::ReportAt(int step) const {
    for (const IntermediateReport& report : reports) {
        if (report.step == step) {
            return &report;
        }
    }
    return nullptr;
}

std::string TrialStateName(TrialState state) {
    switch (state) {
        case TrialState::kRunning:
            return "running";
        case TrialState::kComplete:
            return "complete";
        case TrialState::kPruned:
            return "pruned";
        case TrialState::kFailed:
            return "failed";
    }
    return "unknown";
}

Study::Study(std::string name) : name_(std::move(name)) {}

int Study::StartTrial(Configuration config) {
    Trial trial;
    trial.trial_id = static_cast<int>(trials_.size());
    trial.config = std::move(config);
    trial.state = TrialState::kRunning;
    trials_.push_back(std::move(trial));
    return trials_.back().trial_id;
}

Trial& Study::MutableRunningTrial(int trial_id) {
    if (trial_id < 0 || trial_id >= static_cast<int>(trials_.size())) {
        throw std::logic_error("unknown trial id: " + std::to_string(trial_id));
    }
    Trial& trial = trials_[static_cast<std::size_t>(trial_id)];
    if (trial.IsFinished()) {
        throw std::logic_error("trial " + std::to_string(trial_id) + " is already " +
                               TrialStateName(trial.state));
    }
    return trial;
}

void Study::Report(int trial_id, int step, double value) {
    Trial& trial = MutableRunningTrial(trial_id);
    if (!trial.reports.empty() && step <= trial.reports.back().step) {
        throw std::logic_error("trial " + std::to_string(trial_id) +
                               " reported non-increasing step " + std::to_string(step));
    }
    trial.reports.push_back(IntermediateReport{step, value});
}

void Study::FinishTrial(int trial_id, const TrialOutcome& outcome) {
    Trial& trial = MutableRunningTrial(trial_id);
    if (outcome.state == TrialState::kRunning) {
        throw std::logic_error("trial outcome must be terminal");
    }
    if (outcome.state == TrialState::kComplete && !outcome.score.has_value()) {
        throw std::logic_error("complete trial " + std::to_string(trial_id) + " has no score");
    }

    trial.state = outcome.state;
    trial.score = outcome.state == TrialState::kComplete ? outcome.score : std::nullopt;
    trial.error_msg = outcome.error_msg;
    trial.interrupted = outcome.interrupted;
    trial.correct = outcome.correct;
    trial.problems_evaluated = outcome.problems_evaluated;
    trial.total_elapsed_sec = outcome.total_elapsed_sec;
    trial.duration_sec = outcome.duration_sec;

    if (trial.state != TrialState::kComplete) {
        return;
    }
    for (const IntermediateReport& report : trial.reports) {
        complete_values_by_step_[report.step].push_back(report.value);
    }
    // Trial ids only grow, so a strict comparison keeps the earliest on ties.
    const Trial* best = best_trial();
    if (best == nullptr || *trial.score > *best->score) {
        best_trial_id_ = trial.trial_id;
    }
}

const Trial& Study::trial(int trial_id) const {
    if (trial_id < 0 || trial_id >= static_cast<int>(trials_.size())) {
        throw std::out_of_range("unknown trial id: " + std::to_string(trial_id));
    }
    return trials_[static_cast<std::size_t>(trial_id)];
}

int Study::CountInState(TrialState state) const {
    int count = 0;
    for (const Trial& trial : trials_) {
        if (trial.state == state) {
            ++count;
        }
    }
    return count;
}

const Trial* Study::best_trial() const {
    if (best_trial_id_ < 0) {
        return nullptr;
    }
    return &trials_[static_cast<std::size_t>(best_trial_id_)];
}

std::vector<const Trial*> Study::CompleteTrials() const {
    std::vector<const Trial*> complete;
    for (const Trial& trial : trials_) {
        if (trial.state == TrialState::kComplete) {
            complete.push_back(&trial);
        }
    }
    return complete;
}

const std::vector<double>& Study::CompleteValuesAtStep(int step) const {
    static const std::vector<double> kEmpty;
    const auto it = complete_values_by_step_.find(step);
    return it == complete_values_by_step_.end() ? kEmpty : it->second;
}

}  // namespace mathtune::tuning
