#pragma once

#include <map>
#include <string>
#include <vector>

#include "mathtune/tuning/trial.h"

namespace mathtune::tuning {

// Append-only record of every trial of one tuning run. Direction is maximize.
//
// The study is the single source of history for samplers and pruners; they
// receive it by const reference. Only the evaluation owning a running trial
// reports to it or finishes it.
class Study {
   public:
    explicit Study(std::string name = "mathtune");

    const std::string& name() const { return name_; }

    int StartTrial(Configuration config);

    // Throws std::logic_error when the trial is unknown or already finished, or
    // when steps are not strictly increasing.
    void Report(int trial_id, int step, double value);
    void FinishTrial(int trial_id, const TrialOutcome& outcome);

    const std::vector<Trial>& trials() const { return trials_; }
    const Trial& trial(int trial_id) const;
    int n_trials() const { return static_cast<int>(trials_.size()); }
    int CountInState(TrialState state) const;

    // Highest score among complete trials; ties go to the smaller trial id.
    // nullptr when no trial has completed.
    const Trial* best_trial() const;

    std::vector<const Trial*> CompleteTrials() const;

    // Intermediate values reported at `step` by complete trials, in trial order.
    const std::vector<double>& CompleteValuesAtStep(int step) const;

   private:
    Trial& MutableRunningTrial(int trial_id);

    std::string name_;
    std::vector<Trial> trials_;
    std::map<int, std::vector<double>> complete_values_by_step_;
    int best_trial_id_{-1};
};

}  // namespace mathtune::tuning
