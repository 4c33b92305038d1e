#pragma once

#include "mathtune/tuning/study.h"
#include "mathtune/tuning/tuning_config.h"

namespace mathtune::tuning {

class IPruner {
   public:
    virtual ~IPruner() = default;

    // Called after `running` reported `value` at `step`.
    virtual bool ShouldPrune(const Study& study, const Trial& running, int step, double value) const = 0;
};

class NopPruner : public IPruner {
   public:
    bool ShouldPrune(const Study& study, const Trial& running, int step, double value) const override;
};

// Prunes a trial whose value at a step is strictly below the median of the
// values complete trials reported at the same step.
class MedianPruner : public IPruner {
   public:
    explicit MedianPruner(const PrunerConfig& config);
    MedianPruner(int n_startup_trials, int n_warmup_steps);

    bool ShouldPrune(const Study& study, const Trial& running, int step, double value) const override;

    int n_startup_trials() const { return n_startup_trials_; }
    int n_warmup_steps() const { return n_warmup_steps_; }

   private:
    int n_startup_trials_{3};
    int n_warmup_steps_{2};
};

double Median(std::vector<double> values);

}  // namespace mathtune::tuning
