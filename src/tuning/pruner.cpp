#include "mathtune/tuning/pruner.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace mathtune::tuning {

bool NopPruner::ShouldPrune(const Study& /*study*/,
                            const Trial& /*running*/,
                            int /*step*/,
                            double /*value*/) const {
    return false;
}

MedianPruner::MedianPruner(const PrunerConfig& config)
    : MedianPruner(config.n_startup_trials, config.n_warmup_steps) {}

MedianPruner::MedianPruner(int n_startup_trials, int n_warmup_steps)
    : n_startup_trials_(n_startup_trials), n_warmup_steps_(n_warmup_steps) {
    if (n_startup_trials_ < 0) {
        throw std::invalid_argument("median pruner n_startup_trials must be >= 0");
    }
    if (n_warmup_steps_ < 0) {
        throw std::invalid_argument("median pruner n_warmup_steps must be >= 0");
    }
}

bool MedianPruner::ShouldPrune(const Study& study,
                               const Trial& /*running*/,
                               int step,
                               double value) const {
    if (step < n_warmup_steps_) {
        return false;
    }
    const std::vector<double>& history = study.CompleteValuesAtStep(step);
    if (history.empty() || static_cast<int>(history.size()) < n_startup_trials_) {
        return false;
    }
    if (std::isnan(value)) {
        return true;
    }
    return value < Median(history);
}

double Median(std::vector<double> values) {
    if (values.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    std::sort(values.begin(), values.end());
    const std::size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return 0.5 * (values[mid - 1] + values[mid]);
}

}  // namespace mathtune::tuning
