#pragma once

#include <memory>

#include "mathtune/monitoring/metric_registry.h"
#include "mathtune/tuning/trial.h"

namespace mathtune {

// Metric handles of one study, labelled with the study name.
class StudyMetrics {
   public:
    explicit StudyMetrics(const std::string& study_name);

    void OnTrialFinished(const tuning::Trial& trial) const;
    void OnBestScore(double score) const;
    void OnSolveElapsed(double elapsed_sec) const;

   private:
    std::shared_ptr<MonitoringCounter> complete_;
    std::shared_ptr<MonitoringCounter> pruned_;
    std::shared_ptr<MonitoringCounter> failed_;
    std::shared_ptr<MonitoringGauge> best_score_;
    std::shared_ptr<MonitoringHistogram> solver_elapsed_;
    std::shared_ptr<MonitoringHistogram> trial_duration_;
};

}  // namespace mathtune
