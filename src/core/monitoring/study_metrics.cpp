#include "mathtune/monitoring/study_metrics.h"

namespace mathtune {

StudyMetrics::StudyMetrics(const std::string& study_name) {
    MetricRegistry& registry = MetricRegistry::Instance();
    const std::string trials_help = "Finished tuning trials by terminal state";
    complete_ = registry.BuildCounter("mathtune_trials_total", trials_help,
                                      {{"study", study_name}, {"state", "complete"}});
    pruned_ = registry.BuildCounter("mathtune_trials_total", trials_help,
                                    {{"study", study_name}, {"state", "pruned"}});
    failed_ = registry.BuildCounter("mathtune_trials_total", trials_help,
                                    {{"study", study_name}, {"state", "failed"}});
    best_score_ = registry.BuildGauge("mathtune_best_score", "Best complete trial score",
                                      {{"study", study_name}});
    solver_elapsed_ = registry.BuildHistogram(
        "mathtune_solver_elapsed_seconds", "Solver elapsed time reported per problem",
        {1.0, 5.0, 15.0, 30.0, 60.0, 120.0, 180.0, 300.0, 600.0}, {{"study", study_name}});
    trial_duration_ = registry.BuildHistogram(
        "mathtune_trial_duration_seconds", "Wall time of one trial evaluation",
        {10.0, 60.0, 300.0, 600.0, 1200.0, 1800.0, 3600.0}, {{"study", study_name}});
}

void StudyMetrics::OnTrialFinished(const tuning::Trial& trial) const {
    switch (trial.state) {
        case tuning::TrialState::kComplete:
            complete_->Increment();
            break;
        case tuning::TrialState::kPruned:
            pruned_->Increment();
            break;
        case tuning::TrialState::kFailed:
            failed_->Increment();
            break;
        case tuning::TrialState::kRunning:
            return;
    }
    trial_duration_->Observe(trial.duration_sec);
}

void StudyMetrics::OnBestScore(double score) const { best_score_->Set(score); }

void StudyMetrics::OnSolveElapsed(double elapsed_sec) const { solver_elapsed_->Observe(elapsed_sec); }

}  // namespace mathtune
