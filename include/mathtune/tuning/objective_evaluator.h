#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <utility>

#include "mathtune/tuning/problem_set.h"
#include "mathtune/tuning/pruner.h"
#include "mathtune/tuning/solver.h"
#include "mathtune/tuning/study.h"
#include "mathtune/tuning/tuning_config.h"

namespace mathtune::tuning {

struct ScoreBreakdown {
    double accuracy{0.0};
    double avg_time_sec{0.0};
    double time_penalty{0.0};
    double score{0.0};
};

// accuracy - weight * min(cap, max(0, (avg - budget) / budget) ^ exponent)
ScoreBreakdown ComputeScore(int correct,
                            int n_problems,
                            double total_elapsed_sec,
                            const ScoringConfig& config);

bool ValidateScoringConfig(const ScoringConfig& config, std::string* error);

// Runs one configuration over the problem set in order, reporting running
// accuracy to the study after every problem.
class ObjectiveEvaluator {
   public:
    using SolveObserver = std::function<void(const ProblemRecord&, const SolveResult&, bool correct)>;

    ObjectiveEvaluator(const ProblemSet& problems,
                       ISolver* solver,
                       const IPruner* pruner,
                       const ScoringConfig& scoring);

    void set_cancel_flag(const std::atomic<bool>* cancel_flag) { cancel_flag_ = cancel_flag; }
    void set_solve_observer(SolveObserver observer) { observer_ = std::move(observer); }

    // Reports intermediate values into `study` for `trial_id`; the returned
    // outcome is terminal and has not been applied to the study yet.
    TrialOutcome Evaluate(Study* study, int trial_id) const;

   private:
    bool CancelRequested() const;

    const ProblemSet& problems_;
    ISolver* solver_{nullptr};
    const IPruner* pruner_{nullptr};
    ScoringConfig scoring_;
    const std::atomic<bool>* cancel_flag_{nullptr};
    SolveObserver observer_;
};

}  // namespace mathtune::tuning
