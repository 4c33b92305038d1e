#include "mathtune/tuning/objective_evaluator.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

#include "mathtune/tuning/errors.h"

namespace mathtune::tuning {
namespace {

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

}  // namespace

ScoreBreakdown ComputeScore(int correct,
                            int n_problems,
                            double total_elapsed_sec,
                            const ScoringConfig& config) {
    if (n_problems <= 0) {
        throw std::invalid_argument("score requires at least one problem");
    }
    ScoreBreakdown out;
    out.accuracy = static_cast<double>(correct) / static_cast<double>(n_problems);
    out.avg_time_sec = total_elapsed_sec / static_cast<double>(n_problems);

    const double budget = config.time_budget_per_problem;
    const double overrun = std::max(0.0, (out.avg_time_sec - budget) / budget);
    if (overrun > 0.0) {
        out.time_penalty = std::min(config.penalty_cap, std::pow(overrun, config.penalty_exponent));
    }
    out.score = out.accuracy - config.time_penalty_weight * out.time_penalty;
    return out;
}

bool ValidateScoringConfig(const ScoringConfig& config, std::string* error) {
    if (!(config.time_budget_per_problem > 0.0)) {
        return SetError("scoring.time_budget_per_problem must be > 0", error);
    }
    if (!(config.time_penalty_weight >= 0.0)) {
        return SetError("scoring.time_penalty_weight must be >= 0", error);
    }
    if (!(config.penalty_exponent > 0.0)) {
        return SetError("scoring.penalty_exponent must be > 0", error);
    }
    if (!(config.penalty_cap >= 0.0)) {
        return SetError("scoring.penalty_cap must be >= 0", error);
    }
    return true;
}

ObjectiveEvaluator::ObjectiveEvaluator(const ProblemSet& problems,
                                       ISolver* solver,
                                       const IPruner* pruner,
                                       const ScoringConfig& scoring)
    : problems_(problems), solver_(solver), pruner_(pruner), scoring_(scoring) {
    if (solver_ == nullptr) {
        throw std::invalid_argument("objective evaluator requires a solver");
    }
    if (problems_.empty()) {
        throw std::invalid_argument("objective evaluator requires a non-empty problem set");
    }
    std::string error;
    if (!ValidateScoringConfig(scoring_, &error)) {
        throw std::invalid_argument(error);
    }
}

bool ObjectiveEvaluator::CancelRequested() const {
    return cancel_flag_ != nullptr && cancel_flag_->load();
}

TrialOutcome ObjectiveEvaluator::Evaluate(Study* study, int trial_id) const {
    if (study == nullptr) {
        throw std::invalid_argument("objective evaluator requires a study");
    }
    const auto start = std::chrono::steady_clock::now();
    const Configuration config = study->trial(trial_id).config;

    TrialOutcome outcome;
    const auto finish = [&](TrialState state) {
        outcome.state = state;
        outcome.duration_sec =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        return outcome;
    };

    const std::vector<ProblemRecord>& records = problems_.records();
    for (std::size_t index = 0; index < records.size(); ++index) {
        if (CancelRequested()) {
            outcome.interrupted = true;
            return finish(TrialState::kPruned);
        }

        const ProblemRecord& problem = records[index];
        SolveResult result;
        try {
            result = solver_->Solve(problem.id, problem.problem, config);
        } catch (const SolverInterruptedError&) {
            outcome.interrupted = true;
            return finish(TrialState::kPruned);
        } catch (const std::exception& ex) {
            // A solver torn down by the interrupt is not a solver failure.
            if (CancelRequested()) {
                outcome.interrupted = true;
                return finish(TrialState::kPruned);
            }
            outcome.error_msg = "problem " + problem.id + ": " + ex.what();
            return finish(TrialState::kFailed);
        } catch (...) {
            if (CancelRequested()) {
                outcome.interrupted = true;
                return finish(TrialState::kPruned);
            }
            outcome.error_msg = "problem " + problem.id + ": unknown solver failure";
            return finish(TrialState::kFailed);
        }

        const double elapsed_sec = result.telemetry.elapsed_sec.value_or(0.0);
        if (!std::isfinite(elapsed_sec) || elapsed_sec < 0.0) {
            outcome.error_msg = "problem " + problem.id +
                                ": invalid elapsed_sec telemetry: " + std::to_string(elapsed_sec);
            return finish(TrialState::kFailed);
        }

        const bool is_correct = result.answer == problem.answer;
        if (is_correct) {
            ++outcome.correct;
        }
        outcome.total_elapsed_sec += elapsed_sec;
        outcome.problems_evaluated = static_cast<int>(index) + 1;
        if (observer_) {
            observer_(problem, result, is_correct);
        }

        const int step = static_cast<int>(index);
        const double running_accuracy =
            static_cast<double>(outcome.correct) / static_cast<double>(index + 1);
        study->Report(trial_id, step, running_accuracy);
        if (pruner_ != nullptr &&
            pruner_->ShouldPrune(*study, study->trial(trial_id), step, running_accuracy)) {
            return finish(TrialState::kPruned);
        }
    }

    const ScoreBreakdown breakdown =
        ComputeScore(outcome.correct, static_cast<int>(records.size()), outcome.total_elapsed_sec,
                     scoring_);
    outcome.score = breakdown.score;
    return finish(TrialState::kComplete);
}

}  // namespace mathtune::tuning
