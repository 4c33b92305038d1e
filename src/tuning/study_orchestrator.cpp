#include "mathtune/tuning/study_orchestrator.h"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "mathtune/apps/cli_support.h"
#include "mathtune/monitoring/study_metrics.h"
#include "mathtune/tuning/errors.h"
#include "mathtune/tuning/objective_evaluator.h"
#include "mathtune/tuning/random_sampler.h"
#include "mathtune/tuning/tpe_sampler.h"

namespace mathtune::tuning {
namespace {

constexpr const char* kLogApp = "study_orchestrator";

std::string FormatNumber(double value) {
    std::ostringstream oss;
    oss.precision(6);
    oss << value;
    return oss.str();
}

}  // namespace

std::string FormatConfiguration(const Configuration& config) {
    std::string text;
    for (const auto& [name, value] : config.values) {
        if (!text.empty()) {
            text += ",";
        }
        text += name + "=" + ParamValueToString(value);
    }
    return text;
}

StudyOrchestrator::StudyOrchestrator(SearchSpace space,
                                     ISampler* sampler,
                                     const IPruner* pruner,
                                     const ScoringConfig& scoring,
                                     IConfigStore* store,
                                     StudyOptions options,
                                     LogConfig log_config)
    : space_(std::move(space)),
      sampler_(sampler),
      pruner_(pruner),
      scoring_(scoring),
      store_(store),
      options_(std::move(options)),
      log_config_(std::move(log_config)),
      study_(options_.study_name) {
    if (sampler_ == nullptr) {
        throw std::invalid_argument("study orchestrator requires a sampler");
    }
    if (space_.size() == 0) {
        throw std::invalid_argument("study orchestrator requires a non-empty search space");
    }
    if (options_.max_trials <= 0) {
        throw std::invalid_argument("max_trials must be > 0");
    }
    if (!(options_.timeout_sec > 0.0)) {
        throw std::invalid_argument("timeout_sec must be > 0");
    }
}

bool StudyOrchestrator::CancelRequested() const {
    return options_.cancel_flag != nullptr && options_.cancel_flag->load();
}

TuningResult StudyOrchestrator::Run(const ProblemSet& problems, ISolver* solver) {
    study_ = Study(options_.study_name);
    const StudyMetrics metrics(options_.study_name);

    ObjectiveEvaluator evaluator(problems, solver, pruner_, scoring_);
    evaluator.set_cancel_flag(options_.cancel_flag);
    evaluator.set_solve_observer(
        [&metrics](const ProblemRecord&, const SolveResult& result, bool) {
            if (result.telemetry.elapsed_sec.has_value()) {
                metrics.OnSolveElapsed(*result.telemetry.elapsed_sec);
            }
        });

    EmitStructuredLog(&log_config_, kLogApp, "info", "study_started",
                      {{"study", options_.study_name},
                       {"mode", options_.mode},
                       {"max_trials", std::to_string(options_.max_trials)},
                       {"timeout_sec", FormatNumber(options_.timeout_sec)},
                       {"seed", std::to_string(options_.seed)},
                       {"n_problems", std::to_string(problems.size())},
                       {"n_params", std::to_string(space_.size())}});

    const auto start = std::chrono::steady_clock::now();
    const auto elapsed_sec = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    bool interrupted = false;
    std::vector<std::string> solver_errors;
    while (study_.n_trials() < options_.max_trials) {
        if (CancelRequested()) {
            interrupted = true;
            break;
        }
        if (elapsed_sec() >= options_.timeout_sec) {
            EmitStructuredLog(&log_config_, kLogApp, "info", "study_timeout",
                              {{"study", options_.study_name},
                               {"elapsed_sec", FormatNumber(elapsed_sec())},
                               {"n_trials", std::to_string(study_.n_trials())}});
            break;
        }

        Configuration config;
        std::string sample_error;
        try {
            config = sampler_->Propose(study_, space_);
            std::string contains_error;
            if (!space_.Contains(config, &contains_error)) {
                sample_error = contains_error;
            }
        } catch (const InvalidParameterError& ex) {
            sample_error = ex.what();
        }

        const int trial_id = study_.StartTrial(config);
        EmitStructuredLog(&log_config_, kLogApp, "debug", "trial_started",
                          {{"trial", std::to_string(trial_id)},
                           {"config", FormatConfiguration(config)}});

        TrialOutcome outcome;
        if (!sample_error.empty()) {
            outcome.state = TrialState::kFailed;
            outcome.error_msg = "sampling failed: " + sample_error;
        } else {
            outcome = evaluator.Evaluate(&study_, trial_id);
            if (outcome.state == TrialState::kFailed) {
                solver_errors.push_back(outcome.error_msg);
            }
        }
        study_.FinishTrial(trial_id, outcome);

        const Trial& trial = study_.trial(trial_id);
        metrics.OnTrialFinished(trial);
        if (trial.state == TrialState::kFailed) {
            EmitStructuredLog(&log_config_, kLogApp, "warn", "trial_failed",
                              {{"trial", std::to_string(trial_id)},
                               {"config", FormatConfiguration(trial.config)},
                               {"error", trial.error_msg}});
        } else {
            LogFields fields{{"trial", std::to_string(trial_id)},
                             {"state", TrialStateName(trial.state)},
                             {"correct", std::to_string(trial.correct)},
                             {"problems_evaluated", std::to_string(trial.problems_evaluated)},
                             {"duration_sec", FormatNumber(trial.duration_sec)}};
            if (trial.score.has_value()) {
                fields.emplace_back("score", FormatNumber(*trial.score));
            }
            EmitStructuredLog(&log_config_, kLogApp, "info", "trial_finished", fields);
        }

        const Trial* best = study_.best_trial();
        if (best != nullptr && best->trial_id == trial_id) {
            metrics.OnBestScore(*best->score);
        }
        if (trial.interrupted) {
            interrupted = true;
            break;
        }
    }

    if (interrupted) {
        EmitStructuredLog(&log_config_, kLogApp, "warn", "study_interrupted",
                          {{"study", options_.study_name},
                           {"n_trials", std::to_string(study_.n_trials())}});
    }

    TuningResult result;
    result.n_trials = study_.n_trials();
    result.n_complete = study_.CountInState(TrialState::kComplete);
    result.n_pruned = study_.CountInState(TrialState::kPruned);
    result.n_failed = study_.CountInState(TrialState::kFailed);
    result.interrupted = interrupted;
    result.mode = options_.mode;
    result.solver_errors = std::move(solver_errors);

    const Trial* best = study_.best_trial();
    if (best == nullptr) {
        LogFields fields{{"study", options_.study_name},
                         {"n_trials", std::to_string(result.n_trials)},
                         {"n_pruned", std::to_string(result.n_pruned)},
                         {"n_failed", std::to_string(result.n_failed)},
                         {"error", "no completed trial"}};
        if (!result.solver_errors.empty()) {
            fields.emplace_back("n_solver_errors", std::to_string(result.solver_errors.size()));
            fields.emplace_back("first_solver_error", result.solver_errors.front());
        }
        EmitStructuredLog(&log_config_, kLogApp, "error", "study_finished", fields);
        throw EmptyStudyError(result.n_trials, result.n_pruned, result.n_failed,
                              std::move(result.solver_errors));
    }

    result.has_best = true;
    result.best_config = best->config;
    result.best_score = *best->score;
    result.best_trial_id = best->trial_id;
    result.timestamp = mathtune::apps::LocalTimestampNow();

    if (store_ != nullptr) {
        std::string error;
        if (!store_->Save(result, &error)) {
            EmitStructuredLog(&log_config_, kLogApp, "error", "config_save_failed",
                              {{"error", error}});
            throw std::runtime_error("failed to persist best configuration: " + error);
        }
        EmitStructuredLog(&log_config_, kLogApp, "info", "config_saved",
                          {{"best_trial", std::to_string(result.best_trial_id)},
                           {"best_score", FormatNumber(result.best_score)}});
    }

    EmitStructuredLog(&log_config_, kLogApp, "info", "study_finished",
                      {{"study", options_.study_name},
                       {"n_trials", std::to_string(result.n_trials)},
                       {"n_complete", std::to_string(result.n_complete)},
                       {"n_pruned", std::to_string(result.n_pruned)},
                       {"n_failed", std::to_string(result.n_failed)},
                       {"best_trial", std::to_string(result.best_trial_id)},
                       {"best_score", FormatNumber(result.best_score)},
                       {"best_config", FormatConfiguration(result.best_config)},
                       {"interrupted", interrupted ? "true" : "false"}});
    return result;
}

std::unique_ptr<ISampler> MakeSampler(const SamplerConfig& config, std::uint64_t seed) {
    if (config.algorithm == "tpe") {
        return std::make_unique<TpeSampler>(seed, config);
    }
    if (config.algorithm == "random") {
        return std::make_unique<RandomSampler>(seed);
    }
    throw std::invalid_argument("unsupported sampler algorithm: " + config.algorithm);
}

std::unique_ptr<IPruner> MakePruner(const PrunerConfig& config) {
    if (config.algorithm == "median") {
        return std::make_unique<MedianPruner>(config);
    }
    if (config.algorithm == "none") {
        return std::make_unique<NopPruner>();
    }
    throw std::invalid_argument("unsupported pruner algorithm: " + config.algorithm);
}

TuningResult RunTuning(const ProblemSet& problems,
                       ISolver* solver,
                       const std::string& mode,
                       const TuningConfig& config,
                       std::uint64_t seed,
                       const std::atomic<bool>* cancel_flag) {
    std::string error;
    ModeBudget budget;
    if (!ResolveModeBudget(config, mode, &budget, &error)) {
        throw std::invalid_argument(error);
    }
    if (!ValidateTuningConfig(config, &error)) {
        throw std::invalid_argument("invalid tuning config: " + error);
    }
    SearchSpace space;
    if (!BuildSearchSpace(config, &space, &error)) {
        throw std::invalid_argument("invalid search space: " + error);
    }

    const std::unique_ptr<ISampler> sampler = MakeSampler(config.sampler, seed);
    const std::unique_ptr<IPruner> pruner = MakePruner(config.pruner);
    JsonFileConfigStore store(config.config_save_path);

    StudyOptions options;
    options.max_trials = budget.max_trials;
    options.timeout_sec = budget.timeout_sec;
    options.seed = seed;
    options.mode = mode;
    options.cancel_flag = cancel_flag;

    StudyOrchestrator orchestrator(std::move(space), sampler.get(), pruner.get(), config.scoring,
                                   &store, std::move(options), config.logging);
    return orchestrator.Run(problems, solver);
}

}  // namespace mathtune::tuning
