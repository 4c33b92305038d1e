#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "mathtune/core/structured_log.h"
#include "mathtune/tuning/config_store.h"
#include "mathtune/tuning/problem_set.h"
#include "mathtune/tuning/pruner.h"
#include "mathtune/tuning/sampler.h"
#include "mathtune/tuning/search_space.h"
#include "mathtune/tuning/solver.h"
#include "mathtune/tuning/study.h"
#include "mathtune/tuning/tuning_config.h"
#include "mathtune/tuning/tuning_result.h"

namespace mathtune::tuning {

struct StudyOptions {
    int max_trials{10};
    // Checked between trials only; a running trial is never cut short by it.
    double timeout_sec{1800.0};
    std::uint64_t seed{42};
    std::string mode{"quick"};
    const std::atomic<bool>* cancel_flag{nullptr};
    std::string study_name{"mathtune"};
};

// Drives the sequential trial loop of one study.
//
// Run() throws EmptyStudyError when no trial completed (nothing is persisted)
// and std::runtime_error when the config store rejects the result. A null
// store skips persistence.
class StudyOrchestrator {
   public:
    StudyOrchestrator(SearchSpace space,
                      ISampler* sampler,
                      const IPruner* pruner,
                      const ScoringConfig& scoring,
                      IConfigStore* store,
                      StudyOptions options,
                      LogConfig log_config = {});

    TuningResult Run(const ProblemSet& problems, ISolver* solver);

    // History of the last Run(), also after it threw.
    const Study& study() const { return study_; }
    const SearchSpace& space() const { return space_; }

   private:
    bool CancelRequested() const;

    SearchSpace space_;
    ISampler* sampler_{nullptr};
    const IPruner* pruner_{nullptr};
    ScoringConfig scoring_;
    IConfigStore* store_{nullptr};
    StudyOptions options_;
    LogConfig log_config_;
    Study study_;
};

std::unique_ptr<ISampler> MakeSampler(const SamplerConfig& config, std::uint64_t seed);
std::unique_ptr<IPruner> MakePruner(const PrunerConfig& config);

// One-call entry: resolves the mode budget, builds sampler, pruner and search
// space from `config`, and persists to config.config_save_path.
// Throws std::invalid_argument for an unknown mode or an invalid config.
TuningResult RunTuning(const ProblemSet& problems,
                       ISolver* solver,
                       const std::string& mode,
                       const TuningConfig& config,
                       std::uint64_t seed = 42,
                       const std::atomic<bool>* cancel_flag = nullptr);

std::string FormatConfiguration(const Configuration& config);

}  // namespace mathtune::tuning
