#include <atomic>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "mathtune/apps/cli_support.h"
#include "mathtune/core/structured_log.h"
#include "mathtune/monitoring/exporter.h"
#include "mathtune/tuning/command_solver.h"
#include "mathtune/tuning/config_store.h"
#include "mathtune/tuning/errors.h"
#include "mathtune/tuning/problem_set.h"
#include "mathtune/tuning/study_orchestrator.h"
#include "mathtune/tuning/study_report.h"
#include "mathtune/tuning/study_trace_parquet_writer.h"
#include "mathtune/tuning/tuning_config.h"

namespace {

using mathtune::LogConfig;
using mathtune::apps::ArgMap;
using mathtune::apps::GetArg;
using mathtune::apps::GetIntArg;
using mathtune::apps::HasArg;
using mathtune::apps::ParseArgs;
using mathtune::tuning::AnalyzeStudy;
using mathtune::tuning::CommandSolver;
using mathtune::tuning::CommandSolverOptions;
using mathtune::tuning::EmptyStudyError;
using mathtune::tuning::JsonFileConfigStore;
using mathtune::tuning::ModeBudget;
using mathtune::tuning::ProblemSet;
using mathtune::tuning::SearchSpace;
using mathtune::tuning::Study;
using mathtune::tuning::StudyOptions;
using mathtune::tuning::StudyOrchestrator;
using mathtune::tuning::StudyTraceParquetWriter;
using mathtune::tuning::TuningConfig;
using mathtune::tuning::TuningResult;

constexpr const char* kApp = "tuning_cli";
constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

std::atomic<bool> g_interrupted{false};

void HandleSignal(int /*signum*/) { g_interrupted.store(true); }

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [--config <tuning.yaml>] [--problems <problems.csv>] [--mode quick|full]\n"
                 "       [--seed N] [--solver_command CMD] [--config_save_path <json>]\n"
                 "       [--output_json <report.json>] [--output_md <report.md>]\n"
                 "       [--trace_parquet <trace.parquet>] [--metrics_port PORT]\n";
}

// Reports and trace are best effort: a failure is logged but does not change
// the exit code of a study that produced a result.
void WriteOutputs(const Study& study,
                  const std::string& mode,
                  bool interrupted,
                  const ArgMap& args,
                  const LogConfig& log_config) {
    const std::string output_json = GetArg(args, "output_json");
    const std::string output_md = GetArg(args, "output_md");
    if (!output_json.empty() || !output_md.empty()) {
        std::string error;
        const auto report = AnalyzeStudy(study, mode, interrupted);
        if (!mathtune::tuning::WriteStudyReport(report, output_json, output_md, &error)) {
            mathtune::EmitStructuredLog(&log_config, kApp, "error", "report_write_failed",
                                        {{"error", error}});
        }
    }

    const std::string trace_path = GetArg(args, "trace_parquet");
    if (!trace_path.empty()) {
        StudyTraceParquetWriter writer;
        std::string error;
        if (!writer.Open(trace_path, &error) ||
            !mathtune::tuning::AppendStudyTrace(study, &writer, &error) ||
            !writer.Close(&error)) {
            mathtune::EmitStructuredLog(&log_config, kApp, "error", "trace_write_failed",
                                        {{"path", trace_path}, {"error", error}});
        }
    }
}

}  // namespace

int main(int argc, char** argv) {
    const ArgMap args = ParseArgs(argc, argv);
    if (HasArg(args, "help") || HasArg(args, "h")) {
        PrintUsage(argv[0]);
        return kExitOk;
    }

    TuningConfig config;
    std::string error;
    const std::string config_path = GetArg(args, "config");
    if (!config_path.empty() && !mathtune::tuning::LoadTuningConfig(config_path, &config, &error)) {
        std::cerr << kApp << ": " << error << '\n';
        return kExitUsage;
    }

    const std::string problems_path = GetArg(args, "problems", config.problems_csv);
    const std::string solver_command = GetArg(args, "solver_command", config.solver_command);
    config.config_save_path = GetArg(args, "config_save_path", config.config_save_path);
    const std::string mode = GetArg(args, "mode", "quick");
    if (problems_path.empty() || solver_command.empty()) {
        std::cerr << kApp << ": problems csv and solver command are required\n";
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    std::int64_t seed = 42;
    std::int64_t metrics_port = 0;
    if (!GetIntArg(args, "seed", &seed, &error) ||
        !GetIntArg(args, "metrics_port", &metrics_port, &error)) {
        std::cerr << kApp << ": " << error << '\n';
        return kExitUsage;
    }

    ModeBudget budget;
    SearchSpace space;
    if (!mathtune::tuning::ResolveModeBudget(config, mode, &budget, &error) ||
        !mathtune::tuning::ValidateTuningConfig(config, &error) ||
        !mathtune::tuning::BuildSearchSpace(config, &space, &error)) {
        std::cerr << kApp << ": " << error << '\n';
        return kExitUsage;
    }

    ProblemSet problems;
    if (!mathtune::tuning::LoadProblemSetCsv(problems_path, &problems, &error)) {
        std::cerr << kApp << ": " << error << '\n';
        return kExitUsage;
    }

    mathtune::MetricsExporter exporter;
    if (metrics_port > 0) {
        if (!exporter.Start("0.0.0.0", static_cast<int>(metrics_port), &error)) {
            mathtune::EmitStructuredLog(&config.logging, kApp, "warn", "metrics_unavailable",
                                        {{"error", error}});
        }
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    CommandSolverOptions solver_options;
    solver_options.command = solver_command;
    solver_options.interrupt_flag = &g_interrupted;
    CommandSolver solver(solver_options);

    const auto sampler = mathtune::tuning::MakeSampler(config.sampler, static_cast<std::uint64_t>(seed));
    const auto pruner = mathtune::tuning::MakePruner(config.pruner);
    JsonFileConfigStore store(config.config_save_path);

    StudyOptions options;
    options.max_trials = budget.max_trials;
    options.timeout_sec = budget.timeout_sec;
    options.seed = static_cast<std::uint64_t>(seed);
    options.mode = mode;
    options.cancel_flag = &g_interrupted;

    StudyOrchestrator orchestrator(std::move(space), sampler.get(), pruner.get(), config.scoring,
                                   &store, options, config.logging);

    TuningResult result;
    try {
        result = orchestrator.Run(problems, &solver);
    } catch (const EmptyStudyError& ex) {
        WriteOutputs(orchestrator.study(), mode, g_interrupted.load(), args, config.logging);
        std::cerr << kApp << ": " << ex.what() << '\n';
        return g_interrupted.load() ? kExitInterrupted : kExitFailed;
    } catch (const std::exception& ex) {
        WriteOutputs(orchestrator.study(), mode, g_interrupted.load(), args, config.logging);
        std::cerr << kApp << ": " << ex.what() << '\n';
        return kExitFailed;
    }

    WriteOutputs(orchestrator.study(), mode, result.interrupted, args, config.logging);

    std::cout << "tuning finished mode=" << result.mode << " trials=" << result.n_trials
              << " complete=" << result.n_complete << " pruned=" << result.n_pruned
              << " failed=" << result.n_failed << " best_trial=" << result.best_trial_id
              << " best_score=" << result.best_score << " saved=" << config.config_save_path
              << " interrupted=" << (result.interrupted ? "true" : "false") << '\n';
    std::cout << "best_config " << mathtune::tuning::FormatConfiguration(result.best_config)
              << '\n';

    return result.interrupted ? kExitInterrupted : kExitOk;
}
