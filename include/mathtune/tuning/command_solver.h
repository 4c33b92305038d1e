#pragma once

#include <atomic>
#include <string>

#include "mathtune/tuning/solver.h"

namespace mathtune::tuning {

struct CommandSolverOptions {
    // Shell command prefix; `--request <file> --output_json <file>` is appended.
    std::string command;
    // Parent of the per-call work directories; empty means the system temp dir.
    std::string work_root;
    // Work directories of failed calls are always kept.
    bool keep_work_dirs{false};
    // Set when a solver process dies from SIGINT or SIGTERM.
    std::atomic<bool>* interrupt_flag{nullptr};
};

// Runs an external solver process for every problem.
//
// The request file holds {"problem_id", "problem", "config"}; the solver writes
// {"answer": <int>, "elapsed_sec": <number>} plus optional scalar telemetry.
// When elapsed_sec is missing the measured wall time is used. A process killed
// by SIGINT or SIGTERM raises SolverInterruptedError instead of SolverError.
class CommandSolver : public ISolver {
   public:
    explicit CommandSolver(CommandSolverOptions options);

    SolveResult Solve(const std::string& problem_id,
                      const std::string& problem_text,
                      const Configuration& config) override;

   private:
    CommandSolverOptions options_;
};

std::string ShellQuote(const std::string& value);

std::string BuildSolveRequestJson(const std::string& problem_id,
                                  const std::string& problem_text,
                                  const Configuration& config);

bool ParseSolveResponseJson(const std::string& json_text, SolveResult* out, std::string* error);

}  // namespace mathtune::tuning
