#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mathtune::tuning {

class InvalidParameterError : public std::invalid_argument {
   public:
    InvalidParameterError(const std::string& param_name, const std::string& message)
        : std::invalid_argument("invalid value for parameter `" + param_name + "`: " + message),
          param_name_(param_name) {}

    const std::string& param_name() const noexcept { return param_name_; }

   private:
    std::string param_name_;
};

// Thrown by solver implementations; any other std::exception escaping a solver
// is treated the same way by the evaluator.
class SolverError : public std::runtime_error {
   public:
    SolverError(const std::string& problem_id, const std::string& message)
        : std::runtime_error(message), problem_id_(problem_id) {}

    const std::string& problem_id() const noexcept { return problem_id_; }

   private:
    std::string problem_id_;
};

// The solver was stopped by an operator interrupt (SIGINT/SIGTERM or
// KeyboardInterrupt); the evaluator prunes the trial instead of failing it.
class SolverInterruptedError : public SolverError {
   public:
    using SolverError::SolverError;
};

class EmptyStudyError : public std::runtime_error {
   public:
    EmptyStudyError(int n_trials,
                    int n_pruned,
                    int n_failed,
                    std::vector<std::string> solver_errors = {})
        : std::runtime_error(BuildMessage(n_trials, n_pruned, n_failed, solver_errors)),
          n_trials_(n_trials),
          n_pruned_(n_pruned),
          n_failed_(n_failed),
          solver_errors_(std::move(solver_errors)) {}

    int n_trials() const noexcept { return n_trials_; }
    int n_pruned() const noexcept { return n_pruned_; }
    int n_failed() const noexcept { return n_failed_; }
    const std::vector<std::string>& solver_errors() const noexcept { return solver_errors_; }

   private:
    static std::string BuildMessage(int n_trials,
                                    int n_pruned,
                                    int n_failed,
                                    const std::vector<std::string>& solver_errors) {
        std::string message = "no completed trial: total=" + std::to_string(n_trials) +
                              " pruned=" + std::to_string(n_pruned) +
                              " failed=" + std::to_string(n_failed);
        if (!solver_errors.empty()) {
            message += "; first solver error: " + solver_errors.front();
        }
        return message;
    }

    int n_trials_{0};
    int n_pruned_{0};
    int n_failed_{0};
    std::vector<std::string> solver_errors_;
};

}  // namespace mathtune::tuning
