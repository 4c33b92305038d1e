#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mathtune/tuning/config_store.h"
#include "mathtune/tuning/errors.h"
#include "mathtune/tuning/problem_set.h"
#include "mathtune/tuning/solver.h"
#include "mathtune/tuning/study_orchestrator.h"
#include "mathtune/tuning/tuning_config.h"

namespace py = pybind11;

namespace mathtune {
namespace {

using tuning::Configuration;
using tuning::ParamValue;

std::string DictString(const py::dict& cfg, const char* key, const std::string& fallback) {
    if (!cfg.contains(py::str(key))) {
        return fallback;
    }
    return py::cast<std::string>(cfg[py::str(key)]);
}

int DictInt(const py::dict& cfg, const char* key, int fallback) {
    if (!cfg.contains(py::str(key))) {
        return fallback;
    }
    return py::cast<int>(cfg[py::str(key)]);
}

double DictDouble(const py::dict& cfg, const char* key, double fallback) {
    if (!cfg.contains(py::str(key))) {
        return fallback;
    }
    return py::cast<double>(cfg[py::str(key)]);
}

py::dict ToConfigDict(const Configuration& config) {
    py::dict out;
    for (const auto& [name, value] : config.values) {
        out[py::str(name)] = py::cast(value);
    }
    return out;
}

tuning::TuningConfig ParseTuningConfigDict(const py::dict& cfg) {
    tuning::TuningConfig out;
    out.k_min = DictInt(cfg, "k_min", out.k_min);
    out.k_max = DictInt(cfg, "k_max", out.k_max);
    out.temperature_min = DictDouble(cfg, "temperature_min", out.temperature_min);
    out.temperature_max = DictDouble(cfg, "temperature_max", out.temperature_max);
    out.max_tokens_min = DictInt(cfg, "max_tokens_min", out.max_tokens_min);
    out.max_tokens_max = DictInt(cfg, "max_tokens_max", out.max_tokens_max);
    out.max_tokens_step = DictInt(cfg, "max_tokens_step", out.max_tokens_step);
    out.top_p_min = DictDouble(cfg, "top_p_min", out.top_p_min);
    out.top_p_max = DictDouble(cfg, "top_p_max", out.top_p_max);
    if (cfg.contains(py::str("prompt_styles"))) {
        out.prompt_styles = py::cast<std::vector<std::string>>(cfg[py::str("prompt_styles")]);
    }
    if (cfg.contains(py::str("selection_strategies"))) {
        out.selection_strategies =
            py::cast<std::vector<std::string>>(cfg[py::str("selection_strategies")]);
    }
    out.quick_trials = DictInt(cfg, "quick_trials", out.quick_trials);
    out.full_trials = DictInt(cfg, "full_trials", out.full_trials);
    out.timeout_quick = DictDouble(cfg, "timeout_quick", out.timeout_quick);
    out.timeout_full = DictDouble(cfg, "timeout_full", out.timeout_full);
    out.config_save_path = DictString(cfg, "config_save_path", out.config_save_path);
    out.scoring.time_budget_per_problem =
        DictDouble(cfg, "time_budget_per_problem", out.scoring.time_budget_per_problem);
    out.scoring.time_penalty_weight =
        DictDouble(cfg, "time_penalty_weight", out.scoring.time_penalty_weight);
    out.scoring.penalty_exponent = DictDouble(cfg, "penalty_exponent", out.scoring.penalty_exponent);
    out.scoring.penalty_cap = DictDouble(cfg, "penalty_cap", out.scoring.penalty_cap);
    out.sampler.algorithm = DictString(cfg, "sampler", out.sampler.algorithm);
    out.sampler.n_startup_trials =
        DictInt(cfg, "sampler_n_startup_trials", out.sampler.n_startup_trials);
    out.pruner.algorithm = DictString(cfg, "pruner", out.pruner.algorithm);
    out.pruner.n_startup_trials = DictInt(cfg, "pruner_n_startup_trials", out.pruner.n_startup_trials);
    out.pruner.n_warmup_steps = DictInt(cfg, "pruner_n_warmup_steps", out.pruner.n_warmup_steps);
    out.logging.log_level = DictString(cfg, "log_level", out.logging.log_level);
    return out;
}

tuning::ProblemSet ParseProblems(const py::iterable& problems) {
    std::vector<tuning::ProblemRecord> records;
    for (const py::handle item : problems) {
        const py::dict record = py::reinterpret_borrow<py::dict>(item);
        tuning::ProblemRecord out;
        out.id = py::cast<std::string>(py::str(record[py::str("id")]));
        out.problem = DictString(record, "problem", "");
        out.answer = py::cast<std::int64_t>(record[py::str("answer")]);
        records.push_back(std::move(out));
    }
    tuning::ProblemSet set;
    std::string error;
    if (!tuning::ProblemSet::Create(std::move(records), &set, &error)) {
        throw py::value_error(error);
    }
    return set;
}

// Adapts `solve_fn(problem_id, problem, config) -> int | (int, float) | dict`.
class PyCallableSolver : public tuning::ISolver {
   public:
    PyCallableSolver(py::function fn, std::atomic<bool>* cancel_flag)
        : fn_(std::move(fn)), cancel_flag_(cancel_flag) {}

    tuning::SolveResult Solve(const std::string& problem_id,
                              const std::string& problem_text,
                              const Configuration& config) override {
        try {
            const py::object returned = fn_(problem_id, problem_text, ToConfigDict(config));
            return ToSolveResult(returned);
        } catch (py::error_already_set& ex) {
            if (ex.matches(PyExc_KeyboardInterrupt)) {
                cancel_flag_->store(true);
                throw tuning::SolverInterruptedError(problem_id, "KeyboardInterrupt");
            }
            throw tuning::SolverError(problem_id, ex.what());
        } catch (const py::cast_error& ex) {
            throw tuning::SolverError(problem_id, std::string("bad solve_fn result: ") + ex.what());
        }
    }

   private:
    static tuning::SolveResult ToSolveResult(const py::object& returned) {
        tuning::SolveResult result;
        if (py::isinstance<py::dict>(returned)) {
            const py::dict out = py::reinterpret_borrow<py::dict>(returned);
            result.answer = py::cast<std::int64_t>(out[py::str("answer")]);
            if (out.contains(py::str("elapsed_sec")) && !out[py::str("elapsed_sec")].is_none()) {
                result.telemetry.elapsed_sec = py::cast<double>(out[py::str("elapsed_sec")]);
            }
            for (const auto& item : out) {
                const std::string key = py::cast<std::string>(py::str(item.first));
                if (key != "answer" && key != "elapsed_sec") {
                    result.telemetry.extra[key] = py::cast<std::string>(py::str(item.second));
                }
            }
            return result;
        }
        if (py::isinstance<py::tuple>(returned)) {
            const py::tuple out = py::reinterpret_borrow<py::tuple>(returned);
            if (out.size() != 2) {
                throw py::cast_error("tuple result must be (answer, elapsed_sec)");
            }
            result.answer = py::cast<std::int64_t>(out[0]);
            result.telemetry.elapsed_sec = py::cast<double>(out[1]);
            return result;
        }
        result.answer = py::cast<std::int64_t>(returned);
        return result;
    }

    py::function fn_;
    std::atomic<bool>* cancel_flag_{nullptr};
};

py::dict ToResultDict(const tuning::TuningResult& result) {
    py::dict out;
    out["best_config"] = ToConfigDict(result.best_config);
    out["best_score"] = result.best_score;
    out["best_trial_id"] = result.best_trial_id;
    out["n_trials"] = result.n_trials;
    out["n_complete"] = result.n_complete;
    out["n_pruned"] = result.n_pruned;
    out["n_failed"] = result.n_failed;
    out["interrupted"] = result.interrupted;
    out["mode"] = result.mode;
    out["timestamp"] = result.timestamp;
    out["solver_errors"] = result.solver_errors;
    return out;
}

py::dict RunTuningPy(const py::iterable& problems,
                     const py::function& solve_fn,
                     const std::string& mode,
                     const py::object& config,
                     std::uint64_t seed) {
    tuning::TuningConfig tuning_config;
    if (py::isinstance<py::str>(config)) {
        std::string error;
        if (!tuning::LoadTuningConfig(py::cast<std::string>(config), &tuning_config, &error)) {
            throw py::value_error(error);
        }
    } else if (py::isinstance<py::dict>(config)) {
        tuning_config = ParseTuningConfigDict(py::reinterpret_borrow<py::dict>(config));
    } else if (!config.is_none()) {
        throw py::type_error("config must be None, a yaml path or a dict");
    }

    const tuning::ProblemSet problem_set = ParseProblems(problems);
    std::atomic<bool> cancel_flag{false};
    PyCallableSolver solver(solve_fn, &cancel_flag);
    const tuning::TuningResult result =
        tuning::RunTuning(problem_set, &solver, mode, tuning_config, seed, &cancel_flag);
    return ToResultDict(result);
}

py::dict DefaultConfigs() {
    py::dict out;
    for (const std::string& name : tuning::PresetNames()) {
        Configuration preset;
        std::string error;
        if (!tuning::PresetConfiguration(name, &preset, &error)) {
            throw std::runtime_error(error);
        }
        out[py::str(name)] = ToConfigDict(preset);
    }
    return out;
}

}  // namespace
}  // namespace mathtune

PYBIND11_MODULE(mathtune, m) {
    py::register_exception<mathtune::tuning::EmptyStudyError>(m, "EmptyStudyError",
                                                              PyExc_RuntimeError);
    py::register_exception<mathtune::tuning::InvalidParameterError>(m, "InvalidParameterError",
                                                                    PyExc_ValueError);
    py::register_exception<mathtune::tuning::SolverError>(m, "SolverError", PyExc_RuntimeError);

    m.def("run_tuning", &mathtune::RunTuningPy, py::arg("problems"), py::arg("solve_fn"),
          py::arg("mode") = "quick", py::arg("config") = py::none(), py::arg("seed") = 42);
    m.def(
        "load_best_config",
        [](const std::string& path) {
            return mathtune::ToConfigDict(mathtune::tuning::LoadBestConfig(path));
        },
        py::arg("path"));
    m.def("default_configs", &mathtune::DefaultConfigs);
}
