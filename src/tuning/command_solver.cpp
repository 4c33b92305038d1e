#include "mathtune/tuning/command_solver.h"

#include <sys/wait.h>

#include <cctype>
#include <csignal>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "mathtune/apps/cli_support.h"
#include "mathtune/core/simple_json.h"
#include "mathtune/tuning/config_store.h"
#include "mathtune/tuning/errors.h"

namespace mathtune::tuning {
namespace {

using mathtune::apps::JsonEscape;
using mathtune::simple_json::Value;

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

// system() ignores SIGINT in the caller while it waits, so an operator
// interrupt only shows up as the child's exit status: killed by the signal, or
// 128 + signal when the shell reports it.
bool KilledByInterrupt(int rc) {
    if (rc == -1) {
        return false;
    }
    if (WIFSIGNALED(rc)) {
        const int signum = WTERMSIG(rc);
        return signum == SIGINT || signum == SIGTERM;
    }
    if (WIFEXITED(rc)) {
        const int code = WEXITSTATUS(rc);
        return code == 128 + SIGINT || code == 128 + SIGTERM;
    }
    return false;
}

std::string MakeUniqueSuffix() {
    const auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                            std::chrono::steady_clock::now().time_since_epoch())
                            .count();
    return std::to_string(now_ns);
}

std::string SanitizeForPath(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        const bool keep = std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '-' || ch == '_';
        out.push_back(keep ? ch : '_');
    }
    return out.empty() ? "problem" : out;
}

bool ParseAnswer(const Value& value, std::int64_t* out) {
    if (value.IsNumber()) {
        if (value.is_integer) {
            *out = value.integer_value;
            return true;
        }
        if (std::isfinite(value.number_value) &&
            value.number_value == std::floor(value.number_value)) {
            *out = static_cast<std::int64_t>(value.number_value);
            return true;
        }
        return false;
    }
    if (value.IsString()) {
        try {
            std::size_t consumed = 0;
            const long long parsed = std::stoll(value.string_value, &consumed);
            if (consumed != value.string_value.size()) {
                return false;
            }
            *out = static_cast<std::int64_t>(parsed);
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
    return false;
}

}  // namespace

std::string ShellQuote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

std::string BuildSolveRequestJson(const std::string& problem_id,
                                  const std::string& problem_text,
                                  const Configuration& config) {
    std::ostringstream json;
    json << "{\n"
         << "  \"problem_id\": \"" << JsonEscape(problem_id) << "\",\n"
         << "  \"problem\": \"" << JsonEscape(problem_text) << "\",\n"
         << "  \"config\": " << ConfigurationToJson(config) << "\n"
         << "}\n";
    return json.str();
}

bool ParseSolveResponseJson(const std::string& json_text, SolveResult* out, std::string* error) {
    if (out == nullptr) {
        return SetError("solve result output is null", error);
    }
    Value root;
    std::string parse_error;
    if (!mathtune::simple_json::Parse(json_text, &root, &parse_error)) {
        return SetError("invalid solver output json: " + parse_error, error);
    }
    if (!root.IsObject()) {
        return SetError("solver output must be a json object", error);
    }

    const Value* answer = root.Find("answer");
    if (answer == nullptr) {
        return SetError("solver output has no answer", error);
    }
    SolveResult result;
    if (!ParseAnswer(*answer, &result.answer)) {
        return SetError("solver answer is not an integer", error);
    }

    for (const auto& [key, value] : root.object_value) {
        if (key == "answer") {
            continue;
        }
        if (key == "elapsed_sec") {
            if (!value.IsNumber() || !(value.number_value >= 0.0)) {
                return SetError("solver elapsed_sec must be a non-negative number", error);
            }
            result.telemetry.elapsed_sec = value.number_value;
            continue;
        }
        if (value.IsString()) {
            result.telemetry.extra[key] = value.string_value;
        } else if (value.IsNumber() || value.IsBool()) {
            result.telemetry.extra[key] = value.ToString();
        }
    }

    *out = std::move(result);
    return true;
}

CommandSolver::CommandSolver(CommandSolverOptions options) : options_(std::move(options)) {
    if (options_.command.empty()) {
        throw std::invalid_argument("command solver requires a command");
    }
}

SolveResult CommandSolver::Solve(const std::string& problem_id,
                                 const std::string& problem_text,
                                 const Configuration& config) {
    std::error_code ec;
    const std::filesystem::path root = options_.work_root.empty()
                                           ? std::filesystem::temp_directory_path(ec)
                                           : std::filesystem::path(options_.work_root);
    if (ec) {
        throw SolverError(problem_id, "unable to resolve temp directory: " + ec.message());
    }
    const std::filesystem::path work_dir =
        root / ("mathtune_solve_" + SanitizeForPath(problem_id) + "_" + MakeUniqueSuffix());
    std::filesystem::create_directories(work_dir, ec);
    if (ec) {
        throw SolverError(problem_id, "unable to create work dir " + work_dir.string() + ": " +
                                          ec.message());
    }

    const std::filesystem::path request_json = work_dir / "request.json";
    const std::filesystem::path output_json = work_dir / "output.json";
    const std::filesystem::path stdout_log = work_dir / "stdout.log";
    const std::filesystem::path stderr_log = work_dir / "stderr.log";

    std::string error;
    if (!mathtune::apps::WriteTextFile(request_json.string(),
                                       BuildSolveRequestJson(problem_id, problem_text, config),
                                       &error)) {
        throw SolverError(problem_id, "unable to write solver request: " + error);
    }

    std::ostringstream cmd;
    cmd << options_.command << " --request " << ShellQuote(request_json.string())
        << " --output_json " << ShellQuote(output_json.string()) << " > "
        << ShellQuote(stdout_log.string()) << " 2> " << ShellQuote(stderr_log.string());
    const std::string command = cmd.str();

    const auto start = std::chrono::steady_clock::now();
    const int rc = std::system(command.c_str());
    const double wall_sec =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (rc != 0 && KilledByInterrupt(rc)) {
        if (options_.interrupt_flag != nullptr) {
            options_.interrupt_flag->store(true);
        }
        if (!options_.keep_work_dirs) {
            std::filesystem::remove_all(work_dir, ec);
        }
        throw SolverInterruptedError(problem_id,
                                     "solver interrupted, status=" + std::to_string(rc));
    }
    if (rc != 0) {
        throw SolverError(problem_id, "solver exit code=" + std::to_string(rc) +
                                          ", stderr=" + stderr_log.string());
    }

    std::string output_text;
    if (!mathtune::apps::ReadTextFile(output_json.string(), &output_text, &error)) {
        throw SolverError(problem_id, "solver wrote no output: " + error);
    }
    SolveResult result;
    if (!ParseSolveResponseJson(output_text, &result, &error)) {
        throw SolverError(problem_id, error + " (" + output_json.string() + ")");
    }
    if (!result.telemetry.elapsed_sec.has_value()) {
        result.telemetry.elapsed_sec = wall_sec;
    }

    if (!options_.keep_work_dirs) {
        std::filesystem::remove_all(work_dir, ec);
    }
    return result;
}

}  // namespace mathtune::tuning
