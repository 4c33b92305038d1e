#include "mathtune/tuning/command_solver.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "mathtune/core/simple_json.h"
#include "mathtune/tuning/errors.h"

namespace mathtune::tuning {
namespace {

std::filesystem::path MakeTempDir(const std::string& stem) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / (stem + "_" + std::to_string(stamp));
    std::filesystem::create_directories(dir);
    return dir;
}

std::filesystem::path WriteScript(const std::filesystem::path& dir, const std::string& body) {
    const std::filesystem::path script = dir / "solver.sh";
    std::ofstream out(script);
    out << "#!/bin/sh\n" << body;
    return script;
}

TEST(CommandSolverTest, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(ShellQuote("plain"), "'plain'");
    EXPECT_EQ(ShellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(ShellQuote(""), "''");
}

TEST(CommandSolverTest, RequestCarriesProblemAndConfig) {
    Configuration config;
    config.values["k"] = 8;
    config.values["temperature"] = 0.5;
    mathtune::simple_json::Value root;
    std::string error;
    ASSERT_TRUE(mathtune::simple_json::Parse(
        BuildSolveRequestJson("p\"1", "line one\nline two", config), &root, &error))
        << error;
    EXPECT_EQ(root.Find("problem_id")->string_value, "p\"1");
    EXPECT_EQ(root.Find("problem")->string_value, "line one\nline two");
    EXPECT_EQ(root.Find("config")->Find("k")->integer_value, 8);
    EXPECT_DOUBLE_EQ(root.Find("config")->Find("temperature")->number_value, 0.5);
}

TEST(CommandSolverTest, ParsesResponseWithTelemetry) {
    SolveResult result;
    std::string error;
    ASSERT_TRUE(ParseSolveResponseJson(
        "{\"answer\": 204, \"elapsed_sec\": 12.5, \"tokens\": 900, \"model\": \"m1\", "
        "\"verified\": true}",
        &result, &error))
        << error;
    EXPECT_EQ(result.answer, 204);
    ASSERT_TRUE(result.telemetry.elapsed_sec.has_value());
    EXPECT_DOUBLE_EQ(*result.telemetry.elapsed_sec, 12.5);
    EXPECT_EQ(result.telemetry.extra.at("tokens"), "900");
    EXPECT_EQ(result.telemetry.extra.at("model"), "m1");
    EXPECT_EQ(result.telemetry.extra.at("verified"), "true");

    ASSERT_TRUE(ParseSolveResponseJson("{\"answer\": \"-17\"}", &result, &error)) << error;
    EXPECT_EQ(result.answer, -17);
    EXPECT_FALSE(result.telemetry.elapsed_sec.has_value());

    ASSERT_TRUE(ParseSolveResponseJson("{\"answer\": 3.0}", &result, &error)) << error;
    EXPECT_EQ(result.answer, 3);
}

TEST(CommandSolverTest, RejectsMalformedResponses) {
    SolveResult result;
    std::string error;
    EXPECT_FALSE(ParseSolveResponseJson("{\"elapsed_sec\": 1}", &result, &error));
    EXPECT_EQ(error, "solver output has no answer");
    EXPECT_FALSE(ParseSolveResponseJson("{\"answer\": 2.5}", &result, &error));
    EXPECT_EQ(error, "solver answer is not an integer");
    EXPECT_FALSE(ParseSolveResponseJson("{\"answer\": \"12a\"}", &result, &error));
    EXPECT_FALSE(ParseSolveResponseJson("{\"answer\": 1, \"elapsed_sec\": -1}", &result, &error));
    EXPECT_EQ(error, "solver elapsed_sec must be a non-negative number");
    EXPECT_FALSE(ParseSolveResponseJson("[1]", &result, &error));
    EXPECT_FALSE(ParseSolveResponseJson("{\"answer\": ", &result, &error));
}

TEST(CommandSolverTest, RunsExternalCommandAndCleansUp) {
    const std::filesystem::path dir = MakeTempDir("mathtune_command_solver");
    const std::filesystem::path script =
        WriteScript(dir, "printf '{\"answer\": 42, \"tokens\": 7}' > \"$4\"\n");
    const std::filesystem::path work_root = dir / "work";

    CommandSolverOptions options;
    options.command = "sh " + ShellQuote(script.string());
    options.work_root = work_root.string();
    CommandSolver solver(options);

    Configuration config;
    config.values["k"] = 4;
    const SolveResult result = solver.Solve("p/1", "What is 6*7?", config);
    EXPECT_EQ(result.answer, 42);
    ASSERT_TRUE(result.telemetry.elapsed_sec.has_value());
    EXPECT_GE(*result.telemetry.elapsed_sec, 0.0);
    EXPECT_EQ(result.telemetry.extra.at("tokens"), "7");
    EXPECT_TRUE(std::filesystem::is_empty(work_root));

    std::filesystem::remove_all(dir);
}

TEST(CommandSolverTest, NonZeroExitThrowsAndKeepsWorkDir) {
    const std::filesystem::path dir = MakeTempDir("mathtune_command_solver_fail");
    const std::filesystem::path script = WriteScript(dir, "echo 'model crashed' >&2\nexit 3\n");
    const std::filesystem::path work_root = dir / "work";

    CommandSolverOptions options;
    options.command = "sh " + ShellQuote(script.string());
    options.work_root = work_root.string();
    CommandSolver solver(options);

    try {
        solver.Solve("p1", "x", Configuration{});
        FAIL() << "expected SolverError";
    } catch (const SolverError& ex) {
        EXPECT_EQ(ex.problem_id(), "p1");
        EXPECT_NE(std::string(ex.what()).find("solver exit code="), std::string::npos);
    }
    EXPECT_FALSE(std::filesystem::is_empty(work_root));

    std::filesystem::remove_all(dir);
}

TEST(CommandSolverTest, SolverKilledBySignalReportsInterrupt) {
    for (const std::string signal_name : {"INT", "TERM"}) {
        const std::filesystem::path dir = MakeTempDir("mathtune_command_solver_signal");
        const std::filesystem::path script =
            WriteScript(dir, "kill -" + signal_name + " $$\nexit 0\n");
        const std::filesystem::path work_root = dir / "work";

        std::atomic<bool> interrupted{false};
        CommandSolverOptions options;
        options.command = "sh " + ShellQuote(script.string());
        options.work_root = work_root.string();
        options.interrupt_flag = &interrupted;
        CommandSolver solver(options);

        try {
            solver.Solve("p1", "x", Configuration{});
            FAIL() << "expected SolverInterruptedError for SIG" << signal_name;
        } catch (const SolverInterruptedError& ex) {
            EXPECT_EQ(ex.problem_id(), "p1");
        }
        EXPECT_TRUE(interrupted.load()) << signal_name;
        EXPECT_TRUE(!std::filesystem::exists(work_root) || std::filesystem::is_empty(work_root));

        std::filesystem::remove_all(dir);
    }
}

TEST(CommandSolverTest, PlainFailureLeavesInterruptFlagClear) {
    const std::filesystem::path dir = MakeTempDir("mathtune_command_solver_plain_fail");
    const std::filesystem::path script = WriteScript(dir, "exit 2\n");

    std::atomic<bool> interrupted{false};
    CommandSolverOptions options;
    options.command = "sh " + ShellQuote(script.string());
    options.work_root = (dir / "work").string();
    options.interrupt_flag = &interrupted;
    CommandSolver solver(options);

    try {
        solver.Solve("p1", "x", Configuration{});
        FAIL() << "expected SolverError";
    } catch (const SolverInterruptedError&) {
        FAIL() << "plain exit status reported as an interrupt";
    } catch (const SolverError& ex) {
        EXPECT_NE(std::string(ex.what()).find("solver exit code="), std::string::npos);
    }
    EXPECT_FALSE(interrupted.load());

    std::filesystem::remove_all(dir);
}

TEST(CommandSolverTest, RequiresCommand) {
    EXPECT_THROW(CommandSolver(CommandSolverOptions{}), std::invalid_argument);
}

}  // namespace
}  // namespace mathtune::tuning
