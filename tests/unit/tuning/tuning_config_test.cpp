#include "mathtune/tuning/tuning_config.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

namespace mathtune::tuning {
namespace {

TEST(TuningConfigTest, DefaultsDescribeTheStandardSearch) {
    const TuningConfig config;
    std::string error;
    EXPECT_TRUE(ValidateTuningConfig(config, &error)) << error;

    SearchSpace space;
    ASSERT_TRUE(BuildSearchSpace(config, &space, &error)) << error;
    ASSERT_EQ(space.size(), 6U);
    const ParameterSpec* tokens = space.Find("max_new_tokens");
    ASSERT_NE(tokens, nullptr);
    EXPECT_EQ(tokens->step, 512);
    EXPECT_EQ(tokens->GridSize(), 7);
}

TEST(TuningConfigTest, ResolvesModeBudgets) {
    const TuningConfig config;
    ModeBudget budget;
    std::string error;
    ASSERT_TRUE(ResolveModeBudget(config, "quick", &budget, &error));
    EXPECT_EQ(budget.max_trials, 10);
    EXPECT_DOUBLE_EQ(budget.timeout_sec, 1800.0);
    ASSERT_TRUE(ResolveModeBudget(config, "full", &budget, &error));
    EXPECT_EQ(budget.max_trials, 30);
    EXPECT_DOUBLE_EQ(budget.timeout_sec, 3600.0);
    EXPECT_FALSE(ResolveModeBudget(config, "Quick", &budget, &error));
    EXPECT_EQ(error, "unknown tuning mode: Quick (expected quick or full)");
}

TEST(TuningConfigTest, ParsesSectionsAndOverrides) {
    const std::string yaml =
        "# tuning run for the aime set\n"
        "problems_csv: \"data/aime.csv\"\n"
        "solver_command: ./solve.sh --gpu 0  # local runner\n"
        "tuning:\n"
        "  k_max: 12\n"
        "  prompt_styles: [strict_final, 'tir']\n"
        "  quick_trials: 4\n"
        "  timeout_full: 7200\n"
        "  config_save_path: out/best.json\n"
        "sampler:\n"
        "  algorithm: Random\n"
        "  gamma: 0.3\n"
        "pruner:\n"
        "  algorithm: none\n"
        "scoring:\n"
        "  time_budget_per_problem: 120\n"
        "  penalty_exponent: 2\n"
        "  penalty_cap: 1.5\n"
        "logging:\n"
        "  level: WARNING\n"
        "  sink: stdout\n";
    TuningConfig config;
    std::string error;
    ASSERT_TRUE(ParseTuningConfig(yaml, &config, &error)) << error;

    EXPECT_EQ(config.problems_csv, "data/aime.csv");
    EXPECT_EQ(config.solver_command, "./solve.sh --gpu 0");
    EXPECT_EQ(config.k_max, 12);
    EXPECT_EQ(config.k_min, 4);
    ASSERT_EQ(config.prompt_styles.size(), 2U);
    EXPECT_EQ(config.prompt_styles[1], "tir");
    EXPECT_EQ(config.quick_trials, 4);
    EXPECT_DOUBLE_EQ(config.timeout_full, 7200.0);
    EXPECT_EQ(config.config_save_path, "out/best.json");
    EXPECT_EQ(config.sampler.algorithm, "random");
    EXPECT_DOUBLE_EQ(config.sampler.gamma, 0.3);
    EXPECT_EQ(config.pruner.algorithm, "none");
    EXPECT_DOUBLE_EQ(config.scoring.time_budget_per_problem, 120.0);
    EXPECT_DOUBLE_EQ(config.scoring.penalty_exponent, 2.0);
    EXPECT_DOUBLE_EQ(config.scoring.penalty_cap, 1.5);
    EXPECT_DOUBLE_EQ(config.scoring.time_penalty_weight, 0.1);
    EXPECT_EQ(config.logging.log_level, "warn");
    EXPECT_EQ(config.logging.log_sink, "stdout");
    EXPECT_TRUE(config.parameters.empty());
}

TEST(TuningConfigTest, ParsesCustomParameterList) {
    const std::string yaml =
        "parameters:\n"
        "  - name: k\n"
        "    type: int\n"
        "    range: [2, 10]\n"
        "    step: 2\n"
        "  - name: temperature\n"
        "    type: float\n"
        "    range: [0.1, 0.9]\n"
        "  - name: prompt_style\n"
        "    type: categorical\n"
        "    values: [\"strict_final\", \"tir\"]\n";
    TuningConfig config;
    std::string error;
    ASSERT_TRUE(ParseTuningConfig(yaml, &config, &error)) << error;
    ASSERT_EQ(config.parameters.size(), 3U);
    EXPECT_EQ(config.parameters[0].kind, ParamKind::kIntRange);
    EXPECT_EQ(config.parameters[0].step, 2);
    EXPECT_EQ(config.parameters[1].kind, ParamKind::kFloatRange);
    EXPECT_DOUBLE_EQ(config.parameters[1].high, 0.9);
    EXPECT_EQ(config.parameters[2].choices.size(), 2U);

    SearchSpace space;
    ASSERT_TRUE(BuildSearchSpace(config, &space, &error)) << error;
    EXPECT_EQ(space.size(), 3U);
    EXPECT_EQ(space.Find("top_p"), nullptr);
}

TEST(TuningConfigTest, ReportsLineNumbers) {
    TuningConfig config;
    std::string error;

    EXPECT_FALSE(ParseTuningConfig("tuning:\n  k_min: four\n", &config, &error));
    EXPECT_EQ(error, "line 2: invalid k_min int");

    EXPECT_FALSE(ParseTuningConfig("sampler:\n  algorithm: tpe\n  beta: 1\n", &config, &error));
    EXPECT_EQ(error, "line 3: unsupported sampler field: beta");

    EXPECT_FALSE(ParseTuningConfig("storage:\n  url: x\n", &config, &error));
    EXPECT_EQ(error, "line 1: unsupported section: storage");

    EXPECT_FALSE(ParseTuningConfig(
        "parameters:\n  - name: k\n    type: int\n    values: [1, 2]\n", &config, &error));
    EXPECT_EQ(error, "line 2: numeric parameter must define range, not values");

    EXPECT_FALSE(ParseTuningConfig(
        "parameters:\n  - name: t\n    type: float\n    range: [0, 1]\n    step: 0.1\n", &config,
        &error));
    EXPECT_EQ(error, "line 2: step is only allowed for int parameters");
}

TEST(TuningConfigTest, RejectsInconsistentValues) {
    TuningConfig config;
    std::string error;
    EXPECT_FALSE(ParseTuningConfig("tuning:\n  k_min: 20\n", &config, &error));
    EXPECT_FALSE(error.empty());

    EXPECT_FALSE(ParseTuningConfig("sampler:\n  algorithm: cmaes\n", &config, &error));
    EXPECT_EQ(error, "unsupported sampler.algorithm: cmaes");

    EXPECT_FALSE(ParseTuningConfig("scoring:\n  time_budget_per_problem: 0\n", &config, &error));
    EXPECT_EQ(error, "scoring.time_budget_per_problem must be > 0");

    TuningConfig invalid;
    invalid.logging.log_sink = "syslog";
    EXPECT_FALSE(ValidateTuningConfig(invalid, &error));
}

TEST(TuningConfigTest, LoadPrefixesErrorsWithPath) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / ("mathtune_cfg_" + std::to_string(stamp) + ".yaml");
    {
        std::ofstream out(path);
        out << "tuning:\n  full_trials: 0\n";
    }
    TuningConfig config;
    std::string error;
    EXPECT_FALSE(LoadTuningConfig(path.string(), &config, &error));
    EXPECT_EQ(error.rfind(path.string() + ": ", 0), 0U);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "tuning:\n  full_trials: 12\n";
    }
    ASSERT_TRUE(LoadTuningConfig(path.string(), &config, &error)) << error;
    EXPECT_EQ(config.full_trials, 12);
    std::filesystem::remove(path);
}

TEST(PresetTest, PresetsLieInsideTheDefaultSpace) {
    const SearchSpace space = DefaultSearchSpace(TuningConfig{});
    ASSERT_EQ(PresetNames().size(), 3U);
    for (const std::string& name : PresetNames()) {
        Configuration preset;
        std::string error;
        ASSERT_TRUE(PresetConfiguration(name, &preset, &error)) << error;
        EXPECT_TRUE(space.Contains(preset, &error)) << name << ": " << error;
    }

    Configuration fast;
    ASSERT_TRUE(PresetConfiguration("fast", &fast, nullptr));
    EXPECT_EQ(std::get<int>(fast.values.at("k")), 4);
    EXPECT_EQ(std::get<std::string>(fast.values.at("prompt_style")), "tir");

    std::string error;
    Configuration unknown;
    EXPECT_FALSE(PresetConfiguration("greedy", &unknown, &error));
    EXPECT_EQ(error, "unknown preset: greedy");
}

}  // namespace
}  // namespace mathtune::tuning
