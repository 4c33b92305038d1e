#include "mathtune/tuning/config_store.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "mathtune/core/simple_json.h"

namespace mathtune::tuning {
namespace {

std::filesystem::path MakeTempDir() {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("mathtune_store_" + std::to_string(stamp));
    std::filesystem::create_directories(dir);
    return dir;
}

TuningResult SampleResult() {
    TuningResult result;
    result.has_best = true;
    result.best_config.values["k"] = 12;
    result.best_config.values["temperature"] = 0.55;
    result.best_config.values["top_p"] = 1.0;
    result.best_config.values["prompt_style"] = std::string("tir");
    result.best_score = 0.8125;
    result.best_trial_id = 6;
    result.n_trials = 10;
    result.n_complete = 7;
    result.n_pruned = 2;
    result.n_failed = 1;
    result.mode = "quick";
    result.timestamp = "2026-01-02 03:04:05";
    result.solver_errors = {"problem p3: \"timeout\""};
    return result;
}

TEST(JsonFileConfigStoreTest, SavedBestConfigLoadsBackWithTypes) {
    const std::filesystem::path dir = MakeTempDir();
    const std::string path = (dir / "nested" / "best_config.json").string();
    JsonFileConfigStore store(path);
    std::string error;
    ASSERT_TRUE(store.Save(SampleResult(), &error)) << error;
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    const Configuration loaded = LoadBestConfig(path, &error);
    EXPECT_TRUE(error.empty()) << error;
    EXPECT_EQ(loaded, SampleResult().best_config);
    EXPECT_TRUE(std::holds_alternative<double>(loaded.values.at("top_p")));

    std::filesystem::remove_all(dir);
}

TEST(JsonFileConfigStoreTest, DocumentCarriesStudySummary) {
    mathtune::simple_json::Value root;
    std::string error;
    ASSERT_TRUE(mathtune::simple_json::Parse(TuningResultToJson(SampleResult()), &root, &error))
        << error;
    ASSERT_NE(root.Find("best_score"), nullptr);
    EXPECT_DOUBLE_EQ(root.Find("best_score")->number_value, 0.8125);
    EXPECT_EQ(root.Find("n_trials")->integer_value, 10);
    EXPECT_EQ(root.Find("mode")->string_value, "quick");
    EXPECT_EQ(root.Find("timestamp")->string_value, "2026-01-02 03:04:05");
    ASSERT_TRUE(root.Find("solver_errors")->IsArray());
    EXPECT_EQ(root.Find("solver_errors")->array_value[0].string_value, "problem p3: \"timeout\"");
}

TEST(JsonFileConfigStoreTest, RefusesResultWithoutBest) {
    JsonFileConfigStore store((MakeTempDir() / "best.json").string());
    std::string error;
    EXPECT_FALSE(store.Save(TuningResult{}, &error));
    EXPECT_FALSE(error.empty());
}

TEST(LoadBestConfigTest, MissingFileGivesEmptyConfiguration) {
    std::string error = "stale";
    const Configuration loaded = LoadBestConfig("/nonexistent/mathtune/best.json", &error);
    EXPECT_TRUE(loaded.empty());
    EXPECT_TRUE(error.empty());
}

TEST(LoadBestConfigTest, MalformedFileGivesEmptyConfigurationAndReason) {
    const std::filesystem::path dir = MakeTempDir();
    const std::string path = (dir / "best.json").string();
    {
        std::ofstream out(path);
        out << "{\"best_config\": {\"k\": ";
    }
    std::string error;
    EXPECT_TRUE(LoadBestConfig(path, &error).empty());
    EXPECT_NE(error.find("invalid best config json"), std::string::npos);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{\"best_config\": {\"k\": [1, 2]}}";
    }
    EXPECT_TRUE(LoadBestConfig(path, &error).empty());
    EXPECT_NE(error.find("best_config.k"), std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST(ConfigurationToJsonTest, KeepsDoublesDistinctFromInts) {
    Configuration config;
    config.values["k"] = 8;
    config.values["top_p"] = 1.0;
    config.values["prompt_style"] = std::string("strict_final");
    EXPECT_EQ(ConfigurationToJson(config),
              "{\"k\": 8, \"prompt_style\": \"strict_final\", \"top_p\": 1.0}");
}

}  // namespace
}  // namespace mathtune::tuning
