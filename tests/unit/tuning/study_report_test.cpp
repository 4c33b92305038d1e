#include "mathtune/tuning/study_report.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>

#include "mathtune/apps/cli_support.h"
#include "mathtune/core/simple_json.h"

namespace mathtune::tuning {
namespace {

Study MixedStudy() {
    Study study("report_study");
    const auto finish = [&study](int k, TrialState state, std::optional<double> score,
                                 const std::string& error_msg) {
        Configuration config;
        config.values["k"] = k;
        const int id = study.StartTrial(config);
        study.Report(id, 0, score.value_or(0.0));
        TrialOutcome outcome;
        outcome.state = state;
        outcome.score = score;
        outcome.error_msg = error_msg;
        outcome.correct = 1;
        outcome.problems_evaluated = 1;
        study.FinishTrial(id, outcome);
    };
    finish(4, TrialState::kFailed, std::nullopt, "problem p1: \"bad\" output");
    finish(6, TrialState::kComplete, 0.5, "");
    finish(8, TrialState::kPruned, std::nullopt, "");
    finish(10, TrialState::kComplete, 0.75, "");
    finish(12, TrialState::kComplete, 0.6, "");
    return study;
}

TEST(StudyReportTest, CountsStatesAndTracksConvergence) {
    const StudyReport report = AnalyzeStudy(MixedStudy(), "full", true);

    EXPECT_EQ(report.study_name, "report_study");
    EXPECT_EQ(report.mode, "full");
    EXPECT_TRUE(report.interrupted);
    EXPECT_EQ(report.total_trials, 5);
    EXPECT_EQ(report.complete_trials, 3);
    EXPECT_EQ(report.pruned_trials, 1);
    EXPECT_EQ(report.failed_trials, 1);
    ASSERT_TRUE(report.has_best);
    EXPECT_EQ(report.best_trial.trial_id, 3);

    ASSERT_EQ(report.convergence_curve.size(), 5U);
    EXPECT_FALSE(report.convergence_curve[0].has_value());
    EXPECT_DOUBLE_EQ(*report.convergence_curve[1], 0.5);
    EXPECT_DOUBLE_EQ(*report.convergence_curve[2], 0.5);
    EXPECT_DOUBLE_EQ(*report.convergence_curve[3], 0.75);
    EXPECT_DOUBLE_EQ(*report.convergence_curve[4], 0.75);

    ASSERT_EQ(report.all_scores.size(), 5U);
    EXPECT_FALSE(report.all_scores[2].has_value());
    EXPECT_DOUBLE_EQ(*report.all_scores[4], 0.6);
}

TEST(StudyReportTest, JsonIsParseableAndUsesNullForMissingScores) {
    const StudyReport report = AnalyzeStudy(MixedStudy(), "quick", false);
    mathtune::simple_json::Value root;
    std::string error;
    ASSERT_TRUE(mathtune::simple_json::Parse(StudyReportToJson(report), &root, &error)) << error;

    EXPECT_EQ(root.Find("study")->string_value, "report_study");
    EXPECT_EQ(root.Find("total_trials")->integer_value, 5);
    const auto& scores = root.Find("all_scores")->array_value;
    ASSERT_EQ(scores.size(), 5U);
    EXPECT_TRUE(scores[0].IsNull());
    EXPECT_DOUBLE_EQ(scores[3].number_value, 0.75);

    const mathtune::simple_json::Value* best = root.Find("best_trial");
    ASSERT_NE(best, nullptr);
    EXPECT_EQ(best->Find("trial_id")->integer_value, 3);
    EXPECT_EQ(best->Find("config")->Find("k")->integer_value, 10);

    const auto& trials = root.Find("trials")->array_value;
    ASSERT_EQ(trials.size(), 5U);
    EXPECT_EQ(trials[0].Find("state")->string_value, "failed");
    EXPECT_EQ(trials[0].Find("error_msg")->string_value, "problem p1: \"bad\" output");
}

TEST(StudyReportTest, MarkdownListsBestConfigAndFailures) {
    const std::string md = StudyReportToMarkdown(AnalyzeStudy(MixedStudy(), "quick", false));
    EXPECT_NE(md.find("# Tuning report: report_study"), std::string::npos);
    EXPECT_NE(md.find("- k: `10`"), std::string::npos);
    EXPECT_NE(md.find("| 2 | pruned | - |"), std::string::npos);
    EXPECT_NE(md.find("## Failed trials"), std::string::npos);
    EXPECT_NE(md.find("- 0: problem p1"), std::string::npos);
}

TEST(StudyReportTest, EmptyStudyHasNoBest) {
    const StudyReport report = AnalyzeStudy(Study{}, "quick", false);
    EXPECT_FALSE(report.has_best);
    EXPECT_NE(StudyReportToJson(report).find("\"best_trial\": null"), std::string::npos);
    EXPECT_NE(StudyReportToMarkdown(report).find("No trial completed."), std::string::npos);
}

TEST(StudyReportTest, WritesRequestedOutputsOnly) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("mathtune_report_" + std::to_string(stamp));
    const std::string json_path = (dir / "report.json").string();
    const std::string md_path = (dir / "report.md").string();
    const StudyReport report = AnalyzeStudy(MixedStudy(), "quick", false);

    std::string error;
    ASSERT_TRUE(WriteStudyReport(report, json_path, "", &error)) << error;
    EXPECT_TRUE(std::filesystem::exists(json_path));
    EXPECT_FALSE(std::filesystem::exists(md_path));

    ASSERT_TRUE(WriteStudyReport(report, "", md_path, &error)) << error;
    std::string text;
    ASSERT_TRUE(mathtune::apps::ReadTextFile(md_path, &text, &error)) << error;
    EXPECT_EQ(text, StudyReportToMarkdown(report));

    std::filesystem::remove_all(dir);
}

}  // namespace
}  // namespace mathtune::tuning
