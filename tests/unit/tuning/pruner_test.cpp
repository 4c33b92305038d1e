#include "mathtune/tuning/pruner.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace mathtune::tuning {
namespace {

// Adds a complete trial that reported `values` at steps 0..n-1.
void AddCompleteTrial(Study* study, const std::vector<double>& values) {
    const int id = study->StartTrial(Configuration{});
    for (std::size_t step = 0; step < values.size(); ++step) {
        study->Report(id, static_cast<int>(step), values[step]);
    }
    TrialOutcome outcome;
    outcome.state = TrialState::kComplete;
    outcome.score = values.back();
    study->FinishTrial(id, outcome);
}

TEST(MedianTest, OddAndEvenCounts) {
    EXPECT_DOUBLE_EQ(Median({3.0, 1.0, 2.0}), 2.0);
    EXPECT_DOUBLE_EQ(Median({4.0, 1.0, 3.0, 2.0}), 2.5);
    EXPECT_TRUE(std::isnan(Median({})));
}

TEST(MedianPrunerTest, NeverPrunesDuringWarmup) {
    Study study;
    for (int i = 0; i < 5; ++i) {
        AddCompleteTrial(&study, {1.0, 1.0, 1.0, 1.0});
    }
    const int running = study.StartTrial(Configuration{});
    const MedianPruner pruner(3, 2);

    EXPECT_FALSE(pruner.ShouldPrune(study, study.trial(running), 0, 0.0));
    EXPECT_FALSE(pruner.ShouldPrune(study, study.trial(running), 1, 0.0));
    EXPECT_TRUE(pruner.ShouldPrune(study, study.trial(running), 2, 0.0));
}

TEST(MedianPrunerTest, NeverPrunesBeforeEnoughCompleteTrials) {
    Study study;
    AddCompleteTrial(&study, {1.0, 1.0, 1.0});
    AddCompleteTrial(&study, {1.0, 1.0, 1.0});
    const int running = study.StartTrial(Configuration{});
    const MedianPruner pruner(3, 0);

    EXPECT_FALSE(pruner.ShouldPrune(study, study.trial(running), 2, 0.0));
}

TEST(MedianPrunerTest, PrunesOnlyStrictlyBelowMedian) {
    Study study;
    AddCompleteTrial(&study, {1.0, 0.5, 0.0});
    AddCompleteTrial(&study, {1.0, 1.0, 0.5});
    AddCompleteTrial(&study, {1.0, 1.0, 1.0});
    const int running = study.StartTrial(Configuration{});
    const MedianPruner pruner(3, 2);

    // Median at step 2 is 0.5.
    EXPECT_FALSE(pruner.ShouldPrune(study, study.trial(running), 2, 0.5));
    EXPECT_FALSE(pruner.ShouldPrune(study, study.trial(running), 2, 0.9));
    EXPECT_TRUE(pruner.ShouldPrune(study, study.trial(running), 2, 0.4));
    EXPECT_TRUE(pruner.ShouldPrune(study, study.trial(running), 2,
                                   std::numeric_limits<double>::quiet_NaN()));
}

TEST(MedianPrunerTest, StepsWithoutHistoryAreNotPruned) {
    Study study;
    for (int i = 0; i < 3; ++i) {
        AddCompleteTrial(&study, {1.0, 1.0});
    }
    const int running = study.StartTrial(Configuration{});
    const MedianPruner pruner(3, 0);
    EXPECT_FALSE(pruner.ShouldPrune(study, study.trial(running), 5, 0.0));
}

TEST(MedianPrunerTest, RejectsNegativeThresholds) {
    EXPECT_THROW(MedianPruner(-1, 0), std::invalid_argument);
    EXPECT_THROW(MedianPruner(0, -1), std::invalid_argument);
}

TEST(NopPrunerTest, NeverPrunes) {
    Study study;
    for (int i = 0; i < 5; ++i) {
        AddCompleteTrial(&study, {1.0, 1.0, 1.0});
    }
    const int running = study.StartTrial(Configuration{});
    const NopPruner pruner;
    EXPECT_FALSE(pruner.ShouldPrune(study, study.trial(running), 2, 0.0));
}

}  // namespace
}  // namespace mathtune::tuning
