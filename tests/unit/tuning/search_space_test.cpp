#include "mathtune/tuning/search_space.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mathtune/tuning/errors.h"
#include "mathtune/tuning/tuning_config.h"

namespace mathtune::tuning {
namespace {

SearchSpace MakeSpace(std::vector<ParameterSpec> specs) {
    SearchSpace space;
    std::string error;
    EXPECT_TRUE(SearchSpace::Create(std::move(specs), &space, &error)) << error;
    return space;
}

TEST(SearchSpaceTest, DefaultSpaceDeclaresSixParameters) {
    const SearchSpace space = DefaultSearchSpace(TuningConfig{});
    ASSERT_EQ(space.size(), 6U);

    const ParameterSpec* k = space.Find("k");
    ASSERT_NE(k, nullptr);
    EXPECT_EQ(k->kind, ParamKind::kIntRange);
    EXPECT_DOUBLE_EQ(k->low, 4.0);
    EXPECT_DOUBLE_EQ(k->high, 16.0);

    const ParameterSpec* tokens = space.Find("max_new_tokens");
    ASSERT_NE(tokens, nullptr);
    EXPECT_EQ(tokens->step, 512);
    EXPECT_EQ(tokens->GridSize(), 7);

    const ParameterSpec* strategy = space.Find("selection_strategy");
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->choices,
              (std::vector<std::string>{"majority_vote", "verifier_weighted", "consensus"}));
    EXPECT_EQ(space.Find("unknown"), nullptr);
}

TEST(SearchSpaceTest, CreateRejectsBrokenSpecs) {
    SearchSpace space;
    std::string error;

    EXPECT_FALSE(SearchSpace::Create({ParameterSpec::IntRange("k", 8, 4)}, &space, &error));
    EXPECT_NE(error.find("high must be >= low"), std::string::npos);

    EXPECT_FALSE(SearchSpace::Create({ParameterSpec::IntRange("k", 4, 8, 0)}, &space, &error));
    EXPECT_NE(error.find("step must be > 0"), std::string::npos);

    EXPECT_FALSE(SearchSpace::Create({ParameterSpec::Categorical("style", {})}, &space, &error));
    EXPECT_NE(error.find("must not be empty"), std::string::npos);

    EXPECT_FALSE(SearchSpace::Create(
        {ParameterSpec::FloatRange("t", 0.1, 0.2), ParameterSpec::FloatRange("t", 0.3, 0.4)},
        &space, &error));
    EXPECT_NE(error.find("duplicate parameter name"), std::string::npos);

    EXPECT_FALSE(SearchSpace::Create({}, &space, &error));
}

TEST(SearchSpaceTest, DrawCoercesToCanonicalTypes) {
    const SearchSpace space = MakeSpace({ParameterSpec::IntRange("tokens", 1024, 4096, 512),
                                         ParameterSpec::FloatRange("temperature", 0.3, 1.0),
                                         ParameterSpec::Categorical("style", {"strict_final", "tir"})});

    EXPECT_EQ(space.Draw("tokens", ParamValue{2048}), ParamValue{2048});
    EXPECT_EQ(space.Draw("tokens", ParamValue{1536.0}), ParamValue{1536});
    EXPECT_EQ(space.Draw("temperature", ParamValue{1}), ParamValue{1.0});
    EXPECT_EQ(space.Draw("style", ParamValue{std::string("tir")}), ParamValue{std::string("tir")});
}

TEST(SearchSpaceTest, DrawRejectsValuesOutsideTheDomain) {
    const SearchSpace space = MakeSpace({ParameterSpec::IntRange("tokens", 1024, 4096, 512),
                                         ParameterSpec::FloatRange("temperature", 0.3, 1.0),
                                         ParameterSpec::Categorical("style", {"strict_final", "tir"})});

    EXPECT_THROW(space.Draw("tokens", ParamValue{1000}), InvalidParameterError);
    EXPECT_THROW(space.Draw("tokens", ParamValue{1100}), InvalidParameterError);
    EXPECT_THROW(space.Draw("tokens", ParamValue{1024.5}), InvalidParameterError);
    EXPECT_THROW(space.Draw("temperature", ParamValue{1.5}), InvalidParameterError);
    EXPECT_THROW(space.Draw("temperature", ParamValue{std::string("hot")}), InvalidParameterError);
    EXPECT_THROW(space.Draw("style", ParamValue{std::string("cot")}), InvalidParameterError);
    EXPECT_THROW(space.Draw("missing", ParamValue{1}), InvalidParameterError);

    try {
        space.Draw("tokens", ParamValue{1100});
        FAIL() << "expected InvalidParameterError";
    } catch (const InvalidParameterError& ex) {
        EXPECT_EQ(ex.param_name(), "tokens");
        EXPECT_NE(std::string(ex.what()).find("step grid"), std::string::npos);
    }
}

TEST(SearchSpaceTest, ContainsChecksEveryParameter) {
    const SearchSpace space = DefaultSearchSpace(TuningConfig{});

    Configuration config;
    std::string error;
    ASSERT_TRUE(PresetConfiguration("conservative", &config, &error)) << error;
    EXPECT_TRUE(space.Contains(config, &error)) << error;

    Configuration missing = config;
    missing.values.erase("top_p");
    EXPECT_FALSE(space.Contains(missing, &error));

    Configuration wrong_type = config;
    wrong_type.values["temperature"] = 1;
    EXPECT_FALSE(space.Contains(wrong_type, &error));
    EXPECT_NE(error.find("canonical"), std::string::npos);

    Configuration out_of_range = config;
    out_of_range.values["k"] = 17;
    EXPECT_FALSE(space.Contains(out_of_range, &error));
}

TEST(SearchSpaceTest, SingleValueRangesAreAllowed) {
    const SearchSpace space = MakeSpace({ParameterSpec::IntRange("k", 8, 8),
                                         ParameterSpec::FloatRange("top_p", 0.9, 0.9)});
    EXPECT_EQ(space.Draw("k", ParamValue{8}), ParamValue{8});
    EXPECT_EQ(space.Draw("top_p", ParamValue{0.9}), ParamValue{0.9});
}

}  // namespace
}  // namespace mathtune::tuning
