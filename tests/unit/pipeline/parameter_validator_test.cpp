// CaveGen Pipeline Tests
// parameter_validator_test.cpp - Parameter ranges and validation errors

#include <gtest/gtest.h>

#include <cavegen/core/config.hpp>
#include <cavegen/pipeline/parameter_validator.hpp>

#include <string>

namespace cavegen::pipeline {
namespace {

class ParameterValidatorTest : public ::testing::Test {
protected:
    GenerationParameters params_ = ParameterValidator::default_parameters();

    // Runs validate_all and returns the parameter name of the error, empty when valid
    std::string rejected_parameter(const GenerationParameters& params) {
        try {
            ParameterValidator::validate_all(params);
        } catch (const ValidationError& e) {
            return e.parameter();
        }
        return {};
    }
};

TEST_F(ParameterValidatorTest, DefaultsAreValid) {
    EXPECT_NO_THROW(ParameterValidator::validate_all(params_));
    EXPECT_EQ(params_.seed, "cavegen-level-1");
    EXPECT_EQ(params_.width, 100);
    EXPECT_EQ(params_.height, 60);
    EXPECT_DOUBLE_EQ(params_.initial_wall_ratio, 0.45);
    EXPECT_EQ(params_.coin_count, 15);
    EXPECT_EQ(params_.enemy_count, 5);
}

// Test: Range limits are inclusive on both ends
TEST_F(ParameterValidatorTest, BoundsAreInclusive) {
    EXPECT_NO_THROW(ParameterValidator::validate_width(50));
    EXPECT_NO_THROW(ParameterValidator::validate_width(200));
    EXPECT_THROW(ParameterValidator::validate_width(49), ValidationError);
    EXPECT_THROW(ParameterValidator::validate_width(201), ValidationError);

    EXPECT_NO_THROW(ParameterValidator::validate_initial_wall_ratio(0.4));
    EXPECT_NO_THROW(ParameterValidator::validate_initial_wall_ratio(0.55));
    EXPECT_THROW(ParameterValidator::validate_initial_wall_ratio(0.56), ValidationError);
}

TEST_F(ParameterValidatorTest, EachParameterIsChecked) {
    auto with = [this](auto&& change) {
        GenerationParameters params = params_;
        change(params);
        return rejected_parameter(params);
    };

    EXPECT_EQ(with([](auto& p) { p.seed.clear(); }), "seed");
    EXPECT_EQ(with([](auto& p) { p.width = 10; }), "width");
    EXPECT_EQ(with([](auto& p) { p.height = 500; }), "height");
    EXPECT_EQ(with([](auto& p) { p.initial_wall_ratio = 0.9; }), "initial_wall_ratio");
    EXPECT_EQ(with([](auto& p) { p.simulation_steps = 0; }), "simulation_steps");
    EXPECT_EQ(with([](auto& p) { p.birth_threshold = 9; }), "birth_threshold");
    EXPECT_EQ(with([](auto& p) { p.survival_threshold = 1; }), "survival_threshold");
    EXPECT_EQ(with([](auto& p) { p.min_room_size = 5; }), "min_room_size");
    EXPECT_EQ(with([](auto& p) { p.min_start_goal_distance = 200; }), "min_start_goal_distance");
    EXPECT_EQ(with([](auto& p) { p.coin_count = 0; }), "coin_count");
    EXPECT_EQ(with([](auto& p) { p.enemy_count = 11; }), "enemy_count");
}

TEST_F(ParameterValidatorTest, FirstInvalidParameterWins) {
    params_.width = 10;
    params_.enemy_count = 99;
    EXPECT_EQ(rejected_parameter(params_), "width");
}

TEST_F(ParameterValidatorTest, ErrorCarriesDetails) {
    try {
        ParameterValidator::validate_width(10);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Width must be between 50 and 200");
        EXPECT_EQ(e.parameter(), "width");
        EXPECT_EQ(e.value(), "10");
        EXPECT_FALSE(e.suggestion().empty());

        const std::string detailed = e.detailed_message();
        EXPECT_NE(detailed.find("Parameter: width"), std::string::npos);
        EXPECT_NE(detailed.find("Value: 10"), std::string::npos);
        EXPECT_NE(detailed.find("Suggestion: "), std::string::npos);
    }
}

TEST_F(ParameterValidatorTest, ValidationErrorIsInvalidArgument) {
    EXPECT_THROW(ParameterValidator::validate_seed(""), std::invalid_argument);

    ValidationError bare("Something broke", "", "");
    EXPECT_EQ(bare.detailed_message(), "Something broke");
}

TEST_F(ParameterValidatorTest, FromConfigReadsSections) {
    core::Config config;
    config.set_string(core::config_section::GENERATION, core::config_key::SEED, "from-config");
    config.set_int(core::config_section::GENERATION, core::config_key::WIDTH, 150);
    config.set_double(core::config_section::GENERATION, core::config_key::INITIAL_WALL_RATIO, 0.5);
    config.set_int(core::config_section::PLACEMENT, core::config_key::COIN_COUNT, 25);

    GenerationParameters params = ParameterValidator::from_config(config);
    EXPECT_EQ(params.seed, "from-config");
    EXPECT_EQ(params.width, 150);
    EXPECT_DOUBLE_EQ(params.initial_wall_ratio, 0.5);
    EXPECT_EQ(params.coin_count, 25);
    EXPECT_EQ(params.height, 60);
    EXPECT_EQ(params.enemy_count, 5);
}

TEST_F(ParameterValidatorTest, RangeContains) {
    EXPECT_TRUE(parameter_range::COIN_COUNT.contains(10));
    EXPECT_TRUE(parameter_range::COIN_COUNT.contains(30));
    EXPECT_FALSE(parameter_range::COIN_COUNT.contains(31));
    static_assert(parameter_range::ENEMY_COUNT.contains(5));
}

}  // namespace
}  // namespace cavegen::pipeline
