// CaveGen Pipeline
// parameter_validator.hpp - Generation parameters and their accepted ranges

#pragma once

#include <cavegen/core/config.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cavegen::pipeline {

// ============================================================================
// Validation Error
// ============================================================================

// Rejected parameter with the offending value and a hint for fixing it
class ValidationError : public std::invalid_argument {
public:
    ValidationError(const std::string& message, std::string parameter, std::string value,
                    std::string suggestion = {});

    [[nodiscard]] const std::string& parameter() const { return parameter_; }
    [[nodiscard]] const std::string& value() const { return value_; }
    [[nodiscard]] const std::string& suggestion() const { return suggestion_; }

    /// Message followed by "Parameter:", "Value:" and "Suggestion:" lines where present
    [[nodiscard]] std::string detailed_message() const;

private:
    std::string parameter_;
    std::string value_;
    std::string suggestion_;
};

// ============================================================================
// Generation Parameters
// ============================================================================

struct GenerationParameters {
    std::string seed = "cavegen-level-1";
    int32_t width = 100;
    int32_t height = 60;
    double initial_wall_ratio = 0.45;
    int32_t simulation_steps = 4;
    int32_t birth_threshold = 5;
    int32_t survival_threshold = 4;
    int32_t min_room_size = 50;
    int32_t min_start_goal_distance = 40;
    int32_t coin_count = 15;
    int32_t enemy_count = 5;
};

template <typename T>
struct ParameterRange {
    T min;
    T max;

    [[nodiscard]] constexpr bool contains(T v) const { return v >= min && v <= max; }
};

namespace parameter_range {
    inline constexpr ParameterRange<int32_t> WIDTH{50, 200};
    inline constexpr ParameterRange<int32_t> HEIGHT{30, 120};
    inline constexpr ParameterRange<double> INITIAL_WALL_RATIO{0.4, 0.55};
    inline constexpr ParameterRange<int32_t> SIMULATION_STEPS{3, 6};
    inline constexpr ParameterRange<int32_t> BIRTH_THRESHOLD{4, 6};
    inline constexpr ParameterRange<int32_t> SURVIVAL_THRESHOLD{2, 4};
    inline constexpr ParameterRange<int32_t> MIN_ROOM_SIZE{20, 100};
    inline constexpr ParameterRange<int32_t> MIN_START_GOAL_DISTANCE{30, 100};
    inline constexpr ParameterRange<int32_t> COIN_COUNT{10, 30};
    inline constexpr ParameterRange<int32_t> ENEMY_COUNT{3, 10};
}  // namespace parameter_range

// ============================================================================
// Parameter Validator
// ============================================================================

class ParameterValidator {
public:
    [[nodiscard]] static GenerationParameters default_parameters();

    /// Parameters from the generation and placement sections, defaults where absent
    [[nodiscard]] static GenerationParameters from_config(const core::Config& config);

    /// Throws ValidationError for the first parameter out of range
    static void validate_all(const GenerationParameters& params);

    static void validate_seed(const std::string& seed);
    static void validate_width(int32_t width);
    static void validate_height(int32_t height);
    static void validate_initial_wall_ratio(double ratio);
    static void validate_simulation_steps(int32_t steps);
    static void validate_birth_threshold(int32_t threshold);
    static void validate_survival_threshold(int32_t threshold);
    static void validate_min_room_size(int32_t size);
    static void validate_min_start_goal_distance(int32_t distance);
    static void validate_coin_count(int32_t count);
    static void validate_enemy_count(int32_t count);

private:
    ParameterValidator() = delete;
};

}  // namespace cavegen::pipeline
