// CaveGen Pipeline
// parameter_validator.cpp - Generation parameters and their accepted ranges

#include <cavegen/core/logger.hpp>
#include <cavegen/pipeline/parameter_validator.hpp>

#include <utility>

namespace cavegen::pipeline {

namespace {

template <typename T>
void check_range(const char* parameter, const char* label, T value, const ParameterRange<T>& range,
                 const char* suggestion) {
    if (!range.contains(value)) {
        throw ValidationError(fmt::format("{} must be between {} and {}", label, range.min, range.max), parameter,
                              fmt::format("{}", value), suggestion);
    }
}

}  // namespace

// ============================================================================
// ValidationError
// ============================================================================

ValidationError::ValidationError(const std::string& message, std::string parameter, std::string value,
                                 std::string suggestion)
    : std::invalid_argument(message),
      parameter_(std::move(parameter)),
      value_(std::move(value)),
      suggestion_(std::move(suggestion)) {}

std::string ValidationError::detailed_message() const {
    std::string message = what();
    if (!parameter_.empty()) {
        message += fmt::format("\nParameter: {}", parameter_);
    }
    if (!value_.empty()) {
        message += fmt::format("\nValue: {}", value_);
    }
    if (!suggestion_.empty()) {
        message += fmt::format("\nSuggestion: {}", suggestion_);
    }
    return message;
}

// ============================================================================
// ParameterValidator
// ============================================================================

GenerationParameters ParameterValidator::default_parameters() {
    return GenerationParameters{};
}

GenerationParameters ParameterValidator::from_config(const core::Config& config) {
    namespace section = core::config_section;
    namespace key = core::config_key;

    const GenerationParameters defaults = default_parameters();
    GenerationParameters params;
    params.seed = config.get_string(section::GENERATION, key::SEED, defaults.seed);
    params.width = config.get_int(section::GENERATION, key::WIDTH, defaults.width);
    params.height = config.get_int(section::GENERATION, key::HEIGHT, defaults.height);
    params.initial_wall_ratio =
        config.get_double(section::GENERATION, key::INITIAL_WALL_RATIO, defaults.initial_wall_ratio);
    params.simulation_steps = config.get_int(section::GENERATION, key::SIMULATION_STEPS, defaults.simulation_steps);
    params.birth_threshold = config.get_int(section::GENERATION, key::BIRTH_THRESHOLD, defaults.birth_threshold);
    params.survival_threshold =
        config.get_int(section::GENERATION, key::SURVIVAL_THRESHOLD, defaults.survival_threshold);
    params.min_room_size = config.get_int(section::GENERATION, key::MIN_ROOM_SIZE, defaults.min_room_size);
    params.min_start_goal_distance =
        config.get_int(section::PLACEMENT, key::MIN_START_GOAL_DISTANCE, defaults.min_start_goal_distance);
    params.coin_count = config.get_int(section::PLACEMENT, key::COIN_COUNT, defaults.coin_count);
    params.enemy_count = config.get_int(section::PLACEMENT, key::ENEMY_COUNT, defaults.enemy_count);
    return params;
}

void ParameterValidator::validate_all(const GenerationParameters& params) {
    validate_seed(params.seed);
    validate_width(params.width);
    validate_height(params.height);
    validate_initial_wall_ratio(params.initial_wall_ratio);
    validate_simulation_steps(params.simulation_steps);
    validate_birth_threshold(params.birth_threshold);
    validate_survival_threshold(params.survival_threshold);
    validate_min_room_size(params.min_room_size);
    validate_min_start_goal_distance(params.min_start_goal_distance);
    validate_coin_count(params.coin_count);
    validate_enemy_count(params.enemy_count);
    CAVEGEN_LOG_DEBUG(core::log_category::PIPELINE, "Parameters valid for seed '{}'", params.seed);
}

void ParameterValidator::validate_seed(const std::string& seed) {
    if (seed.empty()) {
        throw ValidationError("Seed must be a non-empty string", "seed", "\"\"",
                              "Provide any text, for example --seed my-level-1");
    }
}

void ParameterValidator::validate_width(int32_t width) {
    check_range("width", "Width", width, parameter_range::WIDTH,
                "Width should be between 50 and 200 for optimal cave generation");
}

void ParameterValidator::validate_height(int32_t height) {
    check_range("height", "Height", height, parameter_range::HEIGHT,
                "Height should be between 30 and 120 for optimal cave generation");
}

void ParameterValidator::validate_initial_wall_ratio(double ratio) {
    check_range("initial_wall_ratio", "Initial wall ratio", ratio, parameter_range::INITIAL_WALL_RATIO,
                "Values near 0.45 produce good cave structures");
}

void ParameterValidator::validate_simulation_steps(int32_t steps) {
    check_range("simulation_steps", "Simulation steps", steps, parameter_range::SIMULATION_STEPS,
                "More steps result in smoother caves, fewer steps in noisier ones");
}

void ParameterValidator::validate_birth_threshold(int32_t threshold) {
    check_range("birth_threshold", "Birth threshold", threshold, parameter_range::BIRTH_THRESHOLD,
                "Higher values lead to more open caves");
}

void ParameterValidator::validate_survival_threshold(int32_t threshold) {
    check_range("survival_threshold", "Survival threshold", threshold, parameter_range::SURVIVAL_THRESHOLD,
                "Higher values lead to more linear, corridor-like caves");
}

void ParameterValidator::validate_min_room_size(int32_t size) {
    check_range("min_room_size", "Minimum room size", size, parameter_range::MIN_ROOM_SIZE,
                "Smaller values keep more isolated pockets");
}

void ParameterValidator::validate_min_start_goal_distance(int32_t distance) {
    check_range("min_start_goal_distance", "Minimum start-goal distance", distance,
                parameter_range::MIN_START_GOAL_DISTANCE, "Keep the distance below the level width");
}

void ParameterValidator::validate_coin_count(int32_t count) {
    check_range("coin_count", "Coin count", count, parameter_range::COIN_COUNT,
                "Between 10 and 30 coins keeps levels rewarding without clutter");
}

void ParameterValidator::validate_enemy_count(int32_t count) {
    check_range("enemy_count", "Enemy count", count, parameter_range::ENEMY_COUNT,
                "Between 3 and 10 enemies keeps levels challenging but fair");
}

}  // namespace cavegen::pipeline
