// CaveGen Pipeline
// level_generator.hpp - End-to-end generation of a solvable cave level

#pragma once

#include "parameter_validator.hpp"

#include <cavegen/analysis/connectivity_validator.hpp>
#include <cavegen/analysis/reachability_analyzer.hpp>
#include <cavegen/core/config.hpp>
#include <cavegen/core/result.hpp>
#include <cavegen/level/grid.hpp>
#include <cavegen/placement/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cavegen::pipeline {

// ============================================================================
// Settings and Results
// ============================================================================

// Tunables outside the validated parameter set
struct GeneratorSettings {
    analysis::PhysicsConfig physics;
    analysis::ConnectivityConfig connectivity;
    double target_reachability = 0.7;
    double spawn_left_boundary = 0.25;
    double goal_right_boundary = 0.75;
    double relaxed_goal_distance = 10.0;
    int32_t spawn_forbidden_radius = 5;  // Platforms stay out of this window around spawn
    double enemy_density = 0.05;
    double enemy_spawn_distance = 8.0;
    double enemy_goal_distance = 5.0;
};

struct StageTiming {
    std::string stage;
    double milliseconds = 0.0;
};

struct GenerationStats {
    size_t regions_detected = 0;
    size_t regions_culled = 0;
    double connectivity_score = 0.0;
    int32_t connectivity_attempts = 0;
    bool connectivity_fallback_applied = false;
    size_t diagonal_fixes = 0;
    double floor_ratio = 0.0;

    bool spawn_fallback_used = false;
    double initial_reachability = 0.0;
    double final_reachability = 0.0;
    int32_t platform_iterations = 0;
    bool reachability_target_met = false;
    bool goal_fallback_used = false;
    double goal_distance = 0.0;
    std::string coin_error;  // Empty unless coin placement gave up
    size_t enemy_target = 0;

    std::vector<StageTiming> timings;
    double total_milliseconds = 0.0;
};

// Cave geometry and everything placed in it. Platforms are listed separately
// and are not baked into grid.
struct LevelResult {
    GenerationParameters params;
    int32_t tile_size = 64;
    level::Grid grid;
    level::Point spawn{0, 0};
    level::Point goal{0, 0};
    std::vector<placement::Coin> coins;
    std::vector<placement::Platform> platforms;
    std::vector<placement::Enemy> enemies;
    GenerationStats stats;

    /// grid with every platform tile marked as wall
    [[nodiscard]] level::Grid grid_with_platforms() const;
};

// ============================================================================
// Level Generator
// ============================================================================

class LevelGenerator {
public:
    explicit LevelGenerator(const GeneratorSettings& settings = {});

    /// Physics and connectivity sections of a config, with defaults for missing keys
    [[nodiscard]] static GeneratorSettings settings_from_config(const core::Config& config);

    /// Runs every stage in order. Throws ValidationError for bad parameters and
    /// returns a failed result naming the stage when generation cannot finish.
    [[nodiscard]] core::Result<LevelResult> generate(const GenerationParameters& params) const;

    [[nodiscard]] const GeneratorSettings& get_settings() const { return settings_; }

private:
    GeneratorSettings settings_;
};

}  // namespace cavegen::pipeline
