// CaveGen Generation
// grid_seeder.hpp - Random initial wall/floor fill

#pragma once

#include <cavegen/core/random.hpp>
#include <cavegen/level/grid.hpp>

#include <cstdint>

namespace cavegen::generation {

// ============================================================================
// Seed Configuration
// ============================================================================

struct SeedConfig {
    int32_t width = 100;
    int32_t height = 60;
    double initial_wall_ratio = 0.45;  // Probability that a cell starts as wall
};

// ============================================================================
// Grid Seeder
// ============================================================================

class GridSeeder {
public:
    /// Fill a width x height grid row-major; a cell is wall iff next_uniform() < ratio.
    /// Throws std::invalid_argument on an invalid configuration.
    [[nodiscard]] static level::Grid seed_grid(const SeedConfig& config, core::RandomSource& rng);

    /// Throws std::invalid_argument when dimensions are non-positive or the ratio is outside [0, 1]
    static void validate_config(const SeedConfig& config);
};

}  // namespace cavegen::generation
