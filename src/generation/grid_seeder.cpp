// CaveGen Generation
// grid_seeder.cpp - Random initial wall/floor fill

#include <cavegen/core/logger.hpp>
#include <cavegen/generation/grid_seeder.hpp>

#include <cmath>
#include <stdexcept>

namespace cavegen::generation {

void GridSeeder::validate_config(const SeedConfig& config) {
    if (config.width <= 0 || config.height <= 0) {
        throw std::invalid_argument(
            fmt::format("Grid dimensions must be positive, got {}x{}", config.width, config.height));
    }
    if (std::isnan(config.initial_wall_ratio) || config.initial_wall_ratio < 0.0 ||
        config.initial_wall_ratio > 1.0) {
        throw std::invalid_argument(
            fmt::format("initial_wall_ratio must be within [0, 1], got {}", config.initial_wall_ratio));
    }
}

level::Grid GridSeeder::seed_grid(const SeedConfig& config, core::RandomSource& rng) {
    validate_config(config);

    level::Grid grid(config.width, config.height, level::CellType::Floor);
    for (int32_t y = 0; y < config.height; ++y) {
        for (int32_t x = 0; x < config.width; ++x) {
            if (rng.next_uniform() < config.initial_wall_ratio) {
                grid.set(x, y, level::CellType::Wall);
            }
        }
    }

    CAVEGEN_LOG_DEBUG(core::log_category::GENERATION, "Seeded {}x{} grid, wall ratio {:.3f} (target {:.3f})",
                      config.width, config.height, grid.wall_ratio(), config.initial_wall_ratio);
    return grid;
}

}  // namespace cavegen::generation
