// CaveGen Generation
// cellular_automata.cpp - Birth/survival cave shaping

#include <cavegen/core/logger.hpp>
#include <cavegen/generation/cellular_automata.hpp>

#include <stdexcept>

namespace cavegen::generation {

using level::CellType;
using level::Grid;

void CellularAutomata::validate_config(const CaveShapeConfig& config) {
    if (config.simulation_steps < 0) {
        throw std::invalid_argument(
            fmt::format("simulation_steps must be non-negative, got {}", config.simulation_steps));
    }
    if (config.birth_threshold < 0 || config.birth_threshold > 8) {
        throw std::invalid_argument(
            fmt::format("birth_threshold must be within [0, 8], got {}", config.birth_threshold));
    }
    if (config.survival_threshold < 0 || config.survival_threshold > 8) {
        throw std::invalid_argument(
            fmt::format("survival_threshold must be within [0, 8], got {}", config.survival_threshold));
    }
}

Grid CellularAutomata::step(const Grid& grid, const CaveShapeConfig& config) {
    Grid next = grid;
    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            const int walls = level::count_wall_neighbors(grid, x, y);
            const bool is_wall = grid.get(x, y) == level::WALL;
            const bool becomes_wall = is_wall ? walls >= config.survival_threshold : walls >= config.birth_threshold;
            next.set(x, y, becomes_wall ? CellType::Wall : CellType::Floor);
        }
    }
    return next;
}

Grid CellularAutomata::simulate(const Grid& grid, const CaveShapeConfig& config) {
    validate_config(config);
    if (grid.empty()) {
        throw std::invalid_argument("Cannot simulate an empty grid");
    }

    Grid current = grid;
    for (int32_t i = 0; i < config.simulation_steps; ++i) {
        current = step(current, config);
    }

    CAVEGEN_LOG_DEBUG(core::log_category::GENERATION, "Cellular automata: {} steps (B{}/S{}), wall ratio {:.3f}",
                      config.simulation_steps, config.birth_threshold, config.survival_threshold,
                      current.wall_ratio());
    return current;
}

Grid CellularAutomata::enclose_borders(const Grid& grid) {
    Grid enclosed = grid;
    for (int32_t x = 0; x < grid.width(); ++x) {
        enclosed.set(x, 0, CellType::Wall);
        enclosed.set(x, grid.height() - 1, CellType::Wall);
    }
    for (int32_t y = 0; y < grid.height(); ++y) {
        enclosed.set(0, y, CellType::Wall);
        enclosed.set(grid.width() - 1, y, CellType::Wall);
    }
    return enclosed;
}

}  // namespace cavegen::generation
