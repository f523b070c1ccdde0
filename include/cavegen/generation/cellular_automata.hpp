// CaveGen Generation
// cellular_automata.hpp - Birth/survival cave shaping

#pragma once

#include <cavegen/level/grid.hpp>

#include <cstdint>

namespace cavegen::generation {

// ============================================================================
// Cave Shape Configuration
// ============================================================================

struct CaveShapeConfig {
    int32_t simulation_steps = 4;
    int32_t birth_threshold = 5;     // Floor becomes wall with at least this many wall neighbours
    int32_t survival_threshold = 4;  // Wall stays wall with at least this many wall neighbours
};

// ============================================================================
// Cellular Automata
// ============================================================================

// Every generation reads the previous one in full (double buffered), and
// out-of-bounds neighbours count as walls so caves close up at the edges.
class CellularAutomata {
public:
    /// Run simulation_steps generations; throws std::invalid_argument on bad config
    [[nodiscard]] static level::Grid simulate(const level::Grid& grid, const CaveShapeConfig& config);

    /// One generation
    [[nodiscard]] static level::Grid step(const level::Grid& grid, const CaveShapeConfig& config);

    /// Copy with every edge cell set to wall
    [[nodiscard]] static level::Grid enclose_borders(const level::Grid& grid);

    static void validate_config(const CaveShapeConfig& config);
};

}  // namespace cavegen::generation
