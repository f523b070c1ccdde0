// CaveGen Analysis
// corridor_carver.hpp - L-shaped corridors joining every region to the largest one

#pragma once

#include "region_detector.hpp"

#include <cavegen/core/random.hpp>
#include <cavegen/level/grid.hpp>

#include <utility>

namespace cavegen::analysis {

class CorridorCarver {
public:
    /// Copy of the grid with each non-hub region joined to the hub by a
    /// 2-thick L corridor. Fewer than two regions returns an unchanged copy.
    [[nodiscard]] static level::Grid carve_corridors(const level::Grid& grid, const RegionDetection& detection,
                                                     core::RandomSource& rng);

    /// Closest (from, to) cell pair by Manhattan distance, first pair in row-major order on ties
    [[nodiscard]] static std::pair<level::Point, level::Point> closest_pair(const std::vector<level::Point>& from,
                                                                            const std::vector<level::Point>& to);

    /// Carve an L from a to b; horizontal_first picks which leg comes first
    static void carve_l_corridor(level::Grid& grid, const level::Point& a, const level::Point& b,
                                 bool horizontal_first);

    static void carve_horizontal(level::Grid& grid, int32_t x0, int32_t x1, int32_t y);
    static void carve_vertical(level::Grid& grid, int32_t y0, int32_t y1, int32_t x);
};

}  // namespace cavegen::analysis
