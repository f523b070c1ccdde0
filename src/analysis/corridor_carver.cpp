// CaveGen Analysis
// corridor_carver.cpp - L-shaped corridors joining every region to the largest one

#include <cavegen/analysis/corridor_carver.hpp>
#include <cavegen/core/logger.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace cavegen::analysis {

using level::CellType;
using level::Grid;
using level::Point;

std::pair<Point, Point> CorridorCarver::closest_pair(const std::vector<Point>& from, const std::vector<Point>& to) {
    if (from.empty() || to.empty()) {
        throw std::logic_error("closest_pair requires two non-empty cell sets");
    }

    std::pair<Point, Point> best{from.front(), to.front()};
    int best_distance = std::numeric_limits<int>::max();
    for (const auto& a : from) {
        for (const auto& b : to) {
            const int distance = level::manhattan_distance(a, b);
            if (distance < best_distance) {
                best_distance = distance;
                best = {a, b};
            }
        }
    }
    return best;
}

void CorridorCarver::carve_horizontal(Grid& grid, int32_t x0, int32_t x1, int32_t y) {
    const int32_t second_row = std::min(y + 1, grid.height() - 1);
    for (int32_t x = std::min(x0, x1); x <= std::max(x0, x1); ++x) {
        grid.set(x, y, CellType::Floor);
        grid.set(x, second_row, CellType::Floor);
    }
}

void CorridorCarver::carve_vertical(Grid& grid, int32_t y0, int32_t y1, int32_t x) {
    const int32_t second_column = std::min(x + 1, grid.width() - 1);
    for (int32_t y = std::min(y0, y1); y <= std::max(y0, y1); ++y) {
        grid.set(x, y, CellType::Floor);
        grid.set(second_column, y, CellType::Floor);
    }
}

void CorridorCarver::carve_l_corridor(Grid& grid, const Point& a, const Point& b, bool horizontal_first) {
    if (!grid.in_bounds(a) || !grid.in_bounds(b)) {
        throw std::logic_error("carve_l_corridor endpoints must be inside the grid");
    }

    if (horizontal_first) {
        carve_horizontal(grid, a.x, b.x, a.y);
        carve_vertical(grid, a.y, b.y, b.x);
    } else {
        carve_vertical(grid, a.y, b.y, a.x);
        carve_horizontal(grid, a.x, b.x, b.y);
    }
}

Grid CorridorCarver::carve_corridors(const Grid& grid, const RegionDetection& detection, core::RandomSource& rng) {
    Grid result = grid;
    if (detection.region_count() < 2) {
        return result;
    }
    if (detection.width != grid.width() || detection.height != grid.height()) {
        throw std::logic_error("carve_corridors: detection does not match grid shape");
    }

    const RegionInfo& hub = largest_region(detection);
    const std::vector<Point> hub_cells = region_cells(detection, hub.label);

    size_t carved = 0;
    for (const auto& region : detection.regions) {
        if (region.label == hub.label) {
            continue;
        }

        const std::vector<Point> cells = region_cells(detection, region.label);
        const auto [from, to] = closest_pair(cells, hub_cells);
        const bool horizontal_first = rng.next_uniform() < 0.5;
        carve_l_corridor(result, from, to, horizontal_first);
        ++carved;

        CAVEGEN_LOG_TRACE(core::log_category::ANALYSIS, "Corridor region {} ({},{}) -> hub ({},{}) {}", region.label,
                          from.x, from.y, to.x, to.y, horizontal_first ? "horizontal-first" : "vertical-first");
    }

    CAVEGEN_LOG_DEBUG(core::log_category::ANALYSIS, "Carved {} corridors into hub region {} (area {})", carved,
                      hub.label, hub.area);
    return result;
}

}  // namespace cavegen::analysis
