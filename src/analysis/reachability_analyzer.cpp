// CaveGen Analysis
// reachability_analyzer.cpp - Physics-aware reachability over walk, jump and fall moves

#include <cavegen/analysis/reachability_analyzer.hpp>
#include <cavegen/core/logger.hpp>
#include <cavegen/platform/timer.hpp>

#include <algorithm>
#include <cmath>
#include <deque>
#include <stdexcept>

namespace cavegen::analysis {

using level::Grid;
using level::Point;

// ============================================================================
// PhysicsConfig
// ============================================================================

int32_t PhysicsConfig::max_jump_rise_tiles() const {
    return static_cast<int32_t>(std::floor(jump_height * vertical_reach_factor / static_cast<double>(tile_size)));
}

int32_t PhysicsConfig::max_jump_span_tiles() const {
    const double span_px = std::floor(jump_height * horizontal_reach_factor);
    return static_cast<int32_t>(std::floor(span_px / static_cast<double>(tile_size)));
}

double PhysicsConfig::launch_velocity() const {
    return std::sqrt(2.0 * gravity * jump_height * vertical_reach_factor);
}

void PhysicsConfig::validate() const {
    if (!(jump_height > 0.0)) {
        throw std::invalid_argument(fmt::format("Jump height must be positive, got {}", jump_height));
    }
    if (!(gravity > 0.0)) {
        throw std::invalid_argument(fmt::format("Gravity must be positive, got {}", gravity));
    }
    if (tile_size <= 0) {
        throw std::invalid_argument(fmt::format("Tile size must be positive, got {}", tile_size));
    }
    if (vertical_reach_factor < 0.0 || horizontal_reach_factor < 0.0) {
        throw std::invalid_argument("Reach factors must be non-negative");
    }
}

// ============================================================================
// Search State
// ============================================================================

struct ReachabilityAnalyzer::Search {
    ReachabilityResult result;
    std::deque<Point> queue;
    std::optional<int32_t> max_moves;

    void add(const Point& p, int32_t moves) {
        if (max_moves && moves > *max_moves) {
            return;
        }
        auto it = result.moves.find(p);
        if (it == result.moves.end()) {
            result.moves.emplace(p, moves);
            result.reachable.insert(p);
            result.order.push_back(p);
            queue.push_back(p);
        } else if (moves < it->second) {
            it->second = moves;
            queue.push_back(p);
        }
    }
};

// ============================================================================
// ReachabilityAnalyzer
// ============================================================================

ReachabilityAnalyzer::ReachabilityAnalyzer(const PhysicsConfig& config) : config_(config) {
    config_.validate();
    max_rise_ = config_.max_jump_rise_tiles();
    max_span_ = config_.max_jump_span_tiles();
    build_arcs();

    CAVEGEN_LOG_DEBUG(core::log_category::ANALYSIS, "Reachability physics: rise {} tiles, span {} tiles, {} arcs",
                      max_rise_, max_span_, arcs_.size());
}

JumpArc ReachabilityAnalyzer::trace_arc(int32_t dx, int32_t rise, int32_t apex) const {
    const double tile = static_cast<double>(config_.tile_size);
    const double g = config_.gravity;

    const double v0 = std::sqrt(2.0 * g * static_cast<double>(apex) * tile);
    const double discriminant = std::max(0.0, v0 * v0 - 2.0 * g * static_cast<double>(rise) * tile);
    const double t_land = (v0 + std::sqrt(discriminant)) / g;
    const double vx = static_cast<double>(dx) * tile / t_land;

    JumpArc arc;
    arc.offset = Point(dx, -rise);
    arc.apex = apex;

    const int32_t samples = 8 * (std::abs(dx) + apex + std::abs(apex - rise)) + 8;
    for (int32_t i = 1; i < samples; ++i) {
        const double t = t_land * static_cast<double>(i) / static_cast<double>(samples);
        const double px = vx * t;
        const double py = v0 * t - 0.5 * g * t * t;
        const Point tile_offset(static_cast<int32_t>(std::lround(px / tile)),
                                -static_cast<int32_t>(std::lround(py / tile)));

        if (tile_offset == Point(0, 0) || tile_offset == arc.offset) {
            continue;
        }
        if (std::find(arc.path.begin(), arc.path.end(), tile_offset) == arc.path.end()) {
            arc.path.push_back(tile_offset);
        }
    }
    return arc;
}

void ReachabilityAnalyzer::build_arcs() {
    arcs_.clear();
    for (int32_t dy = -max_rise_; dy <= max_rise_; ++dy) {
        for (int32_t dx = -max_span_; dx <= max_span_; ++dx) {
            if (dx == 0 && dy == 0) {
                continue;
            }
            const int32_t rise = -dy;
            const int32_t min_apex_base = std::max(rise, 0);
            const int32_t lowest = min_apex_base + 1 <= max_rise_ ? min_apex_base + 1 : min_apex_base;

            for (int32_t apex = lowest; apex <= max_rise_; ++apex) {
                if (apex == 0 || apex < rise) {
                    continue;
                }
                arcs_.push_back(trace_arc(dx, rise, apex));
            }
        }
    }
}

bool ReachabilityAnalyzer::arc_clear(const Grid& grid, const Point& from, const JumpArc& arc,
                                     const level::PointSet* blocked) const {
    for (const auto& step : arc.path) {
        const Point p = from + step;
        if (!grid.in_bounds(p) || grid.get(p) == level::WALL || is_blocked(blocked, p)) {
            return false;
        }
    }
    return true;
}

std::vector<Point> ReachabilityAnalyzer::fall_cone(const Grid& grid, const Point& p,
                                                   const level::PointSet* blocked) const {
    std::vector<Point> cone;
    level::PointSet seen;
    std::deque<Point> queue;
    queue.push_back(p);
    seen.insert(p);

    while (!queue.empty()) {
        const Point current = queue.front();
        queue.pop_front();

        for (int32_t dx = -1; dx <= 1; ++dx) {
            // Sideways drift cannot pass through a wall beside the faller
            if (dx != 0 && !is_passable(grid, Point(current.x + dx, current.y), blocked)) {
                continue;
            }
            const Point below(current.x + dx, current.y + 1);
            if (!is_passable(grid, below, blocked) || seen.count(below) != 0) {
                continue;
            }
            seen.insert(below);
            cone.push_back(below);
            if (is_passable(grid, Point(below.x, below.y + 1), blocked)) {
                queue.push_back(below);
            }
        }
    }
    return cone;
}

void ReachabilityAnalyzer::explore(const Grid& grid, Search& search, const ReachabilityOptions& options) const {
    const level::PointSet* blocked = options.blocked;

    auto land = [&](const Point& target, int32_t moves) {
        search.add(target, moves);
        if (!grid.has_footing(target)) {
            for (const auto& p : fall_cone(grid, target, blocked)) {
                search.add(p, moves);
            }
        }
    };

    while (!search.queue.empty()) {
        const Point current = search.queue.front();
        search.queue.pop_front();

        const int32_t moves = search.result.moves.at(current);
        if (search.max_moves && moves >= *search.max_moves) {
            continue;
        }
        if (!is_standing(grid, current, blocked)) {
            continue;
        }

        const int32_t next_moves = moves + 1;

        // Walk
        for (int32_t dx : {-1, 1}) {
            const Point side(current.x + dx, current.y);
            if (is_passable(grid, side, blocked)) {
                land(side, next_moves);
            }
        }

        if (!options.allow_jumps) {
            continue;
        }

        // Jump: arcs for one offset are consecutive, lowest apex first
        const JumpArc* resolved = nullptr;
        for (const auto& arc : arcs_) {
            if (resolved != nullptr && resolved->offset == arc.offset) {
                continue;
            }
            const Point target = current + arc.offset;
            if (!is_passable(grid, target, blocked)) {
                continue;
            }
            auto known = search.result.moves.find(target);
            if (known != search.result.moves.end() && known->second <= next_moves) {
                continue;
            }
            if (arc_clear(grid, current, arc, blocked)) {
                resolved = &arc;
                land(target, next_moves);
            }
        }
    }
}

ReachabilityResult ReachabilityAnalyzer::analyze(const Grid& grid, const Point& start,
                                                 const ReachabilityOptions& options) const {
    if (!grid.in_bounds(start)) {
        throw std::invalid_argument(fmt::format("Start position ({}, {}) is outside the {}x{} grid", start.x,
                                                start.y, grid.width(), grid.height()));
    }
    if (grid.get(start) != level::FLOOR) {
        throw std::invalid_argument(fmt::format("Start position ({}, {}) is not a floor tile", start.x, start.y));
    }
    if (options.max_moves && *options.max_moves < 0) {
        throw std::invalid_argument(fmt::format("max_moves must be non-negative, got {}", *options.max_moves));
    }

    Search search;
    search.max_moves = options.max_moves;
    search.result.start = start;
    search.add(start, 0);

    // Straight drop below the start
    for (Point below(start.x, start.y + 1); is_passable(grid, below, options.blocked); ++below.y) {
        search.add(below, 0);
    }

    explore(grid, search, options);

    CAVEGEN_LOG_TRACE(core::log_category::ANALYSIS, "Reachability from ({}, {}): {} tiles", start.x, start.y,
                      search.result.count());
    return std::move(search.result);
}

ReachabilityResult ReachabilityAnalyzer::extend(const Grid& grid, const ReachabilityResult& previous,
                                                const std::vector<Point>& added_walls) const {
    const level::PointSet walls(added_walls.begin(), added_walls.end());

    Search search;
    search.result.start = previous.start;
    for (const auto& p : previous.order) {
        if (walls.count(p) == 0) {
            search.result.reachable.insert(p);
            search.result.order.push_back(p);
            search.result.moves.emplace(p, previous.moves.at(p));
        }
    }

    // Any newly reachable tile is reached through a tile that now stands on a wall
    for (const auto& wall : added_walls) {
        const Point above(wall.x, wall.y - 1);
        if (search.result.contains(above) && grid.has_footing(above)) {
            search.queue.push_back(above);
        }
    }
    const size_t seeds = search.queue.size();

    explore(grid, search, {});

    CAVEGEN_LOG_TRACE(core::log_category::ANALYSIS, "Extended reachability from {} seeds: {} -> {} tiles", seeds,
                      previous.count(), search.result.count());
    return std::move(search.result);
}

bool ReachabilityAnalyzer::is_reachable_by_jump(const Grid& grid, const Point& from, const Point& to,
                                                const level::PointSet* blocked) const {
    if (!is_standing(grid, from, blocked) || !is_passable(grid, to, blocked)) {
        return false;
    }
    const Point offset = to - from;
    if (offset == Point(0, 0) || std::abs(offset.x) > max_span_ || std::abs(offset.y) > max_rise_) {
        return false;
    }
    for (const auto& arc : arcs_) {
        if (arc.offset == offset && arc_clear(grid, from, arc, blocked)) {
            return true;
        }
    }
    return false;
}

std::vector<Point> ReachabilityAnalyzer::detect_unreachable_areas(const Grid& grid) const {
    CAVEGEN_SCOPED_TIMER(core::log_category::ANALYSIS, "detect_unreachable_areas");
    Search search;
    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            if (grid.has_footing(x, y)) {
                search.add(Point(x, y), 0);
            }
        }
    }
    explore(grid, search, ReachabilityOptions{});

    std::vector<Point> unreachable;
    for (const auto& p : grid.floor_cells()) {
        if (!search.result.contains(p)) {
            unreachable.push_back(p);
        }
    }

    CAVEGEN_LOG_DEBUG(core::log_category::ANALYSIS, "{} floor tiles unreachable from any standing position",
                      unreachable.size());
    return unreachable;
}

double ReachabilityAnalyzer::reachability_ratio(const Grid& grid, const ReachabilityResult& result) {
    const size_t floor = grid.floor_count();
    if (floor == 0) {
        return 1.0;
    }
    return static_cast<double>(result.count()) / static_cast<double>(floor);
}

double ReachabilityAnalyzer::reachability_ratio(const Grid& grid, const Point& start) const {
    return reachability_ratio(grid, analyze(grid, start));
}

}  // namespace cavegen::analysis
