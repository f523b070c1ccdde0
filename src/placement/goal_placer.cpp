// CaveGen Placement
// goal_placer.cpp - Level goal placement before and after platform augmentation

#include <cavegen/core/logger.hpp>
#include <cavegen/placement/goal_placer.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cavegen::placement {

namespace {

constexpr size_t TOP_CANDIDATES = 20;

}  // namespace

GoalPlacer::GoalPlacer(const analysis::ReachabilityAnalyzer& analyzer, const GoalPlacerConfig& config)
    : analyzer_(analyzer), config_(config) {
    if (std::isnan(config_.min_distance) || config_.min_distance < 0.0) {
        throw std::invalid_argument(fmt::format("min_distance must be non-negative, got {}", config_.min_distance));
    }
    if (config_.max_attempts <= 0) {
        throw std::invalid_argument(fmt::format("max_attempts must be positive, got {}", config_.max_attempts));
    }
    if (config_.visibility_radius <= 0) {
        throw std::invalid_argument(
            fmt::format("visibility_radius must be positive, got {}", config_.visibility_radius));
    }
    if (config_.right_side_boundary &&
        (*config_.right_side_boundary < 0.0 || *config_.right_side_boundary > 1.0)) {
        throw std::invalid_argument(
            fmt::format("right_side_boundary must be within [0, 1], got {}", *config_.right_side_boundary));
    }
}

bool GoalPlacer::validate(const level::Grid& grid, const Point& p) const {
    return grid.has_footing(p);
}

bool GoalPlacer::is_valid_goal(const level::Grid& grid, const Point& spawn, const Point& p,
                               bool apply_boundary) const {
    if (!grid.has_footing(p) || p == spawn) {
        return false;
    }
    if (level::euclidean_distance(p, spawn) < config_.min_distance) {
        return false;
    }
    if (apply_boundary && config_.right_side_boundary) {
        const auto min_x = static_cast<int32_t>(std::floor(static_cast<double>(grid.width()) *
                                                           *config_.right_side_boundary));
        if (p.x < min_x) {
            return false;
        }
    }
    return true;
}

std::vector<Point> GoalPlacer::find_valid_positions(const level::Grid& grid, const Point& spawn,
                                                    bool apply_boundary) const {
    std::vector<Point> positions;
    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            const Point p(x, y);
            if (is_valid_goal(grid, spawn, p, apply_boundary)) {
                positions.push_back(p);
            }
        }
    }
    return positions;
}

bool GoalPlacer::is_visible(const level::Grid& grid, const Point& p) const {
    for (int i = 0; i < 4; ++i) {
        bool clear = true;
        for (int32_t r = 1; r <= config_.visibility_radius && clear; ++r) {
            clear = grid.is_floor(p.x + level::CARDINAL_DX[i] * r, p.y + level::CARDINAL_DY[i] * r);
        }
        if (clear) {
            return true;
        }
    }
    return false;
}

GoalPlacement GoalPlacer::describe(const level::Grid& grid, const Point& spawn, const Point& p) const {
    GoalPlacement placement;
    placement.position = p;
    placement.distance = level::euclidean_distance(p, spawn);
    placement.visible = is_visible(grid, p);
    return placement;
}

core::Result<GoalPlacement> GoalPlacer::place_goal(const level::Grid& grid, const Point& spawn) const {
    const std::vector<Point> valid = find_valid_positions(grid, spawn, true);
    if (valid.empty()) {
        return core::Result<GoalPlacement>::fail(fmt::format(
            "No valid goal positions: no footed tile at least {} tiles from spawn", config_.min_distance));
    }

    analysis::ReachabilityOptions walk_only;
    walk_only.allow_jumps = false;
    const analysis::ReachabilityResult walkable = analyzer_.analyze(grid, spawn, walk_only);

    const Point* best = nullptr;
    double best_distance = -1.0;
    for (const auto& p : valid) {
        if (walkable.contains(p)) {
            continue;
        }
        const double distance = level::euclidean_distance(p, spawn);
        if (distance > best_distance) {
            best_distance = distance;
            best = &p;
        }
    }

    if (best == nullptr) {
        return core::Result<GoalPlacement>::fail(
            "No valid goal positions: every candidate is reachable by walking from spawn");
    }

    GoalPlacement placement = describe(grid, spawn, *best);
    placement.unreachable_by_walking = true;
    CAVEGEN_LOG_INFO(core::log_category::PLACEMENT, "Goal placed at ({}, {}), {:.1f} tiles from spawn",
                     placement.position.x, placement.position.y, placement.distance);
    return core::Result<GoalPlacement>::ok(placement);
}

core::Result<GoalPlacement> GoalPlacer::place_goal_after_platforms(const level::Grid& grid, const Point& spawn,
                                                                   core::RandomSource& rng) const {
    const analysis::ReachabilityResult reachable = analyzer_.analyze(grid, spawn);

    auto reachable_candidates = [&](bool apply_boundary) {
        std::vector<Point> candidates = find_valid_positions(grid, spawn, apply_boundary);
        std::erase_if(candidates, [&](const Point& p) { return !reachable.contains(p); });
        return candidates;
    };

    GoalPlacement placement;
    std::vector<Point> candidates = reachable_candidates(true);
    if (candidates.empty() && config_.right_side_boundary) {
        CAVEGEN_LOG_WARN(core::log_category::PLACEMENT,
                         "No reachable goal on the right side, falling back to the whole grid");
        placement.fallback_used = true;
        candidates = reachable_candidates(false);
    }

    if (candidates.empty()) {
        return core::Result<GoalPlacement>::fail(fmt::format(
            "No reachable goal positions at least {} tiles from spawn", config_.min_distance));
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const Point& a, const Point& b) { return a.x > b.x; });
    const size_t pool = std::min({candidates.size(), TOP_CANDIDATES, static_cast<size_t>(config_.max_attempts)});
    const Point chosen = candidates[core::random_index(rng, pool)];

    const bool fallback_used = placement.fallback_used;
    placement = describe(grid, spawn, chosen);
    placement.fallback_used = fallback_used;

    CAVEGEN_LOG_INFO(core::log_category::PLACEMENT, "Goal placed at ({}, {}), {:.1f} tiles from spawn",
                     placement.position.x, placement.position.y, placement.distance);
    return core::Result<GoalPlacement>::ok(placement);
}

core::Result<GoalPlacement> GoalPlacer::place(const PlacementContext& context, core::RandomSource& rng) {
    return place_goal_after_platforms(context.require_grid(), context.require_spawn(), rng);
}

GoalStatistics GoalPlacer::statistics(const level::Grid& grid, const Point& spawn) const {
    GoalStatistics stats;
    const std::vector<Point> valid = find_valid_positions(grid, spawn, true);
    stats.valid_positions = valid.size();

    analysis::ReachabilityOptions walk_only;
    walk_only.allow_jumps = false;
    const analysis::ReachabilityResult walkable = analyzer_.analyze(grid, spawn, walk_only);
    for (const auto& p : valid) {
        if (!walkable.contains(p)) {
            ++stats.unreachable_positions;
        }
        stats.max_distance = std::max(stats.max_distance, level::euclidean_distance(p, spawn));
    }
    return stats;
}

}  // namespace cavegen::placement
