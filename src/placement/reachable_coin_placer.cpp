// CaveGen Placement
// reachable_coin_placer.cpp - Coins restricted to tiles the player can reach

#include <cavegen/core/logger.hpp>
#include <cavegen/placement/reachable_coin_placer.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace cavegen::placement {

ReachableCoinPlacer::ReachableCoinPlacer(const analysis::ReachabilityAnalyzer& analyzer,
                                         const ReachableCoinPlacerConfig& config)
    : analyzer_(analyzer), config_(config) {
    if (config_.coin_count <= 0) {
        throw std::invalid_argument(fmt::format("coin_count must be positive, got {}", config_.coin_count));
    }
    for (double weight : {config_.dead_end_weight, config_.exploration_weight, config_.general_weight}) {
        if (weight < 0.0 || weight > 1.0) {
            throw std::invalid_argument(fmt::format("Coin weights must be within [0, 1], got {}", weight));
        }
    }
    const double total = config_.dead_end_weight + config_.exploration_weight + config_.general_weight;
    if (std::abs(total - 1.0) > 0.001) {
        throw std::invalid_argument(fmt::format("Coin weights must sum to 1.0, got {}", total));
    }
    if (config_.min_reachable_ratio < 0.0 || config_.min_reachable_ratio > 1.0) {
        throw std::invalid_argument(
            fmt::format("min_reachable_ratio must be within [0, 1], got {}", config_.min_reachable_ratio));
    }
}

bool ReachableCoinPlacer::validate(const level::Grid& grid, const Point& p) const {
    if (!grid.is_floor(p)) {
        return false;
    }
    for (int32_t dy = -1; dy <= 1; ++dy) {
        for (int32_t dx = -1; dx <= 1; ++dx) {
            if ((dx != 0 || dy != 0) && !grid.is_floor(p.x + dx, p.y + dy)) {
                return false;
            }
        }
    }
    return true;
}

core::Result<CoinDistribution> ReachableCoinPlacer::place_coins(const level::Grid& grid, const Point& spawn,
                                                                const std::vector<Platform>& platforms,
                                                                core::RandomSource& rng,
                                                                const std::optional<Point>& goal) const {
    const analysis::ReachabilityResult reachable = analyzer_.analyze(grid, spawn);
    const double ratio = analysis::ReachabilityAnalyzer::reachability_ratio(grid, reachable);
    if (ratio < config_.min_reachable_ratio) {
        auto message = fmt::format("Reachable area too low: only {:.2f}% of floor is reachable from spawn "
                                   "(expected at least {:.0f}%)",
                                   ratio * 100.0, config_.min_reachable_ratio * 100.0);
        CAVEGEN_LOG_WARN(core::log_category::PLACEMENT, "{}", message);
        return core::Result<CoinDistribution>::fail(std::move(message));
    }

    auto on_platform = [&](const Point& p) {
        return std::any_of(platforms.begin(), platforms.end(), [&](const Platform& pl) { return pl.covers(p); });
    };

    auto near_goal = [&](const Point& p) {
        return goal && level::euclidean_distance(p, *goal) < config_.min_distance;
    };

    std::vector<Point> dead_ends;
    std::vector<Point> open;
    for (const auto& p : reachable.order) {
        if (p == spawn || !grid.is_floor(p) || on_platform(p) || near_goal(p)) {
            continue;
        }
        if (is_dead_end(grid, p)) {
            dead_ends.push_back(p);
        } else if (validate(grid, p)) {
            open.push_back(p);
        }
    }
    // Candidate lists are row-major so the shuffle alone decides the draw
    auto row_major = [](const Point& a, const Point& b) { return a.y != b.y ? a.y < b.y : a.x < b.x; };
    std::sort(dead_ends.begin(), dead_ends.end(), row_major);
    std::sort(open.begin(), open.end(), row_major);

    const size_t valid_count = dead_ends.size() + open.size();
    const size_t total_target = std::min(static_cast<size_t>(config_.coin_count), valid_count);
    const auto dead_end_target =
        static_cast<size_t>(std::floor(static_cast<double>(total_target) * config_.dead_end_weight));
    const auto exploration_target =
        static_cast<size_t>(std::floor(static_cast<double>(total_target) * config_.exploration_weight));
    const size_t general_target = total_target - dead_end_target - exploration_target;

    std::vector<Point> exploration = top_exploration_positions(grid, open, exploration_target);
    const level::PointSet exploration_set(exploration.begin(), exploration.end());
    std::vector<Point> general;
    for (const auto& p : open) {
        if (exploration_set.count(p) == 0) {
            general.push_back(p);
        }
    }

    CoinDistribution distribution;
    level::PointSet used{spawn};
    if (goal) {
        used.insert(*goal);
    }
    place_from_candidates(dead_ends, dead_end_target, CoinCategory::DeadEnd, config_.min_distance,
                          distribution.coins, used, rng);
    place_from_candidates(exploration, exploration_target, CoinCategory::Exploration, config_.min_distance,
                          distribution.coins, used, rng);
    place_from_candidates(general, general_target, CoinCategory::General, config_.min_distance, distribution.coins,
                          used, rng);

    // Top up from every remaining candidate when a category ran short
    if (distribution.coins.size() < total_target) {
        std::vector<Point> remaining = dead_ends;
        remaining.insert(remaining.end(), open.begin(), open.end());
        place_from_candidates(std::move(remaining), total_target - distribution.coins.size(), CoinCategory::General,
                              config_.min_distance, distribution.coins, used, rng);
    }

    distribution.metrics = compute_coin_metrics(distribution.coins, grid, spawn);
    if (distribution.coins.size() < static_cast<size_t>(config_.coin_count)) {
        CAVEGEN_LOG_WARN(core::log_category::PLACEMENT, "Placed {} of {} reachable coins", distribution.coins.size(),
                         config_.coin_count);
    } else {
        CAVEGEN_LOG_INFO(core::log_category::PLACEMENT, "Placed {} reachable coins (reachable ratio {:.2f})",
                         distribution.coins.size(), ratio);
    }
    return core::Result<CoinDistribution>::ok(std::move(distribution));
}

core::Result<CoinDistribution> ReachableCoinPlacer::place(const PlacementContext& context, core::RandomSource& rng) {
    return place_coins(context.require_grid(), context.require_spawn(), context.platforms, rng, context.goal);
}

}  // namespace cavegen::placement
