// CaveGen Placement
// enemy_placer.cpp - Zone-balanced enemy placement that keeps the level solvable

#include <cavegen/core/logger.hpp>
#include <cavegen/placement/enemy_placer.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace cavegen::placement {

EnemyPlacer::EnemyPlacer(const analysis::ReachabilityAnalyzer& analyzer, const EnemyPlacerConfig& config,
                         const EnemyAnalyzerConfig& analyzer_config)
    : analyzer_(analyzer), placement_analyzer_(analyzer_config), config_(config) {
    if (config_.max_enemies < 0) {
        throw std::invalid_argument(fmt::format("max_enemies must be non-negative, got {}", config_.max_enemies));
    }
    if (config_.enemy_density < 0.0 || config_.enemy_density > 1.0) {
        throw std::invalid_argument(fmt::format("enemy_density must be within [0, 1], got {}", config_.enemy_density));
    }
    if (config_.min_distance_from_spawn < 0.0 || config_.min_distance_from_goal < 0.0) {
        throw std::invalid_argument("Enemy distance limits must be non-negative");
    }
    if (config_.max_attempts <= 0) {
        throw std::invalid_argument(fmt::format("max_attempts must be positive, got {}", config_.max_attempts));
    }
}

bool EnemyPlacer::validate(const level::Grid& grid, const Point& p) const {
    return grid.is_floor(p);
}

size_t EnemyPlacer::target_count(const level::Grid& grid) const {
    const auto by_density = static_cast<size_t>(std::floor(static_cast<double>(grid.size()) * config_.enemy_density));
    return std::min(static_cast<size_t>(config_.max_enemies), by_density);
}

int32_t EnemyPlacer::zone_of(int32_t x, int32_t level_width) {
    if (level_width <= 0) {
        return 0;
    }
    const auto zone = static_cast<int32_t>(std::floor(static_cast<double>(x) / level_width * ZONE_COUNT));
    return std::clamp(zone, 0, ZONE_COUNT - 1);
}

Enemy EnemyPlacer::make_enemy(const Point& position, EnemyPlacementType placement, core::RandomSource& rng) {
    Enemy enemy;
    enemy.position = position;
    enemy.type = DEFAULT_ENEMY_TYPE;
    enemy.patrol_distance = static_cast<int32_t>(std::floor(rng.next_uniform() * 450.0)) + 50;
    enemy.direction = rng.next_uniform() > 0.5 ? 1 : -1;
    enemy.speed = static_cast<int32_t>(std::floor(rng.next_uniform() * 190.0)) + 10;
    enemy.placement = placement;
    return enemy;
}

bool EnemyPlacer::keeps_solvable(const level::Grid& grid, const Point& spawn, const std::vector<Coin>& coins,
                                 const std::optional<Point>& goal, const level::PointSet& blocked,
                                 size_t baseline) const {
    analysis::ReachabilityOptions options;
    options.blocked = &blocked;
    const analysis::ReachabilityResult reach = analyzer_.analyze(grid, spawn, options);

    if (goal && !reach.contains(*goal)) {
        return false;
    }
    for (const auto& coin : coins) {
        if (!reach.contains(coin.position)) {
            return false;
        }
    }
    return reach.count() + blocked.size() >= baseline;
}

core::Result<EnemyPlacementResult> EnemyPlacer::place_enemies(const level::Grid& grid, const Point& spawn,
                                                              const std::vector<Coin>& coins,
                                                              const std::optional<Point>& goal,
                                                              const std::vector<Platform>& platforms,
                                                              core::RandomSource& rng) const {
    if (!grid.is_floor(spawn)) {
        throw std::invalid_argument(fmt::format("Spawn ({}, {}) is not a floor tile", spawn.x, spawn.y));
    }

    EnemyPlacementResult result;
    result.target_count = target_count(grid);

    const analysis::ReachabilityResult baseline = analyzer_.analyze(grid, spawn);
    std::vector<EnemyCandidate> candidates =
        placement_analyzer_.generate_candidates(grid, coins, goal, platforms, &baseline);
    result.candidates_considered = candidates.size();

    if (result.target_count == 0 || candidates.empty()) {
        CAVEGEN_LOG_DEBUG(core::log_category::PLACEMENT, "No enemies to place (target {}, {} candidates)",
                          result.target_count, candidates.size());
        return core::Result<EnemyPlacementResult>::ok(std::move(result));
    }

    const int32_t level_width = goal ? std::max(goal->x, spawn.x) : grid.width() - 1;
    std::array<std::vector<EnemyCandidate>, ZONE_COUNT> zones;
    for (const auto& candidate : candidates) {
        zones[static_cast<size_t>(zone_of(candidate.position.x, level_width))].push_back(candidate);
    }
    std::array<size_t, ZONE_COUNT> cursor{};

    level::PointSet blocked;
    auto far_enough = [&](const Point& p) {
        if (level::euclidean_distance(p, spawn) < config_.min_distance_from_spawn) {
            return false;
        }
        return !goal || level::euclidean_distance(p, *goal) >= config_.min_distance_from_goal;
    };

    int32_t attempts = 0;
    size_t zone = 0;
    while (result.enemies.size() < result.target_count && attempts < config_.max_attempts) {
        ++attempts;

        bool any_left = false;
        for (size_t z = 0; z < zones.size(); ++z) {
            any_left = any_left || cursor[z] < zones[z].size();
        }
        if (!any_left) {
            break;
        }

        const size_t current = zone;
        zone = (zone + 1) % zones.size();
        if (cursor[current] >= zones[current].size()) {
            continue;
        }

        // Walk this zone's list until one candidate is accepted or the zone runs dry
        while (cursor[current] < zones[current].size()) {
            const EnemyCandidate& candidate = zones[current][cursor[current]++];
            if (!far_enough(candidate.position) || blocked.count(candidate.position) != 0) {
                continue;
            }
            if (config_.preserve_solvability) {
                level::PointSet trial = blocked;
                trial.insert(candidate.position);
                if (!keeps_solvable(grid, spawn, coins, goal, trial, baseline.count())) {
                    ++result.rejected_for_solvability;
                    continue;
                }
            }
            blocked.insert(candidate.position);
            result.enemies.push_back(make_enemy(candidate.position, candidate.type, rng));
            break;
        }
    }

    if (result.enemies.size() < result.target_count) {
        CAVEGEN_LOG_WARN(core::log_category::PLACEMENT, "Placed {} of {} enemies ({} candidates, {} unsafe)",
                         result.enemies.size(), result.target_count, result.candidates_considered,
                         result.rejected_for_solvability);
    } else {
        CAVEGEN_LOG_INFO(core::log_category::PLACEMENT, "Placed {} enemies", result.enemies.size());
    }
    return core::Result<EnemyPlacementResult>::ok(std::move(result));
}

core::Result<EnemyPlacementResult> EnemyPlacer::place(const PlacementContext& context, core::RandomSource& rng) {
    return place_enemies(context.require_grid(), context.require_spawn(), context.coins, context.goal,
                         context.platforms, rng);
}

}  // namespace cavegen::placement
