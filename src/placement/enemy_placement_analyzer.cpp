// CaveGen Placement
// enemy_placement_analyzer.cpp - Candidate enemy positions by tactical role

#include <cavegen/core/logger.hpp>
#include <cavegen/placement/enemy_placement_analyzer.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cavegen::placement {

EnemyPlacementAnalyzer::EnemyPlacementAnalyzer(const EnemyAnalyzerConfig& config) : config_(config) {
    if (config_.min_patrol_length <= 0 || config_.max_patrol_length < config_.min_patrol_length) {
        throw std::invalid_argument(fmt::format("Invalid patrol length range [{}, {}]", config_.min_patrol_length,
                                                config_.max_patrol_length));
    }
    if (config_.coin_strategic_distance < 0.0 || config_.goal_strategic_distance < 0.0) {
        throw std::invalid_argument("Strategic distances must be non-negative");
    }
}

std::vector<Point> EnemyPlacementAnalyzer::detect_choke_points(const level::Grid& grid) const {
    std::vector<Point> choke_points;
    for (int32_t y = 1; y < grid.height() - 1; ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            if (grid.get(x, y) == level::FLOOR && grid.get(x, y - 1) == level::WALL &&
                grid.get(x, y + 1) == level::WALL) {
                choke_points.emplace_back(x, y);
            }
        }
    }
    return choke_points;
}

std::vector<PatrolArea> EnemyPlacementAnalyzer::identify_patrol_areas(const level::Grid& grid) const {
    std::vector<PatrolArea> areas;
    auto close_run = [&](int32_t start, int32_t length, int32_t y) {
        if (length >= config_.min_patrol_length && length <= config_.max_patrol_length) {
            areas.push_back({start, y, length});
        }
    };

    for (int32_t y = 0; y < grid.height(); ++y) {
        int32_t run_start = -1;
        int32_t run_length = 0;
        for (int32_t x = 0; x < grid.width(); ++x) {
            if (grid.has_footing(x, y)) {
                if (run_start < 0) {
                    run_start = x;
                }
                ++run_length;
            } else {
                close_run(run_start, run_length, y);
                run_start = -1;
                run_length = 0;
            }
        }
        close_run(run_start, run_length, y);
    }
    return areas;
}

std::vector<Point> EnemyPlacementAnalyzer::analyze_strategic_positions(const level::Grid& grid,
                                                                       const std::vector<Coin>& coins,
                                                                       const std::optional<Point>& goal) const {
    std::vector<Point> positions;
    auto collect_around = [&](const Point& centre, double radius) {
        const auto r = static_cast<int32_t>(std::floor(radius));
        for (int32_t y = std::max(0, centre.y - r); y <= std::min(grid.height() - 1, centre.y + r); ++y) {
            for (int32_t x = std::max(0, centre.x - r); x <= std::min(grid.width() - 1, centre.x + r); ++x) {
                const Point p(x, y);
                if (grid.get(p) == level::FLOOR && level::euclidean_distance(p, centre) <= radius) {
                    positions.push_back(p);
                }
            }
        }
    };

    for (const auto& coin : coins) {
        collect_around(coin.position, config_.coin_strategic_distance);
    }
    if (goal) {
        collect_around(*goal, config_.goal_strategic_distance);
    }
    return positions;
}

std::vector<Point> EnemyPlacementAnalyzer::analyze_platform_tops(const level::Grid& grid,
                                                                 const std::vector<Platform>& platforms) const {
    std::vector<Point> tops;
    for (const auto& platform : platforms) {
        for (const auto& tile : platform.occupied_tiles()) {
            const Point above(tile.x, tile.y - 1);
            if (grid.is_floor(above)) {
                tops.push_back(above);
            }
        }
    }
    return tops;
}

std::vector<EnemyCandidate> EnemyPlacementAnalyzer::generate_candidates(
    const level::Grid& grid, const std::vector<Coin>& coins, const std::optional<Point>& goal,
    const std::vector<Platform>& platforms, const analysis::ReachabilityResult* reachability) const {
    level::PointMap<EnemyPlacementType> best;
    auto offer = [&](const Point& p, EnemyPlacementType type) {
        if (reachability != nullptr && !reachability->contains(p)) {
            return;
        }
        auto it = best.find(p);
        if (it == best.end()) {
            best.emplace(p, type);
        } else if (placement_priority(type) > placement_priority(it->second)) {
            it->second = type;
        }
    };

    for (const auto& p : detect_choke_points(grid)) {
        offer(p, EnemyPlacementType::ChokePoint);
    }
    for (const auto& area : identify_patrol_areas(grid)) {
        offer(area.centre(), EnemyPlacementType::Patrol);
    }
    for (const auto& p : analyze_strategic_positions(grid, coins, goal)) {
        offer(p, EnemyPlacementType::Strategic);
    }
    for (const auto& p : analyze_platform_tops(grid, platforms)) {
        offer(p, EnemyPlacementType::Platform);
    }

    std::vector<EnemyCandidate> candidates;
    candidates.reserve(best.size());
    for (const auto& [position, type] : best) {
        candidates.push_back({position, type});
    }
    std::sort(candidates.begin(), candidates.end(), [](const EnemyCandidate& a, const EnemyCandidate& b) {
        const int32_t pa = placement_priority(a.type);
        const int32_t pb = placement_priority(b.type);
        if (pa != pb) {
            return pa > pb;
        }
        if (a.position.y != b.position.y) {
            return a.position.y < b.position.y;
        }
        return a.position.x < b.position.x;
    });

    CAVEGEN_LOG_DEBUG(core::log_category::PLACEMENT, "{} enemy placement candidates", candidates.size());
    return candidates;
}

EnemyPlacementStatistics EnemyPlacementAnalyzer::statistics(const level::Grid& grid, const std::vector<Coin>& coins,
                                                            const std::optional<Point>& goal,
                                                            const std::vector<Platform>& platforms) const {
    EnemyPlacementStatistics stats;
    stats.choke_points = detect_choke_points(grid).size();
    stats.patrol_areas = identify_patrol_areas(grid).size();
    stats.strategic_positions = analyze_strategic_positions(grid, coins, goal).size();
    stats.platform_positions = analyze_platform_tops(grid, platforms).size();
    stats.candidates = generate_candidates(grid, coins, goal, platforms).size();
    return stats;
}

}  // namespace cavegen::placement
