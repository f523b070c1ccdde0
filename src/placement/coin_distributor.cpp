// CaveGen Placement
// coin_distributor.cpp - Category-weighted coin distribution

#include <cavegen/core/logger.hpp>
#include <cavegen/placement/coin_distributor.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace cavegen::placement {

// ============================================================================
// Helpers
// ============================================================================

bool is_dead_end(const level::Grid& grid, const Point& p) {
    return grid.is_floor(p) && level::count_floor_cardinal_neighbors(grid, p.x, p.y) == 1;
}

double exploration_score(const level::Grid& grid, const Point& p) {
    const Point centre(grid.width() / 2, grid.height() / 2);
    const double extent = static_cast<double>(std::max(grid.width(), grid.height()));
    if (extent <= 0.0) {
        return 0.0;
    }
    return std::min(1.0, level::euclidean_distance(p, centre) / extent);
}

std::vector<Point> top_exploration_positions(const level::Grid& grid, const std::vector<Point>& tiles,
                                             size_t min_count) {
    std::vector<Point> ranked = tiles;
    std::stable_sort(ranked.begin(), ranked.end(), [&](const Point& a, const Point& b) {
        return exploration_score(grid, a) > exploration_score(grid, b);
    });
    const size_t keep = std::min(ranked.size(), std::max(min_count, ranked.size() / 4));
    ranked.resize(keep);
    return ranked;
}

size_t place_from_candidates(std::vector<Point> candidates, size_t target, CoinCategory category, double min_distance,
                             std::vector<Coin>& coins, level::PointSet& used, core::RandomSource& rng) {
    core::shuffle(rng, candidates);

    size_t added = 0;
    for (const auto& p : candidates) {
        if (added >= target) {
            break;
        }
        if (used.count(p) != 0) {
            continue;
        }
        const bool spaced = std::all_of(coins.begin(), coins.end(), [&](const Coin& coin) {
            return level::euclidean_distance(coin.position, p) >= min_distance;
        });
        if (!spaced) {
            continue;
        }
        coins.push_back({p, category});
        used.insert(p);
        ++added;
    }
    return added;
}

CoinMetrics compute_coin_metrics(const std::vector<Coin>& coins, const level::Grid& grid, const Point& spawn) {
    CoinMetrics metrics;
    metrics.total = coins.size();
    if (coins.empty()) {
        return metrics;
    }

    bool sectors[3][3] = {};
    double distance_sum = 0.0;
    for (const auto& coin : coins) {
        switch (coin.category) {
            case CoinCategory::DeadEnd:
                ++metrics.dead_end;
                break;
            case CoinCategory::Exploration:
                ++metrics.exploration;
                break;
            case CoinCategory::Unreachable:
                ++metrics.unreachable;
                break;
            case CoinCategory::General:
                ++metrics.general;
                break;
        }
        distance_sum += level::euclidean_distance(coin.position, spawn);

        const int32_t sx = std::min(2, coin.position.x * 3 / std::max(1, grid.width()));
        const int32_t sy = std::min(2, coin.position.y * 3 / std::max(1, grid.height()));
        sectors[sy][sx] = true;
    }

    int covered = 0;
    for (const auto& row : sectors) {
        for (bool hit : row) {
            covered += hit ? 1 : 0;
        }
    }
    metrics.average_distance_to_spawn = distance_sum / static_cast<double>(coins.size());
    metrics.coverage = static_cast<double>(covered) / 9.0;
    return metrics;
}

// ============================================================================
// CoinDistributor
// ============================================================================

CoinDistributor::CoinDistributor(const analysis::ReachabilityAnalyzer& analyzer, const CoinDistributorConfig& config)
    : analyzer_(analyzer), config_(config) {
    if (config_.coin_count <= 0) {
        throw std::invalid_argument(fmt::format("coin_count must be positive, got {}", config_.coin_count));
    }
    for (double weight : {config_.dead_end_weight, config_.exploration_weight, config_.unreachable_weight}) {
        if (weight < 0.0 || weight > 1.0) {
            throw std::invalid_argument(fmt::format("Coin weights must be within [0, 1], got {}", weight));
        }
    }
    const double total = config_.dead_end_weight + config_.exploration_weight + config_.unreachable_weight;
    if (std::abs(total - 1.0) > 0.001) {
        throw std::invalid_argument(fmt::format("Coin weights must sum to 1.0, got {}", total));
    }
    if (config_.min_distance < 0.0) {
        throw std::invalid_argument(fmt::format("min_distance must be non-negative, got {}", config_.min_distance));
    }
}

bool CoinDistributor::validate(const level::Grid& grid, const Point& p) const {
    return grid.is_floor(p);
}

std::vector<Point> CoinDistributor::detect_dead_ends(const level::Grid& grid) const {
    std::vector<Point> dead_ends;
    for (const auto& p : grid.floor_cells()) {
        if (is_dead_end(grid, p)) {
            dead_ends.push_back(p);
        }
    }
    return dead_ends;
}

std::vector<Point> CoinDistributor::identify_unreachable(const level::Grid& grid, const Point& spawn) const {
    const analysis::ReachabilityResult reachable = analyzer_.analyze(grid, spawn);
    std::vector<Point> unreachable;
    for (const auto& p : grid.floor_cells()) {
        if (!reachable.contains(p)) {
            unreachable.push_back(p);
        }
    }
    return unreachable;
}

core::Result<CoinDistribution> CoinDistributor::distribute(const level::Grid& grid, const Point& spawn,
                                                           core::RandomSource& rng) const {
    const std::vector<Point> floor = grid.floor_cells();
    if (floor.empty()) {
        return core::Result<CoinDistribution>::fail("No floor tiles available for coins");
    }

    const auto n = static_cast<size_t>(config_.coin_count);
    const auto dead_end_target = static_cast<size_t>(std::floor(static_cast<double>(n) * config_.dead_end_weight));
    const auto exploration_target =
        static_cast<size_t>(std::floor(static_cast<double>(n) * config_.exploration_weight));
    const size_t unreachable_target = n - dead_end_target - exploration_target;

    CoinDistribution distribution;
    level::PointSet used{spawn};

    place_from_candidates(detect_dead_ends(grid), dead_end_target, CoinCategory::DeadEnd, config_.min_distance,
                          distribution.coins, used, rng);
    place_from_candidates(top_exploration_positions(grid, floor, exploration_target), exploration_target,
                          CoinCategory::Exploration, config_.min_distance, distribution.coins, used, rng);
    place_from_candidates(identify_unreachable(grid, spawn), unreachable_target, CoinCategory::Unreachable,
                          config_.min_distance, distribution.coins, used, rng);

    distribution.metrics = compute_coin_metrics(distribution.coins, grid, spawn);
    if (distribution.coins.size() < n) {
        CAVEGEN_LOG_WARN(core::log_category::PLACEMENT, "Distributed {} of {} coins", distribution.coins.size(), n);
    } else {
        CAVEGEN_LOG_DEBUG(core::log_category::PLACEMENT, "Distributed {} coins ({} dead end, {} exploration, {} unreachable)",
                          distribution.coins.size(), distribution.metrics.dead_end, distribution.metrics.exploration,
                          distribution.metrics.unreachable);
    }
    return core::Result<CoinDistribution>::ok(std::move(distribution));
}

core::Result<CoinDistribution> CoinDistributor::place(const PlacementContext& context, core::RandomSource& rng) {
    return distribute(context.require_grid(), context.require_spawn(), rng);
}

}  // namespace cavegen::placement
