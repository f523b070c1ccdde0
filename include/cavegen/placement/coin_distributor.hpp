// CaveGen Placement
// coin_distributor.hpp - Category-weighted coin distribution

#pragma once

#include "placer.hpp"

#include <cavegen/analysis/reachability_analyzer.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cavegen::placement {

// ============================================================================
// Coin Metrics
// ============================================================================

struct CoinMetrics {
    size_t total = 0;
    size_t dead_end = 0;
    size_t exploration = 0;
    size_t unreachable = 0;
    size_t general = 0;
    double average_distance_to_spawn = 0.0;
    double coverage = 0.0;  // Fraction of the 3x3 grid sectors holding a coin
};

[[nodiscard]] CoinMetrics compute_coin_metrics(const std::vector<Coin>& coins, const level::Grid& grid,
                                               const Point& spawn);

// ============================================================================
// Candidate Helpers
// ============================================================================

/// Floor tile with exactly one floor 4-neighbour
[[nodiscard]] bool is_dead_end(const level::Grid& grid, const Point& p);

/// Distance to the grid centre over max(width, height), capped at 1
[[nodiscard]] double exploration_score(const level::Grid& grid, const Point& p);

/// The highest-scoring quarter of the given tiles (at least min_count), best first
[[nodiscard]] std::vector<Point> top_exploration_positions(const level::Grid& grid, const std::vector<Point>& tiles,
                                                           size_t min_count);

/// Shuffle candidates and append coins at least min_distance from every placed coin
/// until target more coins have been added. Returns the number added.
size_t place_from_candidates(std::vector<Point> candidates, size_t target, CoinCategory category, double min_distance,
                             std::vector<Coin>& coins, level::PointSet& used, core::RandomSource& rng);

// ============================================================================
// Coin Distributor
// ============================================================================

struct CoinDistributorConfig {
    int32_t coin_count = 10;
    double dead_end_weight = 0.4;
    double exploration_weight = 0.3;
    double unreachable_weight = 0.3;
    double min_distance = 2.0;
};

struct CoinDistribution {
    std::vector<Coin> coins;
    CoinMetrics metrics;
};

class CoinDistributor final : public Placer<CoinDistribution> {
public:
    /// Weights must each lie in [0, 1] and sum to 1 within 0.001
    CoinDistributor(const analysis::ReachabilityAnalyzer& analyzer, const CoinDistributorConfig& config = {});

    [[nodiscard]] bool validate(const level::Grid& grid, const Point& p) const override;

    [[nodiscard]] core::Result<CoinDistribution> distribute(const level::Grid& grid, const Point& spawn,
                                                            core::RandomSource& rng) const;

    [[nodiscard]] core::Result<CoinDistribution> place(const PlacementContext& context,
                                                       core::RandomSource& rng) override;

    [[nodiscard]] std::vector<Point> detect_dead_ends(const level::Grid& grid) const;
    [[nodiscard]] std::vector<Point> identify_unreachable(const level::Grid& grid, const Point& spawn) const;

    [[nodiscard]] const CoinDistributorConfig& get_config() const { return config_; }

private:
    const analysis::ReachabilityAnalyzer& analyzer_;
    CoinDistributorConfig config_;
};

}  // namespace cavegen::placement
