// CaveGen Placement
// reachable_coin_placer.hpp - Coins restricted to tiles the player can reach

#pragma once

#include "coin_distributor.hpp"
#include "placer.hpp"

#include <cavegen/analysis/reachability_analyzer.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace cavegen::placement {

struct ReachableCoinPlacerConfig {
    int32_t coin_count = 10;
    double dead_end_weight = 0.4;
    double exploration_weight = 0.3;
    double general_weight = 0.3;
    double min_distance = 2.0;
    double min_reachable_ratio = 0.6;  // Reachable floor over all floor
};

class ReachableCoinPlacer final : public Placer<CoinDistribution> {
public:
    ReachableCoinPlacer(const analysis::ReachabilityAnalyzer& analyzer, const ReachableCoinPlacerConfig& config = {});

    /// Open tile: all 8 neighbours are in-bounds floor
    [[nodiscard]] bool validate(const level::Grid& grid, const Point& p) const override;

    /// Fails when the reachable ratio is below min_reachable_ratio. Coins keep
    /// min_distance from the goal when one is given.
    [[nodiscard]] core::Result<CoinDistribution> place_coins(const level::Grid& grid, const Point& spawn,
                                                             const std::vector<Platform>& platforms,
                                                             core::RandomSource& rng,
                                                             const std::optional<Point>& goal = std::nullopt) const;

    [[nodiscard]] core::Result<CoinDistribution> place(const PlacementContext& context,
                                                       core::RandomSource& rng) override;

    [[nodiscard]] const ReachableCoinPlacerConfig& get_config() const { return config_; }

private:
    const analysis::ReachabilityAnalyzer& analyzer_;
    ReachableCoinPlacerConfig config_;
};

}  // namespace cavegen::placement
