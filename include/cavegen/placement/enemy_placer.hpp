// CaveGen Placement
// enemy_placer.hpp - Zone-balanced enemy placement that keeps the level solvable

#pragma once

#include "enemy_placement_analyzer.hpp"
#include "placer.hpp"

#include <cavegen/analysis/reachability_analyzer.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace cavegen::placement {

struct EnemyPlacerConfig {
    int32_t max_enemies = 10;
    double enemy_density = 0.1;  // Enemies per tile, capped by max_enemies
    double min_distance_from_spawn = 5.0;
    double min_distance_from_goal = 3.0;
    bool preserve_solvability = true;
    int32_t max_attempts = 1000;
};

struct EnemyPlacementResult {
    std::vector<Enemy> enemies;
    size_t target_count = 0;
    size_t candidates_considered = 0;
    size_t rejected_for_solvability = 0;
};

// Candidates are split into three horizontal zones between spawn and goal and
// drawn round-robin so enemies spread across the level. With solvability
// preserved, every enemy tile is treated as blocked and the goal, every coin and
// all but the blocked tiles of the baseline reachable area must stay reachable.
class EnemyPlacer final : public Placer<EnemyPlacementResult> {
public:
    static constexpr int32_t ZONE_COUNT = 3;

    EnemyPlacer(const analysis::ReachabilityAnalyzer& analyzer, const EnemyPlacerConfig& config = {},
                const EnemyAnalyzerConfig& analyzer_config = {});

    /// In-bounds floor tile
    [[nodiscard]] bool validate(const level::Grid& grid, const Point& p) const override;

    [[nodiscard]] core::Result<EnemyPlacementResult> place_enemies(const level::Grid& grid, const Point& spawn,
                                                                   const std::vector<Coin>& coins,
                                                                   const std::optional<Point>& goal,
                                                                   const std::vector<Platform>& platforms,
                                                                   core::RandomSource& rng) const;

    [[nodiscard]] core::Result<EnemyPlacementResult> place(const PlacementContext& context,
                                                           core::RandomSource& rng) override;

    /// min(max_enemies, floor(width * height * enemy_density))
    [[nodiscard]] size_t target_count(const level::Grid& grid) const;

    /// Zone index in [0, ZONE_COUNT) of x across the spawn-to-goal span
    [[nodiscard]] static int32_t zone_of(int32_t x, int32_t level_width);

    [[nodiscard]] static Enemy make_enemy(const Point& position, EnemyPlacementType placement,
                                          core::RandomSource& rng);

    [[nodiscard]] const EnemyPlacementAnalyzer& placement_analyzer() const { return placement_analyzer_; }
    [[nodiscard]] const EnemyPlacerConfig& get_config() const { return config_; }

private:
    [[nodiscard]] bool keeps_solvable(const level::Grid& grid, const Point& spawn, const std::vector<Coin>& coins,
                                      const std::optional<Point>& goal, const level::PointSet& blocked,
                                      size_t baseline) const;

    const analysis::ReachabilityAnalyzer& analyzer_;
    EnemyPlacementAnalyzer placement_analyzer_;
    EnemyPlacerConfig config_;
};

}  // namespace cavegen::placement
