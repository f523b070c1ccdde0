// CaveGen Placement
// enemy_placement_analyzer.hpp - Candidate enemy positions by tactical role

#pragma once

#include "types.hpp"

#include <cavegen/analysis/reachability_analyzer.hpp>
#include <cavegen/level/grid.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace cavegen::placement {

struct EnemyAnalyzerConfig {
    int32_t min_patrol_length = 5;
    int32_t max_patrol_length = 20;
    double coin_strategic_distance = 5.0;
    double goal_strategic_distance = 8.0;
};

struct EnemyCandidate {
    Point position{0, 0};
    EnemyPlacementType type = EnemyPlacementType::Patrol;
};

// Horizontal run of footed floor
struct PatrolArea {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;

    [[nodiscard]] Point centre() const { return {x + width / 2, y}; }
};

struct EnemyPlacementStatistics {
    size_t choke_points = 0;
    size_t patrol_areas = 0;
    size_t strategic_positions = 0;
    size_t platform_positions = 0;
    size_t candidates = 0;
};

class EnemyPlacementAnalyzer {
public:
    explicit EnemyPlacementAnalyzer(const EnemyAnalyzerConfig& config = {});

    /// Interior floor tiles with a wall directly above and below
    [[nodiscard]] std::vector<Point> detect_choke_points(const level::Grid& grid) const;

    /// Footed floor runs whose length is within [min_patrol_length, max_patrol_length]
    [[nodiscard]] std::vector<PatrolArea> identify_patrol_areas(const level::Grid& grid) const;

    /// Floor within coin_strategic_distance of a coin or goal_strategic_distance of the goal
    [[nodiscard]] std::vector<Point> analyze_strategic_positions(const level::Grid& grid,
                                                                 const std::vector<Coin>& coins,
                                                                 const std::optional<Point>& goal) const;

    /// Floor tiles standing on top of a platform
    [[nodiscard]] std::vector<Point> analyze_platform_tops(const level::Grid& grid,
                                                           const std::vector<Platform>& platforms) const;

    /// All sources merged, restricted to reachable tiles when a reachability result is given,
    /// deduplicated keeping the highest priority, highest priority first then row-major
    [[nodiscard]] std::vector<EnemyCandidate> generate_candidates(
        const level::Grid& grid, const std::vector<Coin>& coins, const std::optional<Point>& goal,
        const std::vector<Platform>& platforms, const analysis::ReachabilityResult* reachability = nullptr) const;

    [[nodiscard]] EnemyPlacementStatistics statistics(const level::Grid& grid, const std::vector<Coin>& coins,
                                                      const std::optional<Point>& goal,
                                                      const std::vector<Platform>& platforms) const;

    [[nodiscard]] const EnemyAnalyzerConfig& get_config() const { return config_; }

private:
    EnemyAnalyzerConfig config_;
};

}  // namespace cavegen::placement
