// CaveGen Placement
// goal_placer.hpp - Level goal placement before and after platform augmentation

#pragma once

#include "placer.hpp"

#include <cavegen/analysis/reachability_analyzer.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace cavegen::placement {

struct GoalPlacerConfig {
    double min_distance = 10.0;  // Euclidean tiles from spawn
    int32_t max_attempts = 100;
    int32_t visibility_radius = 3;
    std::optional<double> right_side_boundary;  // Restrict to x >= floor(width * boundary)
};

struct GoalPlacement {
    Point position{0, 0};
    double distance = 0.0;
    bool unreachable_by_walking = false;
    bool visible = false;
    bool fallback_used = false;  // Right-side restriction had to be dropped
};

struct GoalStatistics {
    size_t valid_positions = 0;
    size_t unreachable_positions = 0;
    double max_distance = 0.0;
};

class GoalPlacer final : public Placer<GoalPlacement> {
public:
    GoalPlacer(const analysis::ReachabilityAnalyzer& analyzer, const GoalPlacerConfig& config = {});

    /// Footed floor tile; distance and boundary need a spawn, see is_valid_goal
    [[nodiscard]] bool validate(const level::Grid& grid, const Point& p) const override;

    [[nodiscard]] bool is_valid_goal(const level::Grid& grid, const Point& spawn, const Point& p,
                                     bool apply_boundary) const;

    /// Pre-platform mode: farthest valid goal that walking alone cannot reach
    [[nodiscard]] core::Result<GoalPlacement> place_goal(const level::Grid& grid, const Point& spawn) const;

    /// Post-platform mode: random pick among the 20 right-most goals reachable with full physics
    [[nodiscard]] core::Result<GoalPlacement> place_goal_after_platforms(const level::Grid& grid, const Point& spawn,
                                                                         core::RandomSource& rng) const;

    /// Delegates to place_goal_after_platforms with the context's grid and spawn
    [[nodiscard]] core::Result<GoalPlacement> place(const PlacementContext& context,
                                                    core::RandomSource& rng) override;

    /// A clear straight run of floor at least visibility_radius long in some cardinal direction
    [[nodiscard]] bool is_visible(const level::Grid& grid, const Point& p) const;

    [[nodiscard]] std::vector<Point> find_valid_positions(const level::Grid& grid, const Point& spawn,
                                                          bool apply_boundary) const;

    [[nodiscard]] GoalStatistics statistics(const level::Grid& grid, const Point& spawn) const;

    [[nodiscard]] const GoalPlacerConfig& get_config() const { return config_; }

private:
    [[nodiscard]] GoalPlacement describe(const level::Grid& grid, const Point& spawn, const Point& p) const;

    const analysis::ReachabilityAnalyzer& analyzer_;
    GoalPlacerConfig config_;
};

}  // namespace cavegen::placement
