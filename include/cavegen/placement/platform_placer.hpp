// CaveGen Placement
// platform_placer.hpp - Strategic platforms that restore reachability

#pragma once

#include "placer.hpp"

#include <cavegen/analysis/critical_ring_analyzer.hpp>
#include <cavegen/analysis/reachability_analyzer.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cavegen::placement {

struct PlatformPlacerConfig {
    double target_reachability = 0.85;  // Reachable floor over all floor
    double floating_probability = 0.4;
    double moving_probability = 0.6;
    int32_t min_size = 2;
    int32_t max_size = 6;
    int32_t max_iterations = 50;
    int32_t grouping_distance = 4;  // Manhattan distance joining unreachable cells into one group
    int32_t visual_impact_radius = 2;
    double min_open_space_ratio = 0.5;
};

struct PlatformPlacementResult {
    std::vector<Platform> platforms;
    level::Grid grid;  // Input grid with every accepted platform marked as wall
    double initial_ratio = 0.0;
    double final_ratio = 0.0;
    int32_t iterations = 0;
    bool target_met = false;
};

// Each iteration targets the largest group of unreachable floor, anchors a
// proposal on the critical ring tile nearest to it, and keeps the platform
// only when a full recomputation shows the reachable area grew. Missing the
// target is reported in the result.
class PlatformPlacer final : public Placer<PlatformPlacementResult> {
public:
    PlatformPlacer(const analysis::ReachabilityAnalyzer& analyzer, const PlatformPlacerConfig& config = {});

    /// In-bounds floor tile
    [[nodiscard]] bool validate(const level::Grid& grid, const Point& p) const override;

    [[nodiscard]] core::Result<PlatformPlacementResult> place_platforms(const level::Grid& grid, const Point& start,
                                                                        const level::PointSet& forbidden,
                                                                        core::RandomSource& rng) const;

    [[nodiscard]] core::Result<PlatformPlacementResult> place(const PlacementContext& context,
                                                              core::RandomSource& rng) override;

    [[nodiscard]] PlatformType sample_type(core::RandomSource& rng) const;
    [[nodiscard]] int32_t sample_size(core::RandomSource& rng) const;

    /// Groups of unreachable cells, transitively joined within grouping_distance, largest first
    [[nodiscard]] std::vector<std::vector<Point>> group_unreachable(const std::vector<Point>& cells) const;

    /// Floor fraction of the in-bounds box around the platform, padded by visual_impact_radius
    [[nodiscard]] double open_space_ratio(const level::Grid& grid, const Platform& platform) const;

    [[nodiscard]] const PlatformPlacerConfig& get_config() const { return config_; }

private:
    [[nodiscard]] bool fits(const level::Grid& grid, const Platform& platform, const Point& start,
                            const level::PointSet& forbidden) const;
    [[nodiscard]] bool opens_unreachable(const level::Grid& trial, const Platform& platform,
                                         const analysis::ReachabilityResult& reachability) const;

    const analysis::ReachabilityAnalyzer& analyzer_;
    analysis::CriticalRingAnalyzer ring_analyzer_;
    PlatformPlacerConfig config_;
};

}  // namespace cavegen::placement
