// CaveGen Placement
// spawn_placer.hpp - Player spawn on safe footing

#pragma once

#include "placer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace cavegen::placement {

struct SpawnPlacerConfig {
    int32_t max_attempts = 100;
    int32_t safety_radius = 2;
    std::optional<double> left_side_boundary;  // Restrict to x < width * boundary
};

struct SpawnPlacement {
    Point position{0, 0};
    bool fallback_used = false;  // Left-side restriction had to be dropped
    size_t candidates_sampled = 0;
};

struct SpawnStatistics {
    size_t total_positions = 0;
    size_t valid_positions = 0;
    double validity_ratio = 0.0;
};

class SpawnPlacer final : public Placer<SpawnPlacement> {
public:
    explicit SpawnPlacer(const SpawnPlacerConfig& config = {});

    /// Footed floor tile whose safe landing zone holds
    [[nodiscard]] bool validate(const level::Grid& grid, const Point& p) const override;

    [[nodiscard]] core::Result<SpawnPlacement> place(const PlacementContext& context,
                                                     core::RandomSource& rng) override;
    [[nodiscard]] core::Result<SpawnPlacement> place(const level::Grid& grid, core::RandomSource& rng) const;

    /// Walking up to safety_radius either way along the row, stopping at walls, finds no drop edge
    [[nodiscard]] bool has_safe_landing_zone(const level::Grid& grid, const Point& p) const;

    /// Every valid spawn in row-major order, optionally restricted to the left side
    [[nodiscard]] std::vector<Point> find_valid_positions(const level::Grid& grid,
                                                          bool apply_boundary = false) const;

    [[nodiscard]] SpawnStatistics statistics(const level::Grid& grid) const;

    [[nodiscard]] const SpawnPlacerConfig& get_config() const { return config_; }

private:
    [[nodiscard]] std::vector<Point> footed_candidates(const level::Grid& grid, bool apply_boundary) const;
    [[nodiscard]] std::optional<Point> sample(const level::Grid& grid, std::vector<Point> candidates,
                                              core::RandomSource& rng, size_t& sampled) const;

    SpawnPlacerConfig config_;
};

}  // namespace cavegen::placement
