// CaveGen Placement
// spawn_placer.cpp - Player spawn on safe footing

#include <cavegen/core/logger.hpp>
#include <cavegen/placement/spawn_placer.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace cavegen::placement {

SpawnPlacer::SpawnPlacer(const SpawnPlacerConfig& config) : config_(config) {
    if (config_.max_attempts <= 0) {
        throw std::invalid_argument(fmt::format("max_attempts must be positive, got {}", config_.max_attempts));
    }
    if (config_.safety_radius <= 0) {
        throw std::invalid_argument(fmt::format("safety_radius must be positive, got {}", config_.safety_radius));
    }
    if (config_.left_side_boundary &&
        (*config_.left_side_boundary < 0.0 || *config_.left_side_boundary > 1.0)) {
        throw std::invalid_argument(
            fmt::format("left_side_boundary must be within [0, 1], got {}", *config_.left_side_boundary));
    }
}

bool SpawnPlacer::has_safe_landing_zone(const level::Grid& grid, const Point& p) const {
    for (int32_t dir : {-1, 1}) {
        for (int32_t r = 1; r <= config_.safety_radius; ++r) {
            const Point q(p.x + dir * r, p.y);
            if (!grid.is_floor(q)) {
                break;
            }
            if (!grid.has_footing(q)) {
                return false;
            }
        }
    }
    return true;
}

bool SpawnPlacer::validate(const level::Grid& grid, const Point& p) const {
    return grid.has_footing(p) && has_safe_landing_zone(grid, p);
}

std::vector<Point> SpawnPlacer::footed_candidates(const level::Grid& grid, bool apply_boundary) const {
    const bool bounded = apply_boundary && config_.left_side_boundary.has_value();
    const double limit = bounded ? static_cast<double>(grid.width()) * *config_.left_side_boundary : 0.0;

    std::vector<Point> candidates;
    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            if (bounded && static_cast<double>(x) >= limit) {
                break;
            }
            if (grid.has_footing(x, y)) {
                candidates.emplace_back(x, y);
            }
        }
    }
    return candidates;
}

std::vector<Point> SpawnPlacer::find_valid_positions(const level::Grid& grid, bool apply_boundary) const {
    std::vector<Point> positions = footed_candidates(grid, apply_boundary);
    std::erase_if(positions, [&](const Point& p) { return !has_safe_landing_zone(grid, p); });
    return positions;
}

std::optional<Point> SpawnPlacer::sample(const level::Grid& grid, std::vector<Point> candidates,
                                         core::RandomSource& rng, size_t& sampled) const {
    // Partial Fisher-Yates: each draw is a distinct candidate
    const size_t limit = std::min(candidates.size(), static_cast<size_t>(config_.max_attempts));
    for (size_t i = 0; i < limit; ++i) {
        const size_t j = i + core::random_index(rng, candidates.size() - i);
        std::swap(candidates[i], candidates[j]);
        ++sampled;
        if (has_safe_landing_zone(grid, candidates[i])) {
            return candidates[i];
        }
    }
    return std::nullopt;
}

core::Result<SpawnPlacement> SpawnPlacer::place(const level::Grid& grid, core::RandomSource& rng) const {
    SpawnPlacement placement;

    const bool bounded = config_.left_side_boundary.has_value();
    std::optional<Point> chosen = sample(grid, footed_candidates(grid, bounded), rng, placement.candidates_sampled);

    if (!chosen && bounded) {
        CAVEGEN_LOG_WARN(core::log_category::PLACEMENT,
                         "No safe spawn left of x < {:.0f}, falling back to the whole grid",
                         static_cast<double>(grid.width()) * *config_.left_side_boundary);
        placement.fallback_used = true;
        chosen = sample(grid, footed_candidates(grid, false), rng, placement.candidates_sampled);
    }

    if (!chosen) {
        CAVEGEN_LOG_WARN(core::log_category::PLACEMENT, "Spawn placement failed after sampling {} candidates",
                         placement.candidates_sampled);
        return core::Result<SpawnPlacement>::fail("No valid spawn positions found");
    }

    placement.position = *chosen;
    CAVEGEN_LOG_INFO(core::log_category::PLACEMENT, "Spawn placed at ({}, {})", placement.position.x,
                     placement.position.y);
    return core::Result<SpawnPlacement>::ok(placement);
}

core::Result<SpawnPlacement> SpawnPlacer::place(const PlacementContext& context, core::RandomSource& rng) {
    return place(context.require_grid(), rng);
}

SpawnStatistics SpawnPlacer::statistics(const level::Grid& grid) const {
    SpawnStatistics stats;
    stats.total_positions = grid.size();
    stats.valid_positions = find_valid_positions(grid).size();
    stats.validity_ratio = stats.total_positions == 0 ? 0.0
                                                      : static_cast<double>(stats.valid_positions) /
                                                            static_cast<double>(stats.total_positions);
    return stats;
}

}  // namespace cavegen::placement
