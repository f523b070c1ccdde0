// CaveGen Placement
// platform_placer.cpp - Strategic platforms that restore reachability

#include <cavegen/analysis/frontier_analyzer.hpp>
#include <cavegen/core/logger.hpp>
#include <cavegen/placement/platform_placer.hpp>
#include <cavegen/platform/timer.hpp>

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <stdexcept>
#include <utility>

namespace cavegen::placement {

namespace {

// Highest-scoring ring tiles considered as anchors each iteration
constexpr size_t ANCHOR_POOL = 8;

struct GroupCentre {
    double x = 0.0;
    double y = 0.0;
};

GroupCentre centre_of(const std::vector<Point>& cells) {
    GroupCentre centre;
    for (const auto& p : cells) {
        centre.x += static_cast<double>(p.x);
        centre.y += static_cast<double>(p.y);
    }
    const auto n = static_cast<double>(cells.size());
    centre.x /= n;
    centre.y /= n;
    return centre;
}

Platform make_platform(int32_t x, int32_t y, int32_t size, PlatformType type) {
    Platform platform;
    platform.x = x;
    platform.y = y;
    platform.width = size;
    platform.height = 1;
    platform.type = type;
    return platform;
}

}  // namespace

PlatformPlacer::PlatformPlacer(const analysis::ReachabilityAnalyzer& analyzer, const PlatformPlacerConfig& config)
    : analyzer_(analyzer), ring_analyzer_(analyzer), config_(config) {
    if (config_.target_reachability < 0.0 || config_.target_reachability > 1.0) {
        throw std::invalid_argument(
            fmt::format("target_reachability must be within [0, 1], got {}", config_.target_reachability));
    }
    if (config_.min_size <= 0 || config_.max_size <= 0) {
        throw std::invalid_argument("Platform sizes must be positive");
    }
    if (config_.min_size > config_.max_size) {
        throw std::invalid_argument(fmt::format("min_size ({}) cannot exceed max_size ({})", config_.min_size,
                                                config_.max_size));
    }
    if (config_.floating_probability < 0.0 || config_.floating_probability > 1.0 ||
        config_.moving_probability < 0.0 || config_.moving_probability > 1.0) {
        throw std::invalid_argument("Platform type probabilities must be within [0, 1]");
    }
    if (std::abs(config_.floating_probability + config_.moving_probability - 1.0) > 0.001) {
        throw std::invalid_argument("Platform type probabilities must sum to 1.0");
    }
    if (config_.max_iterations < 0) {
        throw std::invalid_argument(fmt::format("max_iterations must be non-negative, got {}", config_.max_iterations));
    }
    if (config_.grouping_distance < 0 || config_.visual_impact_radius < 0) {
        throw std::invalid_argument("grouping_distance and visual_impact_radius must be non-negative");
    }
}

bool PlatformPlacer::validate(const level::Grid& grid, const Point& p) const {
    return grid.is_floor(p);
}

PlatformType PlatformPlacer::sample_type(core::RandomSource& rng) const {
    return rng.next_uniform() < config_.floating_probability ? PlatformType::Floating : PlatformType::Moving;
}

int32_t PlatformPlacer::sample_size(core::RandomSource& rng) const {
    return core::random_int(rng, config_.min_size, config_.max_size);
}

std::vector<std::vector<Point>> PlatformPlacer::group_unreachable(const std::vector<Point>& cells) const {
    const level::PointSet pending_set(cells.begin(), cells.end());
    level::PointSet grouped;
    std::vector<std::vector<Point>> groups;
    const int32_t d = config_.grouping_distance;

    for (const auto& seed : cells) {
        if (grouped.count(seed) != 0) {
            continue;
        }

        std::vector<Point> group;
        std::deque<Point> queue{seed};
        grouped.insert(seed);
        while (!queue.empty()) {
            const Point current = queue.front();
            queue.pop_front();
            group.push_back(current);

            for (int32_t dy = -d; dy <= d; ++dy) {
                const int32_t span = d - std::abs(dy);
                for (int32_t dx = -span; dx <= span; ++dx) {
                    const Point next(current.x + dx, current.y + dy);
                    if (pending_set.count(next) != 0 && grouped.count(next) == 0) {
                        grouped.insert(next);
                        queue.push_back(next);
                    }
                }
            }
        }
        groups.push_back(std::move(group));
    }

    std::stable_sort(groups.begin(), groups.end(),
                     [](const auto& a, const auto& b) { return a.size() > b.size(); });
    return groups;
}

double PlatformPlacer::open_space_ratio(const level::Grid& grid, const Platform& platform) const {
    const int32_t r = config_.visual_impact_radius;
    int32_t total = 0;
    int32_t open = 0;
    for (int32_t y = platform.y - r; y <= platform.y + r; ++y) {
        for (int32_t x = platform.x - r; x < platform.x + platform.width + r; ++x) {
            if (!grid.in_bounds(x, y)) {
                continue;
            }
            ++total;
            if (grid.get(x, y) == level::FLOOR) {
                ++open;
            }
        }
    }
    return total == 0 ? 0.0 : static_cast<double>(open) / static_cast<double>(total);
}

bool PlatformPlacer::fits(const level::Grid& grid, const Platform& platform, const Point& start,
                          const level::PointSet& forbidden) const {
    for (const auto& tile : platform.occupied_tiles()) {
        if (!grid.is_floor(tile) || tile == start || forbidden.count(tile) != 0) {
            return false;
        }
    }
    return true;
}

bool PlatformPlacer::opens_unreachable(const level::Grid& trial, const Platform& platform,
                                       const analysis::ReachabilityResult& reachability) const {
    for (const auto& tile : platform.occupied_tiles()) {
        const Point standing(tile.x, tile.y - 1);
        if (!trial.has_footing(standing)) {
            continue;
        }
        for (int32_t dx : {-1, 1}) {
            const Point side(standing.x + dx, standing.y);
            if (trial.is_floor(side) && !reachability.contains(side)) {
                return true;
            }
        }
        for (const auto& arc : analyzer_.arcs()) {
            const Point target = standing + arc.offset;
            if (trial.is_floor(target) && !reachability.contains(target) &&
                analyzer_.is_reachable_by_jump(trial, standing, target)) {
                return true;
            }
        }
    }
    return false;
}

core::Result<PlatformPlacementResult> PlatformPlacer::place_platforms(const level::Grid& grid, const Point& start,
                                                                      const level::PointSet& forbidden,
                                                                      core::RandomSource& rng) const {
    CAVEGEN_SCOPED_TIMER(core::log_category::PLACEMENT, "platform_placement");
    PlatformPlacementResult result;
    result.grid = grid;

    analysis::ReachabilityResult reachability = analyzer_.analyze(result.grid, start);
    double ratio = analysis::ReachabilityAnalyzer::reachability_ratio(result.grid, reachability);
    result.initial_ratio = ratio;

    level::PointSet exhausted_anchors;

    while (ratio < config_.target_reachability && result.iterations < config_.max_iterations) {
        ++result.iterations;

        const std::vector<Point> frontier = analysis::FrontierAnalyzer::find_frontier(result.grid, reachability);
        std::vector<analysis::RingTile> ring = ring_analyzer_.find_critical_ring(result.grid, reachability, frontier);
        if (ring.empty()) {
            // Tiny reachable areas may have a frontier but no ring inside it
            for (const auto& p : frontier) {
                ring.push_back({p, ring_analyzer_.reclaim_score(result.grid, reachability, p)});
            }
        }
        std::erase_if(ring, [&](const analysis::RingTile& t) { return exhausted_anchors.count(t.position) != 0; });
        if (ring.empty()) {
            CAVEGEN_LOG_DEBUG(core::log_category::PLACEMENT, "No anchors left after {} iterations", result.iterations);
            break;
        }

        std::vector<Point> unreachable;
        for (const auto& p : result.grid.floor_cells()) {
            if (!reachability.contains(p)) {
                unreachable.push_back(p);
            }
        }
        const std::vector<std::vector<Point>> groups = group_unreachable(unreachable);
        if (groups.empty()) {
            break;
        }
        const GroupCentre centre = centre_of(groups.front());

        // Nearest to the target group among the best-scored ring tiles
        const size_t pool = std::min(ring.size(), ANCHOR_POOL);
        Point anchor = ring.front().position;
        double best = std::numeric_limits<double>::max();
        for (size_t i = 0; i < pool; ++i) {
            const Point& p = ring[i].position;
            const double dx = static_cast<double>(p.x) - centre.x;
            const double dy = static_cast<double>(p.y) - centre.y;
            const double distance = dx * dx + dy * dy;
            if (distance < best) {
                best = distance;
                anchor = p;
            }
        }

        const PlatformType type = sample_type(rng);
        const int32_t size = sample_size(rng);
        const bool toward_left = centre.x < static_cast<double>(anchor.x);

        // Adjacent to the anchor first, then starting at the anchor column
        const int32_t adjacent_x = toward_left ? anchor.x - size : anchor.x + 1;
        const int32_t inclusive_x = toward_left ? anchor.x - size + 1 : anchor.x;

        bool accepted = false;
        for (int32_t lift = 0; lift <= 2 && !accepted; ++lift) {
            for (int32_t x0 : {adjacent_x, inclusive_x}) {
                const Platform platform = make_platform(x0, anchor.y - lift, size, type);
                if (!fits(result.grid, platform, start, forbidden)) {
                    continue;
                }
                if (open_space_ratio(result.grid, platform) < config_.min_open_space_ratio) {
                    continue;
                }

                const level::Grid trial = level::with_walls(result.grid, platform.occupied_tiles());
                if (!opens_unreachable(trial, platform, reachability)) {
                    continue;
                }

                // The extension bounds the trial from above; only a gain there earns a full pass
                if (analyzer_.extend(trial, reachability, platform.occupied_tiles()).count() <=
                    reachability.count()) {
                    continue;
                }
                analysis::ReachabilityResult trial_reach = analyzer_.analyze(trial, start);
                if (trial_reach.count() <= reachability.count()) {
                    continue;
                }

                result.grid = trial;
                result.platforms.push_back(platform);
                reachability = std::move(trial_reach);
                ratio = analysis::ReachabilityAnalyzer::reachability_ratio(result.grid, reachability);
                accepted = true;

                CAVEGEN_LOG_DEBUG(core::log_category::PLACEMENT, "Platform {} x{} at ({}, {}), reachability {:.3f}",
                                  to_string(platform.type), platform.width, platform.x, platform.y, ratio);
                break;
            }
        }

        if (!accepted) {
            exhausted_anchors.insert(anchor);
        }
    }

    result.final_ratio = ratio;
    result.target_met = ratio >= config_.target_reachability;

    if (result.target_met) {
        CAVEGEN_LOG_INFO(core::log_category::PLACEMENT, "Placed {} platforms, reachability {:.3f} -> {:.3f}",
                         result.platforms.size(), result.initial_ratio, result.final_ratio);
    } else {
        CAVEGEN_LOG_WARN(core::log_category::PLACEMENT,
                         "Reachability target {:.2f} not met after {} iterations ({:.3f} -> {:.3f}, {} platforms)",
                         config_.target_reachability, result.iterations, result.initial_ratio, result.final_ratio,
                         result.platforms.size());
    }
    return core::Result<PlatformPlacementResult>::ok(std::move(result));
}

core::Result<PlatformPlacementResult> PlatformPlacer::place(const PlacementContext& context,
                                                            core::RandomSource& rng) {
    return place_platforms(context.require_grid(), context.require_spawn(), context.forbidden, rng);
}

}  // namespace cavegen::placement
