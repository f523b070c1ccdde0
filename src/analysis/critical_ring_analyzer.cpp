// CaveGen Analysis
// critical_ring_analyzer.cpp - Reachable tiles just inside the frontier, ranked for platform anchoring

#include <cavegen/analysis/critical_ring_analyzer.hpp>
#include <cavegen/analysis/frontier_analyzer.hpp>
#include <cavegen/core/logger.hpp>

#include <algorithm>

namespace cavegen::analysis {

using level::Point;

int32_t CriticalRingAnalyzer::reclaim_score(const level::Grid& grid, const ReachabilityResult& reachability,
                                            const Point& p) const {
    const int32_t reach_x = analyzer_.max_span() + 1;
    const int32_t reach_y = analyzer_.max_rise() + 1;

    int32_t score = 0;
    for (int32_t dy = -reach_y; dy <= reach_y; ++dy) {
        for (int32_t dx = -reach_x; dx <= reach_x; ++dx) {
            const Point q(p.x + dx, p.y + dy);
            if (grid.is_floor(q) && !reachability.contains(q)) {
                ++score;
            }
        }
    }
    return score;
}

std::vector<RingTile> CriticalRingAnalyzer::find_critical_ring(const level::Grid& grid,
                                                               const ReachabilityResult& reachability,
                                                               const std::vector<Point>& frontier) const {
    const level::PointSet frontier_set(frontier.begin(), frontier.end());

    std::vector<RingTile> ring;
    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            const Point p(x, y);
            if (!reachability.contains(p) || frontier_set.count(p) != 0) {
                continue;
            }
            bool touches_frontier = false;
            for (int i = 0; i < 4 && !touches_frontier; ++i) {
                touches_frontier = frontier_set.count(Point(x + level::CARDINAL_DX[i], y + level::CARDINAL_DY[i])) != 0;
            }
            if (touches_frontier) {
                ring.push_back({p, reclaim_score(grid, reachability, p)});
            }
        }
    }

    // Stable sort keeps row-major order within equal scores
    std::stable_sort(ring.begin(), ring.end(),
                     [](const RingTile& a, const RingTile& b) { return a.reclaim_score > b.reclaim_score; });
    return ring;
}

std::vector<RingTile> CriticalRingAnalyzer::find_critical_ring(const level::Grid& grid, const Point& start) const {
    const ReachabilityResult reachability = analyzer_.analyze(grid, start);
    const std::vector<Point> frontier = FrontierAnalyzer::find_frontier(grid, reachability);
    std::vector<RingTile> ring = find_critical_ring(grid, reachability, frontier);

    CAVEGEN_LOG_DEBUG(core::log_category::ANALYSIS, "Critical ring: {} tiles (frontier {})", ring.size(),
                      frontier.size());
    return ring;
}

}  // namespace cavegen::analysis
