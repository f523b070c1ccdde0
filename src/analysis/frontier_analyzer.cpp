// CaveGen Analysis
// frontier_analyzer.cpp - Edge of the reachable area

#include <cavegen/analysis/frontier_analyzer.hpp>
#include <cavegen/core/logger.hpp>

namespace cavegen::analysis {

using level::Point;

bool FrontierAnalyzer::is_frontier(const level::Grid& grid, const ReachabilityResult& reachability, const Point& p) {
    if (!reachability.contains(p)) {
        return false;
    }
    for (int i = 0; i < 4; ++i) {
        const Point neighbor(p.x + level::CARDINAL_DX[i], p.y + level::CARDINAL_DY[i]);
        if (grid.is_floor(neighbor) && !reachability.contains(neighbor)) {
            return true;
        }
    }
    return false;
}

std::vector<Point> FrontierAnalyzer::find_frontier(const level::Grid& grid, const ReachabilityResult& reachability) {
    std::vector<Point> frontier;
    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            const Point p(x, y);
            if (is_frontier(grid, reachability, p)) {
                frontier.push_back(p);
            }
        }
    }
    return frontier;
}

std::vector<Point> FrontierAnalyzer::find_frontier(const level::Grid& grid, const Point& start) const {
    const ReachabilityResult reachability = analyzer_.analyze(grid, start);
    std::vector<Point> frontier = find_frontier(grid, reachability);
    CAVEGEN_LOG_DEBUG(core::log_category::ANALYSIS, "Frontier from ({}, {}): {} tiles of {} reachable", start.x,
                      start.y, frontier.size(), reachability.count());
    return frontier;
}

}  // namespace cavegen::analysis
