// CaveGen Analysis
// critical_ring_analyzer.hpp - Reachable tiles just inside the frontier, ranked for platform anchoring

#pragma once

#include "reachability_analyzer.hpp"

#include <cstdint>
#include <vector>

namespace cavegen::analysis {

struct RingTile {
    level::Point position{0, 0};
    int32_t reclaim_score = 0;
};

// The critical ring holds reachable, non-frontier tiles with a frontier
// 4-neighbour. reclaim_score counts the unreachable floor tiles within
// (span + 1, rise + 1) of the tile, which is the reach a platform placed
// beside or above it would add.
class CriticalRingAnalyzer {
public:
    explicit CriticalRingAnalyzer(const ReachabilityAnalyzer& analyzer) : analyzer_(analyzer) {}

    /// Ring ordered by descending score, then row-major
    [[nodiscard]] std::vector<RingTile> find_critical_ring(const level::Grid& grid, const level::Point& start) const;

    [[nodiscard]] std::vector<RingTile> find_critical_ring(const level::Grid& grid,
                                                           const ReachabilityResult& reachability,
                                                           const std::vector<level::Point>& frontier) const;

    [[nodiscard]] int32_t reclaim_score(const level::Grid& grid, const ReachabilityResult& reachability,
                                        const level::Point& p) const;

private:
    const ReachabilityAnalyzer& analyzer_;
};

}  // namespace cavegen::analysis
