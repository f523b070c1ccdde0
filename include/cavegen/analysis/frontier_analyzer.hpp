// CaveGen Analysis
// frontier_analyzer.hpp - Edge of the reachable area

#pragma once

#include "reachability_analyzer.hpp"

#include <vector>

namespace cavegen::analysis {

// A frontier tile is reachable and has an in-bounds floor 4-neighbour that is not.
class FrontierAnalyzer {
public:
    explicit FrontierAnalyzer(const ReachabilityAnalyzer& analyzer) : analyzer_(analyzer) {}

    /// Row-major frontier of the area reachable from start
    [[nodiscard]] std::vector<level::Point> find_frontier(const level::Grid& grid, const level::Point& start) const;

    /// Same, from a precomputed reachability result
    [[nodiscard]] static std::vector<level::Point> find_frontier(const level::Grid& grid,
                                                                 const ReachabilityResult& reachability);

    [[nodiscard]] static bool is_frontier(const level::Grid& grid, const ReachabilityResult& reachability,
                                          const level::Point& p);

private:
    const ReachabilityAnalyzer& analyzer_;
};

}  // namespace cavegen::analysis
