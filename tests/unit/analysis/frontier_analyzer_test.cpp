// CaveGen Analysis Tests
// frontier_analyzer_test.cpp - Reachable frontier and critical ring ranking

#include <gtest/gtest.h>

#include "test_utils.hpp"

#include <cavegen/analysis/critical_ring_analyzer.hpp>
#include <cavegen/analysis/frontier_analyzer.hpp>

namespace cavegen::analysis {
namespace {

using level::Grid;
using level::Point;

class FrontierAnalyzerTest : public ::testing::Test {
protected:
    // Reachable rows 4..7 from the floor, rows 1..3 too high
    Grid room_ = test::make_room(12, 10, 8);
    ReachabilityAnalyzer analyzer_;
};

// Test: Frontier is the top reachable row under the unreachable ceiling area
TEST_F(FrontierAnalyzerTest, FrontierBordersUnreachableFloor) {
    FrontierAnalyzer frontier_analyzer(analyzer_);
    auto frontier = frontier_analyzer.find_frontier(room_, {1, 7});
    ASSERT_EQ(frontier.size(), 10u);
    for (size_t i = 0; i < frontier.size(); ++i) {
        EXPECT_EQ(frontier[i], Point(static_cast<int32_t>(i) + 1, 4));
    }
}

TEST_F(FrontierAnalyzerTest, FullyReachableAreaHasNoFrontier) {
    Grid low = test::make_room(12, 6, 4);
    FrontierAnalyzer frontier_analyzer(analyzer_);
    EXPECT_TRUE(frontier_analyzer.find_frontier(low, {1, 3}).empty());
}

TEST_F(FrontierAnalyzerTest, FrontierTilesAreReachable) {
    ReachabilityResult reach = analyzer_.analyze(room_, {1, 7});
    for (const auto& p : FrontierAnalyzer::find_frontier(room_, reach)) {
        EXPECT_TRUE(reach.contains(p));
        EXPECT_TRUE(FrontierAnalyzer::is_frontier(room_, reach, p));
    }
    EXPECT_FALSE(FrontierAnalyzer::is_frontier(room_, reach, {5, 2}));
    EXPECT_FALSE(FrontierAnalyzer::is_frontier(room_, reach, {5, 7}));
}

// Test: Ring sits one row below the frontier, best reclaim score first
TEST_F(FrontierAnalyzerTest, CriticalRingRankedByReclaimScore) {
    CriticalRingAnalyzer ring_analyzer(analyzer_);
    auto ring = ring_analyzer.find_critical_ring(room_, {1, 7});
    ASSERT_EQ(ring.size(), 10u);
    for (const auto& tile : ring) {
        EXPECT_EQ(tile.position.y, 5);
        EXPECT_GT(tile.reclaim_score, 0);
    }
    for (size_t i = 1; i < ring.size(); ++i) {
        EXPECT_GE(ring[i - 1].reclaim_score, ring[i].reclaim_score);
    }

    // Window of 7 columns x 3 unreachable rows
    EXPECT_EQ(ring.front().position, Point(4, 5));
    EXPECT_EQ(ring.front().reclaim_score, 21);
}

TEST_F(FrontierAnalyzerTest, ReclaimScoreCountsUnreachableFloor) {
    CriticalRingAnalyzer ring_analyzer(analyzer_);
    ReachabilityResult reach = analyzer_.analyze(room_, {1, 7});
    EXPECT_EQ(ring_analyzer.reclaim_score(room_, reach, {1, 5}), 12);
    EXPECT_EQ(ring_analyzer.reclaim_score(room_, reach, {5, 7}), 7);
    EXPECT_EQ(ring_analyzer.reclaim_score(room_, reach, {5, 8}), 0);
}

TEST_F(FrontierAnalyzerTest, EmptyFrontierGivesEmptyRing) {
    Grid low = test::make_room(12, 6, 4);
    CriticalRingAnalyzer ring_analyzer(analyzer_);
    EXPECT_TRUE(ring_analyzer.find_critical_ring(low, {1, 3}).empty());
}

}  // namespace
}  // namespace cavegen::analysis
