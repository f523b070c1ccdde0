// CaveGen Placement Tests
// goal_placer_test.cpp - Goal placement before and after platforms

#include <gtest/gtest.h>

#include "test_utils.hpp"

#include <cavegen/core/random.hpp>
#include <cavegen/placement/goal_placer.hpp>

#include <cmath>
#include <stdexcept>

namespace cavegen::placement {
namespace {

using level::Grid;
using level::Point;

class GoalPlacerTest : public ::testing::Test {
protected:
    analysis::ReachabilityAnalyzer analyzer_;

    // Floor at row 7 on the left, a three-tile step up to row 4 from x = 15
    Grid step_room() const {
        Grid grid = test::make_room(30, 10, 8);
        for (int32_t y = 5; y <= 7; ++y) {
            for (int32_t x = 15; x <= 28; ++x) {
                grid.set(x, y, level::CellType::Wall);
            }
        }
        return grid;
    }
};

TEST_F(GoalPlacerTest, RejectsInvalidConfig) {
    EXPECT_THROW(GoalPlacer(analyzer_, {-1.0, 100, 3, std::nullopt}), std::invalid_argument);
    EXPECT_THROW(GoalPlacer(analyzer_, {10.0, 0, 3, std::nullopt}), std::invalid_argument);
    EXPECT_THROW(GoalPlacer(analyzer_, {10.0, 100, 0, std::nullopt}), std::invalid_argument);
    EXPECT_THROW(GoalPlacer(analyzer_, {10.0, 100, 3, 2.0}), std::invalid_argument);
}

TEST_F(GoalPlacerTest, ValidGoalRespectsDistance) {
    GoalPlacer placer(analyzer_);
    Grid grid = test::make_room(40, 10, 8);
    const Point spawn(1, 7);
    EXPECT_FALSE(placer.is_valid_goal(grid, spawn, spawn, false));
    EXPECT_FALSE(placer.is_valid_goal(grid, spawn, {10, 7}, false));
    EXPECT_TRUE(placer.is_valid_goal(grid, spawn, {11, 7}, false));
    EXPECT_FALSE(placer.is_valid_goal(grid, spawn, {20, 6}, false));
}

// Test: Before platforms the goal is the farthest tile walking cannot reach
TEST_F(GoalPlacerTest, PrePlatformGoalIsUnreachableByWalking) {
    GoalPlacer placer(analyzer_);
    Grid grid = step_room();
    auto result = placer.place_goal(grid, {1, 7});
    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.get().position, Point(28, 4));
    EXPECT_TRUE(result.get().unreachable_by_walking);
    EXPECT_DOUBLE_EQ(result.get().distance, std::sqrt(27.0 * 27.0 + 3.0 * 3.0));

    analysis::ReachabilityOptions walk_only;
    walk_only.allow_jumps = false;
    EXPECT_FALSE(analyzer_.analyze(grid, {1, 7}, walk_only).contains(result.get().position));
}

TEST_F(GoalPlacerTest, PrePlatformFailsWhenEverythingIsWalkable) {
    GoalPlacer placer(analyzer_);
    auto result = placer.place_goal(test::make_room(40, 10, 8), {1, 7});
    EXPECT_FALSE(result);
    EXPECT_FALSE(result.error.empty());
}

// Test: After platforms the goal is reachable and on the right side
TEST_F(GoalPlacerTest, PostPlatformGoalIsReachableOnRight) {
    GoalPlacer placer(analyzer_, {10.0, 100, 3, 0.75});
    Grid grid = test::make_room(40, 10, 8);
    for (const char* seed : {"goal-a", "goal-b", "goal-c"}) {
        core::SeededRandom rng(seed);
        auto result = placer.place_goal_after_platforms(grid, {1, 7}, rng);
        ASSERT_TRUE(result) << result.error;
        const Point goal = result.get().position;
        EXPECT_GE(goal.x, 30);
        EXPECT_TRUE(grid.has_footing(goal));
        EXPECT_GE(result.get().distance, 10.0);
        EXPECT_FALSE(result.get().fallback_used);
        EXPECT_TRUE(analyzer_.analyze(grid, {1, 7}).contains(goal));
    }
}

TEST_F(GoalPlacerTest, PostPlatformFallsBackToWholeGrid) {
    GoalPlacer placer(analyzer_, {10.0, 100, 3, 1.0});
    core::SeededRandom rng("goal-fallback");
    auto result = placer.place_goal_after_platforms(test::make_room(40, 10, 8), {1, 7}, rng);
    ASSERT_TRUE(result) << result.error;
    EXPECT_TRUE(result.get().fallback_used);
    // Drawn from the 20 right-most candidates
    EXPECT_GE(result.get().position.x, 19);
}

TEST_F(GoalPlacerTest, PostPlatformFailsWhenTooFar) {
    GoalPlacer placer(analyzer_, {100.0, 100, 3, std::nullopt});
    core::SeededRandom rng("goal-far");
    EXPECT_FALSE(placer.place_goal_after_platforms(test::make_room(40, 10, 8), {1, 7}, rng));
}

TEST_F(GoalPlacerTest, Visibility) {
    GoalPlacer placer(analyzer_);
    EXPECT_TRUE(placer.is_visible(test::make_room(40, 10, 8), {20, 7}));

    Grid pocket(5, 5, level::CellType::Wall);
    pocket.set(2, 2, level::CellType::Floor);
    EXPECT_FALSE(placer.is_visible(pocket, {2, 2}));
}

TEST_F(GoalPlacerTest, ContextRequiresSpawn) {
    GoalPlacer placer(analyzer_);
    Grid grid = test::make_room(40, 10, 8);
    core::SeededRandom rng("goal-context");
    PlacementContext context;
    context.grid = &grid;
    EXPECT_THROW((void)placer.place(context, rng), std::invalid_argument);

    context.spawn = Point(1, 7);
    EXPECT_TRUE(placer.place(context, rng));
}

TEST_F(GoalPlacerTest, Statistics) {
    GoalPlacer placer(analyzer_);
    GoalStatistics stats = placer.statistics(step_room(), {1, 7});
    // Row 7 from x = 11 to 14 plus the 14 step tiles
    EXPECT_EQ(stats.valid_positions, 18u);
    EXPECT_EQ(stats.unreachable_positions, 14u);
    EXPECT_GT(stats.max_distance, 27.0);
}

}  // namespace
}  // namespace cavegen::placement
