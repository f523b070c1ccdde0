// CaveGen Placement Tests
// enemy_placer_test.cpp - Enemy candidates and solvability-preserving placement

#include <gtest/gtest.h>

#include "test_utils.hpp"

#include <cavegen/core/random.hpp>
#include <cavegen/placement/enemy_placer.hpp>

#include <stdexcept>

namespace cavegen::placement {
namespace {

using level::Grid;
using level::Point;

class EnemyPlacerTest : public ::testing::Test {
protected:
    analysis::ReachabilityAnalyzer analyzer_;

    // One-tile-tall tunnel from x = 1 to 10; no room to jump
    static Grid tunnel() {
        Grid grid(12, 3, level::CellType::Wall);
        for (int32_t x = 1; x <= 10; ++x) {
            grid.set(x, 1, level::CellType::Floor);
        }
        return grid;
    }
};

// ============================================================================
// Candidate Analysis
// ============================================================================

TEST_F(EnemyPlacerTest, AnalyzerRejectsInvalidConfig) {
    EXPECT_THROW(EnemyPlacementAnalyzer({0, 20, 5.0, 8.0}), std::invalid_argument);
    EXPECT_THROW(EnemyPlacementAnalyzer({10, 5, 5.0, 8.0}), std::invalid_argument);
    EXPECT_THROW(EnemyPlacementAnalyzer({5, 20, -1.0, 8.0}), std::invalid_argument);
}

TEST_F(EnemyPlacerTest, ChokePointsInTunnel) {
    EnemyPlacementAnalyzer analyzer;
    auto chokes = analyzer.detect_choke_points(tunnel());
    EXPECT_EQ(chokes.size(), 10u);
    EXPECT_TRUE(analyzer.detect_choke_points(test::make_room(12, 10, 8)).empty());
}

TEST_F(EnemyPlacerTest, PatrolAreasByLength) {
    EnemyPlacementAnalyzer analyzer;
    auto areas = analyzer.identify_patrol_areas(test::make_room(12, 6, 4));
    ASSERT_EQ(areas.size(), 1u);
    EXPECT_EQ(areas[0].x, 1);
    EXPECT_EQ(areas[0].y, 3);
    EXPECT_EQ(areas[0].width, 10);
    EXPECT_EQ(areas[0].centre(), Point(6, 3));

    // Runs shorter than the minimum or longer than the maximum are skipped
    EXPECT_TRUE(analyzer.identify_patrol_areas(test::make_room(6, 6, 4)).empty());
    EXPECT_TRUE(analyzer.identify_patrol_areas(test::make_room(30, 6, 4)).empty());
}

TEST_F(EnemyPlacerTest, StrategicPositionsAroundCoinsAndGoal) {
    EnemyPlacementAnalyzer analyzer({5, 20, 1.0, 0.0});
    Grid room = test::make_room(12, 10, 8);
    auto around_coin = analyzer.analyze_strategic_positions(room, {{{5, 5}, CoinCategory::General}}, std::nullopt);
    EXPECT_EQ(around_coin.size(), 5u);

    auto around_goal = analyzer.analyze_strategic_positions(room, {}, Point(5, 5));
    EXPECT_EQ(around_goal.size(), 1u);
}

TEST_F(EnemyPlacerTest, PlatformTops) {
    EnemyPlacementAnalyzer analyzer;
    Grid room = test::make_room(12, 10, 8);
    Platform platform;
    platform.x = 3;
    platform.y = 5;
    platform.width = 2;
    auto tops = analyzer.analyze_platform_tops(room, {platform});
    ASSERT_EQ(tops.size(), 2u);
    EXPECT_EQ(tops[0], Point(3, 4));
    EXPECT_EQ(tops[1], Point(4, 4));
}

// Test: Overlapping sources keep the highest-priority type
TEST_F(EnemyPlacerTest, CandidatesDeduplicateByPriority) {
    EnemyPlacementAnalyzer analyzer;
    auto candidates = analyzer.generate_candidates(tunnel(), {}, std::nullopt, {});
    ASSERT_EQ(candidates.size(), 10u);
    for (size_t i = 0; i < candidates.size(); ++i) {
        EXPECT_EQ(candidates[i].type, EnemyPlacementType::ChokePoint);
        EXPECT_EQ(candidates[i].position, Point(static_cast<int32_t>(i) + 1, 1));
    }

    EnemyPlacementStatistics stats = analyzer.statistics(tunnel(), {}, std::nullopt, {});
    EXPECT_EQ(stats.choke_points, 10u);
    EXPECT_EQ(stats.patrol_areas, 1u);
    EXPECT_EQ(stats.candidates, 10u);
}

TEST_F(EnemyPlacerTest, CandidatesSortedByPriority) {
    EnemyPlacementAnalyzer analyzer;
    Grid room = test::make_room(12, 6, 4);
    auto candidates = analyzer.generate_candidates(room, {{{2, 2}, CoinCategory::General}}, std::nullopt, {});
    ASSERT_FALSE(candidates.empty());
    for (size_t i = 1; i < candidates.size(); ++i) {
        EXPECT_GE(placement_priority(candidates[i - 1].type), placement_priority(candidates[i].type));
    }
}

// ============================================================================
// Enemy Placer
// ============================================================================

TEST_F(EnemyPlacerTest, ZoneOfSplitsIntoThirds) {
    EXPECT_EQ(EnemyPlacer::zone_of(0, 30), 0);
    EXPECT_EQ(EnemyPlacer::zone_of(9, 30), 0);
    EXPECT_EQ(EnemyPlacer::zone_of(10, 30), 1);
    EXPECT_EQ(EnemyPlacer::zone_of(20, 30), 2);
    EXPECT_EQ(EnemyPlacer::zone_of(45, 30), 2);
    EXPECT_EQ(EnemyPlacer::zone_of(-5, 30), 0);
    EXPECT_EQ(EnemyPlacer::zone_of(5, 0), 0);
}

TEST_F(EnemyPlacerTest, MakeEnemyAttributeRanges) {
    test::SequenceRandom low({0.0, 0.9, 0.999});
    Enemy a = EnemyPlacer::make_enemy({3, 4}, EnemyPlacementType::Patrol, low);
    EXPECT_EQ(a.position, Point(3, 4));
    EXPECT_EQ(a.type, "LoopHound");
    EXPECT_EQ(a.patrol_distance, 50);
    EXPECT_EQ(a.direction, 1);
    EXPECT_EQ(a.speed, 199);

    test::SequenceRandom mid({0.5});
    Enemy b = EnemyPlacer::make_enemy({3, 4}, EnemyPlacementType::Strategic, mid);
    EXPECT_EQ(b.patrol_distance, 275);
    EXPECT_EQ(b.direction, -1);
    EXPECT_EQ(b.speed, 105);
    EXPECT_EQ(b.placement, EnemyPlacementType::Strategic);
}

TEST_F(EnemyPlacerTest, TargetCountCappedByMax) {
    Grid grid(20, 20);
    EXPECT_EQ(EnemyPlacer(analyzer_).target_count(grid), 10u);
    EXPECT_EQ(EnemyPlacer(analyzer_, {10, 0.01, 5.0, 3.0, true, 1000}).target_count(grid), 4u);
    EXPECT_EQ(EnemyPlacer(analyzer_, {10, 0.0, 5.0, 3.0, true, 1000}).target_count(grid), 0u);
}

TEST_F(EnemyPlacerTest, RejectsInvalidConfig) {
    EXPECT_THROW(EnemyPlacer(analyzer_, {-1, 0.1, 5.0, 3.0, true, 1000}), std::invalid_argument);
    EXPECT_THROW(EnemyPlacer(analyzer_, {10, 1.5, 5.0, 3.0, true, 1000}), std::invalid_argument);
    EXPECT_THROW(EnemyPlacer(analyzer_, {10, 0.1, 5.0, 3.0, true, 0}), std::invalid_argument);
}

// Test: Enemies respect spawn and goal distances and leave every coin and the goal reachable
TEST_F(EnemyPlacerTest, PlacementKeepsLevelSolvable) {
    Grid room = test::make_room(40, 10, 8);
    const Point spawn(1, 7);
    const Point goal(38, 7);
    std::vector<Coin> coins = {{{10, 7}, CoinCategory::General},
                               {{20, 7}, CoinCategory::General},
                               {{30, 7}, CoinCategory::General}};

    EnemyPlacer placer(analyzer_, {3, 0.05, 5.0, 3.0, true, 1000});
    core::SeededRandom rng("enemies");
    auto result = placer.place_enemies(room, spawn, coins, goal, {}, rng);
    ASSERT_TRUE(result) << result.error;

    const auto& enemies = result.get().enemies;
    EXPECT_EQ(result.get().target_count, 3u);
    ASSERT_EQ(enemies.size(), 3u);

    level::PointSet blocked;
    for (const auto& enemy : enemies) {
        EXPECT_GE(level::euclidean_distance(enemy.position, spawn), 5.0);
        EXPECT_GE(level::euclidean_distance(enemy.position, goal), 3.0);
        EXPECT_TRUE(room.is_floor(enemy.position));
        EXPECT_GE(enemy.patrol_distance, 50);
        EXPECT_LE(enemy.patrol_distance, 500);
        EXPECT_GE(enemy.speed, 10);
        EXPECT_LE(enemy.speed, 200);
        EXPECT_TRUE(enemy.direction == 1 || enemy.direction == -1);
        EXPECT_TRUE(blocked.insert(enemy.position).second);
    }

    analysis::ReachabilityOptions options;
    options.blocked = &blocked;
    const auto reach = analyzer_.analyze(room, spawn, options);
    EXPECT_TRUE(reach.contains(goal));
    for (const auto& coin : coins) {
        EXPECT_TRUE(reach.contains(coin.position));
    }
}

// Test: A single-file tunnel cannot hold an enemy without cutting off the goal
TEST_F(EnemyPlacerTest, RejectsEnemiesThatBlockTheGoal) {
    Grid grid = tunnel();
    const Point spawn(1, 1);
    const Point goal(10, 1);
    core::SeededRandom rng("tunnel");

    EnemyPlacer safe(analyzer_, {10, 0.1, 5.0, 3.0, true, 1000});
    auto guarded = safe.place_enemies(grid, spawn, {}, goal, {}, rng);
    ASSERT_TRUE(guarded);
    EXPECT_TRUE(guarded.get().enemies.empty());
    EXPECT_GE(guarded.get().rejected_for_solvability, 1u);

    EnemyPlacer unchecked(analyzer_, {10, 0.1, 5.0, 3.0, false, 1000});
    auto reckless = unchecked.place_enemies(grid, spawn, {}, goal, {}, rng);
    ASSERT_TRUE(reckless);
    EXPECT_EQ(reckless.get().enemies.size(), 2u);
    EXPECT_EQ(reckless.get().rejected_for_solvability, 0u);
}

TEST_F(EnemyPlacerTest, ZeroDensityPlacesNothing) {
    EnemyPlacer placer(analyzer_, {10, 0.0, 5.0, 3.0, true, 1000});
    core::SeededRandom rng("none");
    auto result = placer.place_enemies(test::make_room(40, 10, 8), {1, 7}, {}, std::nullopt, {}, rng);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.get().enemies.empty());
    EXPECT_EQ(result.get().target_count, 0u);
}

TEST_F(EnemyPlacerTest, SpawnMustBeFloor) {
    EnemyPlacer placer(analyzer_);
    core::SeededRandom rng("bad-spawn");
    EXPECT_THROW((void)placer.place_enemies(test::make_room(40, 10, 8), {0, 0}, {}, std::nullopt, {}, rng),
                 std::invalid_argument);
}

TEST_F(EnemyPlacerTest, ContextForwarding) {
    Grid room = test::make_room(40, 10, 8);
    EnemyPlacer placer(analyzer_, {2, 0.05, 5.0, 3.0, true, 1000});
    core::SeededRandom rng("context");
    PlacementContext context;
    context.grid = &room;
    context.spawn = Point(1, 7);
    context.goal = Point(38, 7);
    auto result = placer.place(context, rng);
    ASSERT_TRUE(result);
    EXPECT_LE(result.get().enemies.size(), 2u);
}

}  // namespace
}  // namespace cavegen::placement
