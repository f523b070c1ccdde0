// CaveGen Placement Tests
// coin_placer_test.cpp - Category-weighted and reachable coin placement

#include <gtest/gtest.h>

#include "test_utils.hpp"

#include <cavegen/core/random.hpp>
#include <cavegen/placement/coin_distributor.hpp>
#include <cavegen/placement/reachable_coin_placer.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace cavegen::placement {
namespace {

using level::Grid;
using level::Point;

class CoinPlacerTest : public ::testing::Test {
protected:
    analysis::ReachabilityAnalyzer analyzer_;

    static void expect_spaced(const std::vector<Coin>& coins, double min_distance) {
        for (size_t i = 0; i < coins.size(); ++i) {
            for (size_t j = i + 1; j < coins.size(); ++j) {
                EXPECT_GE(level::euclidean_distance(coins[i].position, coins[j].position), min_distance);
            }
        }
    }

    // Horizontal 1-tall tunnel from x = 1 to 5
    static Grid tunnel() {
        Grid grid(7, 3, level::CellType::Wall);
        for (int32_t x = 1; x <= 5; ++x) {
            grid.set(x, 1, level::CellType::Floor);
        }
        return grid;
    }
};

// ============================================================================
// Helpers
// ============================================================================

TEST_F(CoinPlacerTest, DeadEndsAreTunnelEnds) {
    Grid grid = tunnel();
    EXPECT_TRUE(is_dead_end(grid, {1, 1}));
    EXPECT_TRUE(is_dead_end(grid, {5, 1}));
    EXPECT_FALSE(is_dead_end(grid, {3, 1}));
    EXPECT_FALSE(is_dead_end(grid, {0, 1}));

    CoinDistributor distributor(analyzer_);
    EXPECT_EQ(distributor.detect_dead_ends(grid).size(), 2u);
}

TEST_F(CoinPlacerTest, ExplorationScoreGrowsFromCentre) {
    Grid grid(20, 20);
    EXPECT_DOUBLE_EQ(exploration_score(grid, {10, 10}), 0.0);
    EXPECT_GT(exploration_score(grid, {0, 0}), exploration_score(grid, {5, 5}));
    EXPECT_LE(exploration_score(grid, {0, 0}), 1.0);

    auto top = top_exploration_positions(grid, grid.floor_cells(), 3);
    EXPECT_EQ(top.size(), 100u);
    EXPECT_EQ(top.front(), Point(0, 0));
}

TEST_F(CoinPlacerTest, PlaceFromCandidatesKeepsSpacing) {
    std::vector<Point> candidates;
    for (int32_t x = 0; x < 10; ++x) {
        candidates.emplace_back(x, 0);
    }
    std::vector<Coin> coins;
    level::PointSet used;
    core::SeededRandom rng("spacing");
    const size_t added = place_from_candidates(candidates, 10, CoinCategory::General, 3.0, coins, used, rng);
    EXPECT_EQ(added, coins.size());
    EXPECT_GE(added, 2u);
    EXPECT_LE(added, 4u);
    expect_spaced(coins, 3.0);
}

TEST_F(CoinPlacerTest, Metrics) {
    Grid grid(9, 9);
    std::vector<Coin> coins = {{{0, 0}, CoinCategory::DeadEnd}, {{8, 8}, CoinCategory::General}};
    CoinMetrics metrics = compute_coin_metrics(coins, grid, {0, 0});
    EXPECT_EQ(metrics.total, 2u);
    EXPECT_EQ(metrics.dead_end, 1u);
    EXPECT_EQ(metrics.general, 1u);
    EXPECT_DOUBLE_EQ(metrics.coverage, 2.0 / 9.0);
    EXPECT_DOUBLE_EQ(metrics.average_distance_to_spawn, std::sqrt(128.0) / 2.0);

    EXPECT_EQ(compute_coin_metrics({}, grid, {0, 0}).total, 0u);
}

// ============================================================================
// Coin Distributor
// ============================================================================

TEST_F(CoinPlacerTest, DistributorRejectsBadWeights) {
    EXPECT_THROW(CoinDistributor(analyzer_, {10, 0.5, 0.5, 0.5, 2.0}), std::invalid_argument);
    EXPECT_THROW(CoinDistributor(analyzer_, {0, 0.4, 0.3, 0.3, 2.0}), std::invalid_argument);
    EXPECT_THROW(CoinDistributor(analyzer_, {10, 1.2, -0.1, -0.1, 2.0}), std::invalid_argument);
}

// Test: Unreachable coins land above the jump rise, all coins spaced apart
TEST_F(CoinPlacerTest, DistributorCategories) {
    Grid grid = test::make_room(12, 10, 8);
    CoinDistributor distributor(analyzer_);
    core::SeededRandom rng("distribute");
    auto result = distributor.distribute(grid, {1, 7}, rng);
    ASSERT_TRUE(result) << result.error;

    const auto& coins = result.get().coins;
    EXPECT_LE(coins.size(), 10u);
    EXPECT_EQ(result.get().metrics.dead_end, 0u);
    EXPECT_GT(result.get().metrics.unreachable, 0u);
    expect_spaced(coins, 2.0);
    for (const auto& coin : coins) {
        EXPECT_TRUE(grid.is_floor(coin.position));
        EXPECT_NE(coin.position, Point(1, 7));
        if (coin.category == CoinCategory::Unreachable) {
            EXPECT_LE(coin.position.y, 3);
        }
    }
}

TEST_F(CoinPlacerTest, DistributorFailsWithoutFloor) {
    CoinDistributor distributor(analyzer_);
    core::SeededRandom rng("no-floor");
    Grid grid(6, 6, level::CellType::Wall);
    grid.set(2, 2, level::CellType::Floor);
    Grid solid(6, 6, level::CellType::Wall);

    EXPECT_TRUE(distributor.distribute(grid, {2, 2}, rng));
    PlacementContext context;
    context.grid = &solid;
    context.spawn = Point(2, 2);
    EXPECT_FALSE(distributor.place(context, rng));
}

// ============================================================================
// Reachable Coin Placer
// ============================================================================

// Test: Every coin is reachable from spawn and respects the minimum distance
TEST_F(CoinPlacerTest, ReachableCoinsAreReachable) {
    Grid grid = test::make_room(30, 8, 6);
    const Point spawn(1, 5);
    ReachableCoinPlacer placer(analyzer_);
    core::SeededRandom rng("reachable-coins");
    auto result = placer.place_coins(grid, spawn, {}, rng);
    ASSERT_TRUE(result) << result.error;

    const auto& coins = result.get().coins;
    EXPECT_EQ(coins.size(), 10u);
    expect_spaced(coins, 2.0);

    const auto reach = analyzer_.analyze(grid, spawn);
    for (const auto& coin : coins) {
        EXPECT_TRUE(reach.contains(coin.position));
        EXPECT_NE(coin.position, spawn);
        EXPECT_TRUE(placer.validate(grid, coin.position) || is_dead_end(grid, coin.position));
    }
}

// Test: A goal sitting in a one-tile pocket never receives the pocket's dead-end coin
TEST_F(CoinPlacerTest, ReachableCoinsKeepClearOfGoal) {
    Grid grid = test::make_room(30, 8, 6);
    grid.set(10, 6, level::CellType::Floor);
    const Point spawn(1, 5);
    const Point goal(10, 6);
    ASSERT_TRUE(grid.has_footing(goal));
    ASSERT_TRUE(is_dead_end(grid, goal));

    ReachableCoinPlacerConfig config;
    config.coin_count = 1;
    config.dead_end_weight = 1.0;
    config.exploration_weight = 0.0;
    config.general_weight = 0.0;
    ReachableCoinPlacer placer(analyzer_, config);

    // Without a goal the pocket is the only dead end and takes the coin
    core::SeededRandom unaware_rng("goal-pocket");
    auto unaware = placer.place_coins(grid, spawn, {}, unaware_rng);
    ASSERT_TRUE(unaware) << unaware.error;
    ASSERT_EQ(unaware.get().coins.size(), 1u);
    EXPECT_EQ(unaware.get().coins.front().position, goal);

    core::SeededRandom rng("goal-pocket");
    auto result = placer.place_coins(grid, spawn, {}, rng, goal);
    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.get().coins.size(), 1u);
    for (const auto& coin : result.get().coins) {
        EXPECT_NE(coin.position, goal);
        EXPECT_GE(level::euclidean_distance(coin.position, goal), config.min_distance);
    }
}

// Test: The placement context forwards its goal
TEST_F(CoinPlacerTest, ReachableCoinsReadGoalFromContext) {
    Grid grid = test::make_room(30, 8, 6);
    grid.set(10, 6, level::CellType::Floor);

    ReachableCoinPlacerConfig config;
    config.coin_count = 1;
    config.dead_end_weight = 1.0;
    config.exploration_weight = 0.0;
    config.general_weight = 0.0;
    ReachableCoinPlacer placer(analyzer_, config);

    PlacementContext context;
    context.grid = &grid;
    context.spawn = Point(1, 5);
    context.goal = Point(10, 6);
    core::SeededRandom rng("goal-pocket-context");
    auto result = placer.place(context, rng);
    ASSERT_TRUE(result) << result.error;
    for (const auto& coin : result.get().coins) {
        EXPECT_GE(level::euclidean_distance(coin.position, *context.goal), config.min_distance);
    }
}

TEST_F(CoinPlacerTest, ReachableCoinsSkipPlatformTiles) {
    Grid grid = test::make_room(30, 8, 6);
    Platform platform;
    platform.x = 2;
    platform.y = 3;
    platform.width = 26;

    ReachableCoinPlacer placer(analyzer_);
    core::SeededRandom rng("platform-coins");
    auto result = placer.place_coins(grid, {1, 5}, {platform}, rng);
    ASSERT_TRUE(result) << result.error;
    for (const auto& coin : result.get().coins) {
        EXPECT_FALSE(platform.covers(coin.position));
    }
}

TEST_F(CoinPlacerTest, ReachableCoinsAreDeterministic) {
    Grid grid = test::make_room(30, 8, 6);
    ReachableCoinPlacer placer(analyzer_);
    core::SeededRandom a("coins-repeat");
    core::SeededRandom b("coins-repeat");
    auto first = placer.place_coins(grid, {1, 5}, {}, a);
    auto second = placer.place_coins(grid, {1, 5}, {}, b);
    ASSERT_TRUE(first && second);
    ASSERT_EQ(first.get().coins.size(), second.get().coins.size());
    for (size_t i = 0; i < first.get().coins.size(); ++i) {
        EXPECT_EQ(first.get().coins[i].position, second.get().coins[i].position);
    }
}

TEST_F(CoinPlacerTest, LowReachabilityFails) {
    ReachableCoinPlacer placer(analyzer_);
    core::SeededRandom rng("low-reach");
    // Only 40 of 70 floor tiles are reachable
    auto result = placer.place_coins(test::make_room(12, 10, 8), {1, 7}, {}, rng);
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("Reachable area too low"), std::string::npos);
}

TEST_F(CoinPlacerTest, OpenTileValidation) {
    ReachableCoinPlacer placer(analyzer_);
    Grid grid = test::make_room(30, 8, 6);
    EXPECT_TRUE(placer.validate(grid, {5, 3}));
    EXPECT_FALSE(placer.validate(grid, {5, 5}));
    EXPECT_FALSE(placer.validate(grid, {1, 3}));
}

}  // namespace
}  // namespace cavegen::placement
