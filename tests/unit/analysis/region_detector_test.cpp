// CaveGen Analysis Tests
// region_detector_test.cpp - Floor component labelling and culling

#include <gtest/gtest.h>

#include <cavegen/analysis/corridor_carver.hpp>
#include <cavegen/analysis/region_detector.hpp>
#include <cavegen/core/random.hpp>
#include <cavegen/generation/cellular_automata.hpp>
#include <cavegen/generation/grid_seeder.hpp>

#include <stdexcept>

namespace cavegen::analysis {
namespace {

using level::Grid;

class RegionDetectorTest : public ::testing::Test {
protected:
    // Two 2-wide floor columns separated by a solid 2-wide wall
    Grid split_ = Grid::from_rows({
        {0, 0, 1, 1, 0, 0},
        {0, 0, 1, 1, 0, 0},
        {0, 0, 1, 1, 0, 0},
        {0, 0, 1, 1, 0, 0},
        {0, 0, 1, 1, 0, 0},
    });
};

// Test: Separated halves become two labelled regions
TEST_F(RegionDetectorTest, DetectsSeparatedRegions) {
    RegionDetection detection = RegionDetector::detect_regions(split_);
    ASSERT_EQ(detection.region_count(), 2u);
    EXPECT_EQ(detection.regions[0].label, level::FIRST_REGION_LABEL);
    EXPECT_EQ(detection.regions[1].label, level::FIRST_REGION_LABEL + 1);
    EXPECT_EQ(detection.regions[0].area, 10u);
    EXPECT_EQ(detection.regions[1].area, 10u);

    EXPECT_EQ(detection.label_at(0, 0), level::FIRST_REGION_LABEL);
    EXPECT_EQ(detection.label_at(5, 4), level::FIRST_REGION_LABEL + 1);
    EXPECT_EQ(detection.label_at(2, 2), static_cast<int32_t>(level::WALL));
}

// Test: A single floor row bridges both halves into one region
TEST_F(RegionDetectorTest, BridgeRowJoinsRegions) {
    Grid bridged = split_;
    for (int32_t x = 0; x < bridged.width(); ++x) {
        bridged.set(x, 2, level::CellType::Floor);
    }
    RegionDetection detection = RegionDetector::detect_regions(bridged);
    ASSERT_EQ(detection.region_count(), 1u);
    EXPECT_EQ(detection.regions[0].area, 22u);
}

// Test: Carving leaves an already bridged grid untouched
TEST_F(RegionDetectorTest, BridgedGridNeedsNoCarving) {
    Grid grid = Grid::from_rows({
        {0, 0, 1, 1, 0, 0},
        {0, 0, 1, 1, 0, 0},
        {0, 0, 0, 0, 0, 0},
        {0, 0, 1, 1, 0, 0},
        {0, 0, 1, 1, 0, 0},
    });
    RegionDetection before = RegionDetector::detect_regions(grid);
    ASSERT_EQ(before.region_count(), 1u);

    core::SeededRandom rng("bridged");
    Grid carved = CorridorCarver::carve_corridors(grid, before, rng);
    EXPECT_EQ(carved, grid);
    EXPECT_EQ(RegionDetector::detect_regions(carved).region_count(), 1u);
}

TEST_F(RegionDetectorTest, DiagonalContactDoesNotConnect) {
    Grid grid = Grid::from_rows({
        {0, 1},
        {1, 0},
    });
    EXPECT_EQ(RegionDetector::detect_regions(grid).region_count(), 2u);
}

TEST_F(RegionDetectorTest, SolidGridHasNoRegions) {
    Grid grid(8, 8, level::CellType::Wall);
    RegionDetection detection = RegionDetector::detect_regions(grid);
    EXPECT_EQ(detection.region_count(), 0u);
    EXPECT_THROW((void)largest_region(detection), std::logic_error);
}

TEST_F(RegionDetectorTest, BoundsCoverRegionCells) {
    RegionDetection detection = RegionDetector::detect_regions(split_);
    const RegionInfo& right = detection.regions[1];
    EXPECT_EQ(right.bounds_min, level::Point(4, 0));
    EXPECT_EQ(right.bounds_max, level::Point(5, 4));
}

// Test: Areas sum to the floor count and every floor cell carries a region label
TEST_F(RegionDetectorTest, AreasSumToFloorCount) {
    core::SeededRandom rng("region-areas");
    Grid grid = generation::CellularAutomata::simulate(generation::GridSeeder::seed_grid({60, 40, 0.45}, rng),
                                                       {4, 5, 4});
    RegionDetection detection = RegionDetector::detect_regions(grid);
    EXPECT_EQ(detection.total_area(), grid.floor_count());

    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            if (grid.get(x, y) == level::FLOOR) {
                EXPECT_GE(detection.label_at(x, y), level::FIRST_REGION_LABEL);
            } else {
                EXPECT_EQ(detection.label_at(x, y), static_cast<int32_t>(level::WALL));
            }
        }
    }
}

TEST_F(RegionDetectorTest, RegionCellsAreRowMajor) {
    RegionDetection detection = RegionDetector::detect_regions(split_);
    auto cells = region_cells(detection, level::FIRST_REGION_LABEL);
    ASSERT_EQ(cells.size(), 10u);
    EXPECT_EQ(cells.front(), level::Point(0, 0));
    EXPECT_EQ(cells[1], level::Point(1, 0));
    EXPECT_EQ(cells.back(), level::Point(1, 4));
}

TEST_F(RegionDetectorTest, LargestRegionPrefersLowestLabelOnTies) {
    RegionDetection detection = RegionDetector::detect_regions(split_);
    EXPECT_EQ(largest_region(detection).label, level::FIRST_REGION_LABEL);
}

// Test: Culling fills small regions but never the largest
TEST_F(RegionDetectorTest, CullSmallRegions) {
    Grid grid = Grid::from_rows({
        {0, 0, 0, 1, 0},
        {0, 0, 0, 1, 1},
        {0, 0, 0, 1, 0},
    });
    RegionDetection detection = RegionDetector::detect_regions(grid);
    ASSERT_EQ(detection.region_count(), 3u);

    Grid culled = cull_small_regions(grid, detection, 2);
    EXPECT_EQ(culled.get(4, 0), level::WALL);
    EXPECT_EQ(culled.get(4, 2), level::WALL);
    EXPECT_EQ(culled.floor_count(), 9u);
    EXPECT_EQ(RegionDetector::detect_regions(culled).region_count(), 1u);

    // Threshold larger than every region still keeps the largest
    Grid aggressive = cull_small_regions(grid, detection, 100);
    EXPECT_EQ(aggressive.floor_count(), 9u);
}

TEST_F(RegionDetectorTest, CullRejectsMismatchedDetection) {
    RegionDetection detection = RegionDetector::detect_regions(split_);
    Grid other(4, 4);
    EXPECT_THROW((void)cull_small_regions(other, detection, 5), std::logic_error);
}

}  // namespace
}  // namespace cavegen::analysis
