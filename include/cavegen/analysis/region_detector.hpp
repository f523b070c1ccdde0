// CaveGen Analysis
// region_detector.hpp - 4-connected floor component labelling

#pragma once

#include <cavegen/level/grid.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cavegen::analysis {

// ============================================================================
// Region Data
// ============================================================================

struct RegionInfo {
    int32_t label = 0;
    size_t area = 0;
    level::Point bounds_min{0, 0};
    level::Point bounds_max{0, 0};
};

// labels[y * width + x]: walls keep 1, floor cells carry their region label (>= 2)
struct RegionDetection {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<int32_t> labels;
    std::vector<RegionInfo> regions;  // Ordered by label

    [[nodiscard]] int32_t label_at(int32_t x, int32_t y) const {
        return labels[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)];
    }
    [[nodiscard]] int32_t label_at(const level::Point& p) const { return label_at(p.x, p.y); }

    [[nodiscard]] size_t region_count() const { return regions.size(); }
    [[nodiscard]] size_t total_area() const;
};

// ============================================================================
// Region Detector
// ============================================================================

class RegionDetector {
public:
    /// Row-major scan with queue-based flood fill; linear in the cell count
    [[nodiscard]] static RegionDetection detect_regions(const level::Grid& grid);
};

// ============================================================================
// Region Helpers
// ============================================================================

/// Cells of one region in row-major order
[[nodiscard]] std::vector<level::Point> region_cells(const RegionDetection& detection, int32_t label);

/// Largest region, lowest label on ties; throws std::logic_error when there are none
[[nodiscard]] const RegionInfo& largest_region(const RegionDetection& detection);

/// Fill regions smaller than min_area with wall, always keeping the largest region
[[nodiscard]] level::Grid cull_small_regions(const level::Grid& grid, const RegionDetection& detection,
                                             size_t min_area);

}  // namespace cavegen::analysis
