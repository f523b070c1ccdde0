// CaveGen Analysis
// region_detector.cpp - 4-connected floor component labelling

#include <cavegen/analysis/region_detector.hpp>
#include <cavegen/core/logger.hpp>

#include <algorithm>
#include <deque>
#include <stdexcept>

namespace cavegen::analysis {

using level::Point;

size_t RegionDetection::total_area() const {
    size_t total = 0;
    for (const auto& region : regions) {
        total += region.area;
    }
    return total;
}

RegionDetection RegionDetector::detect_regions(const level::Grid& grid) {
    RegionDetection detection;
    detection.width = grid.width();
    detection.height = grid.height();
    // 0 marks unvisited floor until its component is labelled
    detection.labels.assign(grid.size(), 0);

    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            if (grid.get(x, y) == level::WALL) {
                detection.labels[static_cast<size_t>(y) * static_cast<size_t>(grid.width()) +
                                 static_cast<size_t>(x)] = level::WALL;
            }
        }
    }

    auto label_ref = [&](int32_t x, int32_t y) -> int32_t& {
        return detection.labels[static_cast<size_t>(y) * static_cast<size_t>(grid.width()) + static_cast<size_t>(x)];
    };

    int32_t next_label = level::FIRST_REGION_LABEL;
    std::deque<Point> queue;

    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            if (label_ref(x, y) != 0) {
                continue;
            }

            RegionInfo region;
            region.label = next_label++;
            region.bounds_min = Point(x, y);
            region.bounds_max = Point(x, y);

            label_ref(x, y) = region.label;
            queue.emplace_back(x, y);

            while (!queue.empty()) {
                const Point current = queue.front();
                queue.pop_front();
                ++region.area;
                region.bounds_min = glm::min(region.bounds_min, current);
                region.bounds_max = glm::max(region.bounds_max, current);

                for (int i = 0; i < 4; ++i) {
                    const int32_t nx = current.x + level::CARDINAL_DX[i];
                    const int32_t ny = current.y + level::CARDINAL_DY[i];
                    if (grid.in_bounds(nx, ny) && label_ref(nx, ny) == 0) {
                        label_ref(nx, ny) = region.label;
                        queue.emplace_back(nx, ny);
                    }
                }
            }

            detection.regions.push_back(region);
        }
    }

    CAVEGEN_LOG_DEBUG(core::log_category::ANALYSIS, "Detected {} regions covering {} floor cells",
                      detection.regions.size(), detection.total_area());
    return detection;
}

std::vector<Point> region_cells(const RegionDetection& detection, int32_t label) {
    std::vector<Point> cells;
    for (int32_t y = 0; y < detection.height; ++y) {
        for (int32_t x = 0; x < detection.width; ++x) {
            if (detection.label_at(x, y) == label) {
                cells.emplace_back(x, y);
            }
        }
    }
    return cells;
}

const RegionInfo& largest_region(const RegionDetection& detection) {
    if (detection.regions.empty()) {
        throw std::logic_error("largest_region called on a detection with no regions");
    }
    // max_element keeps the first maximum, which is the lowest label
    return *std::max_element(detection.regions.begin(), detection.regions.end(),
                             [](const RegionInfo& a, const RegionInfo& b) { return a.area < b.area; });
}

level::Grid cull_small_regions(const level::Grid& grid, const RegionDetection& detection, size_t min_area) {
    if (detection.width != grid.width() || detection.height != grid.height()) {
        throw std::logic_error("cull_small_regions: detection does not match grid shape");
    }
    if (detection.regions.empty()) {
        return grid;
    }

    const int32_t keep_label = largest_region(detection).label;
    std::vector<bool> cull(detection.regions.size() + static_cast<size_t>(level::FIRST_REGION_LABEL), false);
    size_t culled_regions = 0;
    for (const auto& region : detection.regions) {
        if (region.label != keep_label && region.area < min_area) {
            cull[static_cast<size_t>(region.label)] = true;
            ++culled_regions;
        }
    }

    if (culled_regions == 0) {
        return grid;
    }

    level::Grid result = grid;
    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            const int32_t label = detection.label_at(x, y);
            if (label >= level::FIRST_REGION_LABEL && cull[static_cast<size_t>(label)]) {
                result.set(x, y, level::CellType::Wall);
            }
        }
    }

    CAVEGEN_LOG_DEBUG(core::log_category::ANALYSIS, "Culled {} regions smaller than {} cells", culled_regions,
                      min_area);
    return result;
}

}  // namespace cavegen::analysis
