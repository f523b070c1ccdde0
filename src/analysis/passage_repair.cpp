// CaveGen Analysis
// passage_repair.cpp - Opens diagonal-only links and one-tile passages after carving

#include <cavegen/analysis/passage_repair.hpp>
#include <cavegen/core/logger.hpp>

#include <utility>

namespace cavegen::analysis {

using level::CellType;
using level::Grid;
using level::Point;

namespace {

struct DiagonalDirection {
    int dx;
    int dy;
};

// down-right, down-left, up-right, up-left
constexpr DiagonalDirection DIAGONALS[4] = {{1, 1}, {-1, 1}, {1, -1}, {-1, -1}};

}  // namespace

bool PassageRepair::is_border(const Grid& grid, int32_t x, int32_t y) {
    return x <= 0 || y <= 0 || x >= grid.width() - 1 || y >= grid.height() - 1;
}

std::vector<DiagonalIssue> PassageRepair::detect_diagonal_corridors(const Grid& grid) {
    std::vector<DiagonalIssue> issues;
    for (int32_t x = 0; x < grid.width(); ++x) {
        for (int32_t y = 0; y < grid.height(); ++y) {
            if (grid.get(x, y) != level::FLOOR) {
                continue;
            }
            for (const auto& dir : DIAGONALS) {
                const Point diagonal(x + dir.dx, y + dir.dy);
                if (!grid.is_floor(diagonal)) {
                    continue;
                }
                const Point horizontal(x + dir.dx, y);
                const Point vertical(x, y + dir.dy);
                if (grid.is_wall(horizontal) && grid.is_wall(vertical)) {
                    DiagonalIssue issue;
                    issue.position = Point(x, y);
                    issue.diagonal = diagonal;
                    issue.between[0] = horizontal;
                    issue.between[1] = vertical;
                    issues.push_back(issue);
                    break;
                }
            }
        }
    }
    return issues;
}

DiagonalFixResult PassageRepair::fix_diagonal_corridors(const Grid& grid) {
    const std::vector<DiagonalIssue> issues = detect_diagonal_corridors(grid);

    DiagonalFixResult result;
    result.grid = grid;
    result.issues_found = issues.size();

    for (const auto& issue : issues) {
        bool fixed = false;
        for (const auto& cell : issue.between) {
            if (result.grid.is_wall(cell) && !is_border(result.grid, cell.x, cell.y)) {
                result.grid.set(cell, CellType::Floor);
                fixed = true;
            }
        }
        if (fixed) {
            ++result.fixes_applied;
        }
    }

    CAVEGEN_LOG_DEBUG(core::log_category::ANALYSIS, "Diagonal corridors: {} issues, {} fixed", result.issues_found,
                      result.fixes_applied);
    return result;
}

Grid PassageRepair::widen_narrow_passages(const Grid& grid, int max_passes) {
    Grid current = grid;
    int passes = 0;
    size_t total_opened = 0;

    for (; passes < max_passes; ++passes) {
        Grid next = current;
        size_t opened = 0;

        auto open = [&](int32_t x, int32_t y) -> bool {
            if (is_border(next, x, y) || next.get(x, y) != level::WALL) {
                return false;
            }
            next.set(x, y, CellType::Floor);
            ++opened;
            return true;
        };

        for (int32_t y = 0; y < current.height(); ++y) {
            for (int32_t x = 0; x < current.width(); ++x) {
                if (current.get(x, y) != level::FLOOR) {
                    continue;
                }

                // Vertical pinch: walls above and below
                const bool up_blocked = !current.is_floor(x, y - 1);
                const bool down_blocked = !current.is_floor(x, y + 1);
                if (up_blocked && down_blocked) {
                    if (!open(x, y - 1)) {
                        static_cast<void>(open(x, y + 1));
                    }
                }

                // Horizontal pinch: walls left and right
                const bool left_blocked = !current.is_floor(x - 1, y);
                const bool right_blocked = !current.is_floor(x + 1, y);
                if (left_blocked && right_blocked) {
                    if (!open(x - 1, y)) {
                        static_cast<void>(open(x + 1, y));
                    }
                }
            }
        }

        current = std::move(next);
        total_opened += opened;
        if (opened == 0) {
            break;
        }
    }

    CAVEGEN_LOG_DEBUG(core::log_category::ANALYSIS, "Widened narrow passages: {} cells opened in {} passes",
                      total_opened, passes);
    return current;
}

}  // namespace cavegen::analysis
