// CaveGen Level Model
// grid.hpp - Dense floor/wall grid shared by every pipeline stage

#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace cavegen::level {

// ============================================================================
// Grid
// ============================================================================

// Row-major width x height array of FLOOR/WALL cells. A Grid is a value:
// copies are deep, so stages hand back fresh grids instead of editing input.
class Grid {
public:
    Grid() = default;

    /// Filled grid; throws std::invalid_argument on non-positive dimensions
    Grid(int32_t width, int32_t height, CellType fill = CellType::Floor);

    /// Build from rows of 0/1 values (rows[y][x]); rows must be rectangular
    [[nodiscard]] static Grid from_rows(const std::vector<std::vector<int>>& rows);
    [[nodiscard]] static Grid from_rows(std::initializer_list<std::initializer_list<int>> rows);

    [[nodiscard]] int32_t width() const { return width_; }
    [[nodiscard]] int32_t height() const { return height_; }
    [[nodiscard]] size_t size() const { return cells_.size(); }
    [[nodiscard]] bool empty() const { return cells_.empty(); }

    [[nodiscard]] bool in_bounds(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
    [[nodiscard]] bool in_bounds(const Point& p) const { return in_bounds(p.x, p.y); }

    /// Unchecked access; callers guarantee in_bounds
    [[nodiscard]] uint8_t get(int32_t x, int32_t y) const { return cells_[index(x, y)]; }
    [[nodiscard]] uint8_t get(const Point& p) const { return get(p.x, p.y); }

    void set(int32_t x, int32_t y, CellType value) { cells_[index(x, y)] = static_cast<uint8_t>(value); }
    void set(const Point& p, CellType value) { set(p.x, p.y, value); }

    /// In-bounds floor cell
    [[nodiscard]] bool is_floor(int32_t x, int32_t y) const { return in_bounds(x, y) && get(x, y) == FLOOR; }
    [[nodiscard]] bool is_floor(const Point& p) const { return is_floor(p.x, p.y); }

    /// In-bounds wall cell (out of bounds is not a wall here)
    [[nodiscard]] bool is_wall(int32_t x, int32_t y) const { return in_bounds(x, y) && get(x, y) == WALL; }
    [[nodiscard]] bool is_wall(const Point& p) const { return is_wall(p.x, p.y); }

    /// Floor cell with an in-bounds wall directly below
    [[nodiscard]] bool has_footing(int32_t x, int32_t y) const { return is_floor(x, y) && is_wall(x, y + 1); }
    [[nodiscard]] bool has_footing(const Point& p) const { return has_footing(p.x, p.y); }

    [[nodiscard]] size_t count(CellType value) const;
    [[nodiscard]] size_t floor_count() const { return count(CellType::Floor); }
    [[nodiscard]] size_t wall_count() const { return count(CellType::Wall); }
    [[nodiscard]] double wall_ratio() const;

    /// Row-major list of every floor cell
    [[nodiscard]] std::vector<Point> floor_cells() const;

    [[nodiscard]] bool same_shape(const Grid& other) const {
        return width_ == other.width_ && height_ == other.height_;
    }

    [[nodiscard]] const std::vector<uint8_t>& cells() const { return cells_; }

    /// '#' for walls, '.' for floor, one line per row
    [[nodiscard]] std::string to_ascii() const;

    bool operator==(const Grid& other) const = default;

private:
    [[nodiscard]] size_t index(int32_t x, int32_t y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }

    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<uint8_t> cells_;
};

// ============================================================================
// Grid Utilities
// ============================================================================

/// Number of wall cells among the 8 neighbours; out-of-bounds counts as wall
[[nodiscard]] int count_wall_neighbors(const Grid& grid, int32_t x, int32_t y);

/// Number of in-bounds floor cells among the 4 cardinal neighbours
[[nodiscard]] int count_floor_cardinal_neighbors(const Grid& grid, int32_t x, int32_t y);

/// Copy of the grid with the given points turned into walls (out-of-bounds skipped)
[[nodiscard]] Grid with_walls(const Grid& grid, const std::vector<Point>& points);

/// Throws std::logic_error when two grids that must share a shape do not
void require_same_shape(const Grid& a, const Grid& b, const char* context);

}  // namespace cavegen::level
