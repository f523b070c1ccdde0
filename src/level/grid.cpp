// CaveGen Level Model
// grid.cpp - Dense floor/wall grid implementation

#include <cavegen/level/grid.hpp>

#include <algorithm>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace cavegen::level {

Grid::Grid(int32_t width, int32_t height, CellType fill) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument(fmt::format("Grid dimensions must be positive, got {}x{}", width, height));
    }
    cells_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), static_cast<uint8_t>(fill));
}

Grid Grid::from_rows(const std::vector<std::vector<int>>& rows) {
    if (rows.empty() || rows.front().empty()) {
        throw std::invalid_argument("Grid rows must be non-empty");
    }

    const auto width = static_cast<int32_t>(rows.front().size());
    const auto height = static_cast<int32_t>(rows.size());
    Grid grid(width, height);

    for (int32_t y = 0; y < height; ++y) {
        const auto& row = rows[static_cast<size_t>(y)];
        if (static_cast<int32_t>(row.size()) != width) {
            throw std::invalid_argument(
                fmt::format("Grid row {} has {} cells, expected {}", y, row.size(), width));
        }
        for (int32_t x = 0; x < width; ++x) {
            const int value = row[static_cast<size_t>(x)];
            if (value != FLOOR && value != WALL) {
                throw std::invalid_argument(fmt::format("Invalid cell value {} at ({}, {})", value, x, y));
            }
            grid.set(x, y, static_cast<CellType>(value));
        }
    }
    return grid;
}

Grid Grid::from_rows(std::initializer_list<std::initializer_list<int>> rows) {
    std::vector<std::vector<int>> converted;
    converted.reserve(rows.size());
    for (const auto& row : rows) {
        converted.emplace_back(row);
    }
    return from_rows(converted);
}

size_t Grid::count(CellType value) const {
    const auto raw = static_cast<uint8_t>(value);
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), raw));
}

double Grid::wall_ratio() const {
    if (cells_.empty()) {
        return 0.0;
    }
    return static_cast<double>(wall_count()) / static_cast<double>(cells_.size());
}

std::vector<Point> Grid::floor_cells() const {
    std::vector<Point> result;
    for (int32_t y = 0; y < height_; ++y) {
        for (int32_t x = 0; x < width_; ++x) {
            if (get(x, y) == FLOOR) {
                result.emplace_back(x, y);
            }
        }
    }
    return result;
}

std::string Grid::to_ascii() const {
    std::string out;
    out.reserve(static_cast<size_t>(width_ + 1) * static_cast<size_t>(height_));
    for (int32_t y = 0; y < height_; ++y) {
        for (int32_t x = 0; x < width_; ++x) {
            out += get(x, y) == WALL ? '#' : '.';
        }
        out += '\n';
    }
    return out;
}

// ============================================================================
// Grid Utilities
// ============================================================================

int count_wall_neighbors(const Grid& grid, int32_t x, int32_t y) {
    int walls = 0;
    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            if (dx == 0 && dy == 0) {
                continue;
            }
            const int32_t nx = x + dx;
            const int32_t ny = y + dy;
            if (!grid.in_bounds(nx, ny) || grid.get(nx, ny) == WALL) {
                ++walls;
            }
        }
    }
    return walls;
}

int count_floor_cardinal_neighbors(const Grid& grid, int32_t x, int32_t y) {
    int floors = 0;
    for (int i = 0; i < 4; ++i) {
        if (grid.is_floor(x + CARDINAL_DX[i], y + CARDINAL_DY[i])) {
            ++floors;
        }
    }
    return floors;
}

Grid with_walls(const Grid& grid, const std::vector<Point>& points) {
    Grid result = grid;
    for (const auto& p : points) {
        if (result.in_bounds(p)) {
            result.set(p, CellType::Wall);
        }
    }
    return result;
}

void require_same_shape(const Grid& a, const Grid& b, const char* context) {
    if (!a.same_shape(b)) {
        throw std::logic_error(fmt::format("{}: grid shape mismatch ({}x{} vs {}x{})", context, a.width(),
                                           a.height(), b.width(), b.height()));
    }
}

}  // namespace cavegen::level
