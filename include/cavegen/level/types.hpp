// CaveGen Level Model
// types.hpp - Cell values, grid coordinates and small geometric helpers

#pragma once

#include <glm/glm.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cavegen::level {

// ============================================================================
// Cell Values
// ============================================================================

enum class CellType : uint8_t {
    Floor = 0,
    Wall = 1
};

inline constexpr uint8_t FLOOR = 0;
inline constexpr uint8_t WALL = 1;

// First label handed out by region detection; 0 and 1 mirror FLOOR/WALL
inline constexpr int32_t FIRST_REGION_LABEL = 2;

// ============================================================================
// Coordinates (using GLM)
// ============================================================================

// Integer grid coordinate, origin top-left, y grows downward
using Point = glm::ivec2;

// 4-connected neighbourhood in up, down, left, right order
inline constexpr int CARDINAL_DX[4] = {0, 0, -1, 1};
inline constexpr int CARDINAL_DY[4] = {-1, 1, 0, 0};

// ============================================================================
// Distances
// ============================================================================

[[nodiscard]] inline int manhattan_distance(const Point& a, const Point& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

[[nodiscard]] inline double euclidean_distance(const Point& a, const Point& b) {
    const double dx = static_cast<double>(a.x - b.x);
    const double dy = static_cast<double>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

}  // namespace cavegen::level

// ============================================================================
// Hash Specializations
// ============================================================================

namespace std {

template <>
struct hash<cavegen::level::Point> {
    size_t operator()(const cavegen::level::Point& pos) const noexcept {
        size_t h1 = std::hash<int32_t>{}(pos.x);
        size_t h2 = std::hash<int32_t>{}(pos.y);
        return h1 ^ (h2 * 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

}  // namespace std

namespace cavegen::level {

using PointSet = std::unordered_set<Point>;

template <typename V>
using PointMap = std::unordered_map<Point, V>;

}  // namespace cavegen::level
