// CaveGen Placement
// types.hpp - Entities placed into a generated level

#pragma once

#include <cavegen/level/types.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cavegen::placement {

using level::Point;

// ============================================================================
// Platforms
// ============================================================================

enum class PlatformType : uint8_t {
    Floating,
    Moving
};

struct Platform {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 1;
    int32_t height = 1;
    PlatformType type = PlatformType::Floating;

    /// Tiles (x + i, y) for i in [0, width)
    [[nodiscard]] std::vector<Point> occupied_tiles() const {
        std::vector<Point> tiles;
        tiles.reserve(static_cast<size_t>(width));
        for (int32_t i = 0; i < width; ++i) {
            tiles.emplace_back(x + i, y);
        }
        return tiles;
    }

    [[nodiscard]] bool covers(const Point& p) const { return p.y == y && p.x >= x && p.x < x + width; }
};

// ============================================================================
// Coins
// ============================================================================

enum class CoinCategory : uint8_t {
    DeadEnd,
    Exploration,
    Unreachable,
    General
};

struct Coin {
    Point position{0, 0};
    CoinCategory category = CoinCategory::General;
};

// ============================================================================
// Enemies
// ============================================================================

enum class EnemyPlacementType : uint8_t {
    ChokePoint,
    Strategic,
    Patrol,
    Platform
};

inline constexpr const char* DEFAULT_ENEMY_TYPE = "LoopHound";

struct Enemy {
    Point position{0, 0};
    std::string type = DEFAULT_ENEMY_TYPE;
    int32_t patrol_distance = 50;  // Pixels, 50-500
    int32_t direction = 1;         // +1 or -1
    int32_t speed = 10;            // Pixels per second, 10-200
    EnemyPlacementType placement = EnemyPlacementType::Patrol;
};

// ============================================================================
// Names
// ============================================================================

[[nodiscard]] std::string_view to_string(PlatformType type);
[[nodiscard]] std::string_view to_string(CoinCategory category);
[[nodiscard]] std::string_view to_string(EnemyPlacementType type);

/// Priority used to rank enemy candidates (choke 4, strategic 3, patrol 2, platform 1)
[[nodiscard]] int32_t placement_priority(EnemyPlacementType type);

}  // namespace cavegen::placement
