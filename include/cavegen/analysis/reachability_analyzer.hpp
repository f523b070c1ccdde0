// CaveGen Analysis
// reachability_analyzer.hpp - Physics-aware reachability over walk, jump and fall moves

#pragma once

#include <cavegen/level/grid.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace cavegen::analysis {

// ============================================================================
// Physics Configuration
// ============================================================================

struct PhysicsConfig {
    double jump_height = 800.0;  // Pixels
    double gravity = 980.0;      // Pixels per second squared
    int32_t tile_size = 64;      // Pixels per tile

    // Fractions of jump_height usable as vertical / horizontal reach
    double vertical_reach_factor = 0.3;
    double horizontal_reach_factor = 0.17;

    /// floor(jump_height * vertical_reach_factor / tile_size)
    [[nodiscard]] int32_t max_jump_rise_tiles() const;

    /// floor(floor(jump_height * horizontal_reach_factor) / tile_size)
    [[nodiscard]] int32_t max_jump_span_tiles() const;

    /// Pixels per second needed to reach the usable jump height
    [[nodiscard]] double launch_velocity() const;

    /// Throws std::invalid_argument unless jump_height, gravity and tile_size are positive
    void validate() const;
};

// ============================================================================
// Query Options and Results
// ============================================================================

struct ReachabilityOptions {
    std::optional<int32_t> max_moves;  // nullopt explores to a fixed point
    bool allow_jumps = true;           // false restricts moves to walking and falling
    const level::PointSet* blocked = nullptr;  // Impassable tiles that give no footing
};

struct ReachabilityResult {
    level::Point start{0, 0};
    level::PointSet reachable;
    std::vector<level::Point> order;  // Discovery order
    level::PointMap<int32_t> moves;   // Minimum move count per tile

    [[nodiscard]] bool contains(const level::Point& p) const { return reachable.count(p) != 0; }
    [[nodiscard]] size_t count() const { return reachable.size(); }
};

// ============================================================================
// Jump Arcs
// ============================================================================

// Tiles crossed by one projectile arc, relative to the launch tile
struct JumpArc {
    level::Point offset{0, 0};        // Landing tile relative to launch
    int32_t apex = 0;                 // Apex height in tiles above launch
    std::vector<level::Point> path;   // Intermediate tiles, start and target excluded
};

// ============================================================================
// Reachability Analyzer
// ============================================================================

// Breadth-first search over standing positions (floor with a wall directly
// below). From a standing tile the player may walk one tile sideways or jump
// to any floor tile within span/rise whose arc stays clear. Landing or
// walking onto a tile without footing adds the diagonal fall cone beneath it
// at the same move count.
//
// Arc geometry depends only on apex height and distance, not on gravity, so
// all arcs are computed once at construction.
class ReachabilityAnalyzer {
public:
    explicit ReachabilityAnalyzer(const PhysicsConfig& config = {});

    /// Throws std::invalid_argument for an out-of-bounds or wall start, or a negative max_moves
    [[nodiscard]] ReachabilityResult analyze(const level::Grid& grid, const level::Point& start,
                                             const ReachabilityOptions& options = {}) const;

    /// Re-expands `previous` (an unlimited search on the grid before `added_walls`
    /// were set) only from tiles that gained footing. The walls drop out of the
    /// result. Tiles cut off by the walls are kept, so the result is a superset
    /// of analyze() on the new grid.
    [[nodiscard]] ReachabilityResult extend(const level::Grid& grid, const ReachabilityResult& previous,
                                            const std::vector<level::Point>& added_walls) const;

    /// Single jump from a standing tile to a floor target with a clear arc
    [[nodiscard]] bool is_reachable_by_jump(const level::Grid& grid, const level::Point& from,
                                            const level::Point& to,
                                            const level::PointSet* blocked = nullptr) const;

    /// Floor tiles unreachable from every standing position on the map
    [[nodiscard]] std::vector<level::Point> detect_unreachable_areas(const level::Grid& grid) const;

    /// Reachable floor tiles over all floor tiles (1.0 with no floor)
    [[nodiscard]] double reachability_ratio(const level::Grid& grid, const level::Point& start) const;
    [[nodiscard]] static double reachability_ratio(const level::Grid& grid, const ReachabilityResult& result);

    /// Tiles reached by falling from p (p itself excluded)
    [[nodiscard]] std::vector<level::Point> fall_cone(const level::Grid& grid, const level::Point& p,
                                                      const level::PointSet* blocked = nullptr) const;

    [[nodiscard]] const PhysicsConfig& get_config() const { return config_; }
    [[nodiscard]] int32_t max_rise() const { return max_rise_; }
    [[nodiscard]] int32_t max_span() const { return max_span_; }
    [[nodiscard]] const std::vector<JumpArc>& arcs() const { return arcs_; }

private:
    struct Search;

    void build_arcs();
    [[nodiscard]] JumpArc trace_arc(int32_t dx, int32_t rise, int32_t apex) const;
    [[nodiscard]] bool arc_clear(const level::Grid& grid, const level::Point& from, const JumpArc& arc,
                                 const level::PointSet* blocked) const;

    void explore(const level::Grid& grid, Search& search, const ReachabilityOptions& options) const;

    PhysicsConfig config_;
    int32_t max_rise_ = 0;
    int32_t max_span_ = 0;
    // Grouped by offset, lowest usable apex first
    std::vector<JumpArc> arcs_;
};

// ============================================================================
// Helpers
// ============================================================================

[[nodiscard]] inline bool is_blocked(const level::PointSet* blocked, const level::Point& p) {
    return blocked != nullptr && blocked->count(p) != 0;
}

/// Floor, in bounds and not blocked
[[nodiscard]] inline bool is_passable(const level::Grid& grid, const level::Point& p,
                                      const level::PointSet* blocked) {
    return grid.is_floor(p) && !is_blocked(blocked, p);
}

/// Passable tile with an in-bounds wall directly below
[[nodiscard]] inline bool is_standing(const level::Grid& grid, const level::Point& p,
                                      const level::PointSet* blocked) {
    return is_passable(grid, p, blocked) && grid.has_footing(p);
}

}  // namespace cavegen::analysis
