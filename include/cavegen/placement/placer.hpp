// CaveGen Placement
// placer.hpp - Common interface for attempt-bounded placers

#pragma once

#include "types.hpp"

#include <cavegen/core/random.hpp>
#include <cavegen/core/result.hpp>
#include <cavegen/level/grid.hpp>

#include <optional>
#include <vector>

namespace cavegen::placement {

// Everything already decided about the level when a placer runs
struct PlacementContext {
    const level::Grid* grid = nullptr;
    std::optional<Point> spawn;
    std::optional<Point> goal;
    std::vector<Coin> coins;
    std::vector<Platform> platforms;
    level::PointSet forbidden;

    [[nodiscard]] const level::Grid& require_grid() const;
    [[nodiscard]] const Point& require_spawn() const;
};

// Placers report exhaustion through Result and throw std::invalid_argument
// only for bad configuration or missing context.
template <typename T>
class Placer {
public:
    virtual ~Placer() = default;

    /// True when p is an acceptable position for this placer on the grid
    [[nodiscard]] virtual bool validate(const level::Grid& grid, const Point& p) const = 0;

    [[nodiscard]] virtual core::Result<T> place(const PlacementContext& context, core::RandomSource& rng) = 0;
};

}  // namespace cavegen::placement
