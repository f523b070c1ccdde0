// CaveGen Placement
// placer.cpp - Placement context checks

#include <cavegen/placement/placer.hpp>

#include <stdexcept>

namespace cavegen::placement {

const level::Grid& PlacementContext::require_grid() const {
    if (grid == nullptr) {
        throw std::invalid_argument("Placement context has no grid");
    }
    return *grid;
}

const Point& PlacementContext::require_spawn() const {
    if (!spawn) {
        throw std::invalid_argument("Placement context has no spawn position");
    }
    return *spawn;
}

}  // namespace cavegen::placement
