// CaveGen Placement
// types.cpp - Entity names and priorities

#include <cavegen/placement/types.hpp>

namespace cavegen::placement {

std::string_view to_string(PlatformType type) {
    switch (type) {
        case PlatformType::Floating:
            return "floating";
        case PlatformType::Moving:
            return "moving";
    }
    return "unknown";
}

std::string_view to_string(CoinCategory category) {
    switch (category) {
        case CoinCategory::DeadEnd:
            return "dead_end";
        case CoinCategory::Exploration:
            return "exploration";
        case CoinCategory::Unreachable:
            return "unreachable";
        case CoinCategory::General:
            return "general";
    }
    return "unknown";
}

std::string_view to_string(EnemyPlacementType type) {
    switch (type) {
        case EnemyPlacementType::ChokePoint:
            return "choke_point";
        case EnemyPlacementType::Strategic:
            return "strategic";
        case EnemyPlacementType::Patrol:
            return "patrol";
        case EnemyPlacementType::Platform:
            return "platform";
    }
    return "unknown";
}

int32_t placement_priority(EnemyPlacementType type) {
    switch (type) {
        case EnemyPlacementType::ChokePoint:
            return 4;
        case EnemyPlacementType::Strategic:
            return 3;
        case EnemyPlacementType::Patrol:
            return 2;
        case EnemyPlacementType::Platform:
            return 1;
    }
    return 0;
}

}  // namespace cavegen::placement
