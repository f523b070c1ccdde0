// CaveGen Pipeline
// level_exporter.cpp - JSON document for a generated level

#include <cavegen/core/logger.hpp>
#include <cavegen/pipeline/level_exporter.hpp>
#include <cavegen/platform/file_io.hpp>

#include <string>

namespace cavegen::pipeline {

using json = nlohmann::json;

namespace {

json point_to_json(const level::Point& p) {
    return json{{"x", p.x}, {"y", p.y}};
}

}  // namespace

json LevelExporter::grid_to_json(const level::Grid& grid) {
    json rows = json::array();
    for (int32_t y = 0; y < grid.height(); ++y) {
        json row = json::array();
        for (int32_t x = 0; x < grid.width(); ++x) {
            row.push_back(static_cast<int>(grid.get(x, y)));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

json LevelExporter::stats_to_json(const GenerationStats& stats) {
    json timings = json::object();
    for (const auto& timing : stats.timings) {
        timings[timing.stage] = timing.milliseconds;
    }

    json out = {{"regions_detected", stats.regions_detected},
                {"regions_culled", stats.regions_culled},
                {"connectivity_score", stats.connectivity_score},
                {"connectivity_attempts", stats.connectivity_attempts},
                {"connectivity_fallback_applied", stats.connectivity_fallback_applied},
                {"diagonal_fixes", stats.diagonal_fixes},
                {"floor_ratio", stats.floor_ratio},
                {"spawn_fallback_used", stats.spawn_fallback_used},
                {"initial_reachability", stats.initial_reachability},
                {"final_reachability", stats.final_reachability},
                {"platform_iterations", stats.platform_iterations},
                {"reachability_target_met", stats.reachability_target_met},
                {"goal_fallback_used", stats.goal_fallback_used},
                {"goal_distance", stats.goal_distance},
                {"enemy_target", stats.enemy_target},
                {"timings_ms", std::move(timings)},
                {"total_ms", stats.total_milliseconds}};
    if (!stats.coin_error.empty()) {
        out["coin_error"] = stats.coin_error;
    }
    return out;
}

json LevelExporter::to_json(const LevelResult& result) {
    json coins = json::array();
    for (const auto& coin : result.coins) {
        coins.push_back(
            {{"x", coin.position.x}, {"y", coin.position.y}, {"category", std::string(placement::to_string(coin.category))}});
    }

    json platforms = json::array();
    for (const auto& platform : result.platforms) {
        platforms.push_back({{"x", platform.x},
                             {"y", platform.y},
                             {"width", platform.width},
                             {"height", platform.height},
                             {"type", std::string(placement::to_string(platform.type))}});
    }

    json enemies = json::array();
    for (const auto& enemy : result.enemies) {
        enemies.push_back({{"x", enemy.position.x},
                           {"y", enemy.position.y},
                           {"type", enemy.type},
                           {"patrol_distance", enemy.patrol_distance},
                           {"direction", enemy.direction},
                           {"speed", enemy.speed},
                           {"placement", std::string(placement::to_string(enemy.placement))}});
    }

    return json{{"width", result.grid.width()},
                {"height", result.grid.height()},
                {"seed", result.params.seed},
                {"tile_size", result.tile_size},
                {"grid", grid_to_json(result.grid)},
                {"spawn", point_to_json(result.spawn)},
                {"goal", point_to_json(result.goal)},
                {"coins", std::move(coins)},
                {"platforms", std::move(platforms)},
                {"enemies", std::move(enemies)},
                {"stats", stats_to_json(result.stats)}};
}

bool LevelExporter::write(const LevelResult& result, const std::filesystem::path& path) {
    // write_text creates missing parent directories
    if (!platform::FileSystem::write_text(path, to_json(result).dump(2))) {
        CAVEGEN_LOG_ERROR(core::log_category::PIPELINE, "Failed to write level to: {}", path.string());
        return false;
    }

    CAVEGEN_LOG_INFO(core::log_category::PIPELINE, "Level written to: {}", path.string());
    return true;
}

}  // namespace cavegen::pipeline
