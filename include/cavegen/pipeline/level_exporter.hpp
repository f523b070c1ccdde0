// CaveGen Pipeline
// level_exporter.hpp - JSON document for a generated level

#pragma once

#include "level_generator.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace cavegen::pipeline {

// Coordinates are in tiles; tile_size converts them to pixels.
class LevelExporter {
public:
    /// {width, height, seed, tile_size, grid, spawn, goal, coins, platforms, enemies, stats}
    [[nodiscard]] static nlohmann::json to_json(const LevelResult& result);

    /// Grid rows of 0 (floor) and 1 (wall)
    [[nodiscard]] static nlohmann::json grid_to_json(const level::Grid& grid);

    [[nodiscard]] static nlohmann::json stats_to_json(const GenerationStats& stats);

    /// Pretty-printed document written through FileSystem, creating parent directories
    static bool write(const LevelResult& result, const std::filesystem::path& path);

private:
    LevelExporter() = delete;
};

}  // namespace cavegen::pipeline
