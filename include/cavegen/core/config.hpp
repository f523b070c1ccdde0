// CaveGen Core
// config.hpp - JSON-based configuration system

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace cavegen::core {

// Sectioned generation settings with JSON file persistence.
// Values are addressed as (section, key); missing or mistyped entries fall
// back to the caller's default.
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // Entries in the file overlay the current values
    bool load(const std::filesystem::path& path);
    bool save(const std::filesystem::path& path) const;

    bool load_from_string(std::string_view json_text);
    [[nodiscard]] std::string to_string() const;

    // Typed getters with defaults
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;

    // Reset to the stock generation parameters
    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Pre-defined section names for consistency
namespace config_section {
    inline constexpr const char* GENERATION = "generation";
    inline constexpr const char* PHYSICS = "physics";
    inline constexpr const char* CONNECTIVITY = "connectivity";
    inline constexpr const char* PLACEMENT = "placement";
    inline constexpr const char* LOGGING = "logging";
}  // namespace config_section

// Pre-defined key names for consistency
namespace config_key {
    // Generation section
    inline constexpr const char* SEED = "seed";
    inline constexpr const char* WIDTH = "width";
    inline constexpr const char* HEIGHT = "height";
    inline constexpr const char* INITIAL_WALL_RATIO = "initial_wall_ratio";
    inline constexpr const char* SIMULATION_STEPS = "simulation_steps";
    inline constexpr const char* BIRTH_THRESHOLD = "birth_threshold";
    inline constexpr const char* SURVIVAL_THRESHOLD = "survival_threshold";
    inline constexpr const char* MIN_ROOM_SIZE = "min_room_size";

    // Physics section
    inline constexpr const char* JUMP_HEIGHT = "jump_height";
    inline constexpr const char* GRAVITY = "gravity";
    inline constexpr const char* TILE_SIZE = "tile_size";

    // Connectivity section
    inline constexpr const char* MAX_FALLBACK_ATTEMPTS = "max_fallback_attempts";
    inline constexpr const char* FALLBACK_TIMEOUT_MS = "fallback_timeout_ms";
    inline constexpr const char* MIN_CONNECTIVITY_SCORE = "min_connectivity_score";

    // Placement section
    inline constexpr const char* MIN_START_GOAL_DISTANCE = "min_start_goal_distance";
    inline constexpr const char* COIN_COUNT = "coin_count";
    inline constexpr const char* ENEMY_COUNT = "enemy_count";
    inline constexpr const char* TARGET_REACHABILITY = "target_reachability";

    // Logging section
    inline constexpr const char* LOG_LEVEL = "log_level";
    inline constexpr const char* LOG_TO_FILE = "log_to_file";
}  // namespace config_key

}  // namespace cavegen::core
