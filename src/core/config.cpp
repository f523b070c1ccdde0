// CaveGen Core
// config.cpp - JSON-based configuration system implementation

#include <nlohmann/json.hpp>

#include <cavegen/core/config.hpp>
#include <cavegen/core/logger.hpp>
#include <cavegen/platform/file_io.hpp>

namespace cavegen::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;

    // Returns nullptr when the entry is missing
    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &(*key_it);
    }

    template <typename T>
    void assign(std::string_view section, std::string_view key, T&& value) {
        data[std::string(section)][std::string(key)] = std::forward<T>(value);
    }

    // Recursively overlay object members so partial files keep the defaults
    static void overlay(json& target, const json& source) {
        for (auto it = source.begin(); it != source.end(); ++it) {
            if (it->is_object() && target.contains(it.key()) && target[it.key()].is_object()) {
                overlay(target[it.key()], *it);
            } else {
                target[it.key()] = *it;
            }
        }
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        CAVEGEN_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        CAVEGEN_LOG_ERROR(log_category::CONFIG, "Config file is not a JSON object: {}", path.string());
        return false;
    }

    CAVEGEN_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::save(const std::filesystem::path& path) const {
    if (!platform::FileSystem::write_text(path, to_string() + "\n")) {
        CAVEGEN_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }
    CAVEGEN_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view json_text) {
    try {
        json parsed = json::parse(std::string(json_text));
        if (!parsed.is_object()) {
            return false;
        }
        Impl::overlay(impl_->data, parsed);
        return true;
    } catch (const json::parse_error& e) {
        CAVEGEN_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

std::string Config::to_string() const {
    return impl_->data.dump(4);
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_number_integer()) {
        return value->get<int>();
    }
    return default_value;
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_number()) {
        return value->get<double>();
    }
    return default_value;
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_boolean()) {
        return value->get<bool>();
    }
    return default_value;
}

std::string Config::get_string(std::string_view section, std::string_view key,
                               std::string_view default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_string()) {
        return value->get<std::string>();
    }
    return std::string(default_value);
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->assign(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->assign(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->assign(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::GENERATION,
                        {{config_key::SEED, "cavegen-level-1"},
                         {config_key::WIDTH, 100},
                         {config_key::HEIGHT, 60},
                         {config_key::INITIAL_WALL_RATIO, 0.45},
                         {config_key::SIMULATION_STEPS, 4},
                         {config_key::BIRTH_THRESHOLD, 5},
                         {config_key::SURVIVAL_THRESHOLD, 4},
                         {config_key::MIN_ROOM_SIZE, 50}}},
                       {config_section::PHYSICS,
                        {{config_key::JUMP_HEIGHT, 800.0}, {config_key::GRAVITY, 980.0}, {config_key::TILE_SIZE, 64}}},
                       {config_section::CONNECTIVITY,
                        {{config_key::MAX_FALLBACK_ATTEMPTS, 3},
                         {config_key::FALLBACK_TIMEOUT_MS, 5000.0},
                         {config_key::MIN_CONNECTIVITY_SCORE, 1.0}}},
                       {config_section::PLACEMENT,
                        {{config_key::MIN_START_GOAL_DISTANCE, 40},
                         {config_key::COIN_COUNT, 15},
                         {config_key::ENEMY_COUNT, 5},
                         {config_key::TARGET_REACHABILITY, 0.7}}},
                       {config_section::LOGGING, {{config_key::LOG_LEVEL, "info"}, {config_key::LOG_TO_FILE, false}}}};
}

}  // namespace cavegen::core
