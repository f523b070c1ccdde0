// CaveGen CLI
// main.cpp - Entry point

#include <cavegen/core/config.hpp>
#include <cavegen/core/core.hpp>
#include <cavegen/core/logger.hpp>
#include <cavegen/pipeline/level_exporter.hpp>
#include <cavegen/pipeline/level_generator.hpp>
#include <cavegen/pipeline/parameter_validator.hpp>
#include <cavegen/platform/timer.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using namespace cavegen;

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_GENERATION = 1;
constexpr int EXIT_USAGE = 2;

// Raised for malformed command lines
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct GenerateOptions {
    std::optional<std::string> config_path;
    std::string output = "level.json";
    bool verbose = false;

    // Command-line overrides, applied on top of the config file
    std::optional<std::string> seed;
    std::optional<int32_t> width;
    std::optional<int32_t> height;
    std::optional<double> initial_wall_ratio;
    std::optional<int32_t> simulation_steps;
    std::optional<int32_t> birth_threshold;
    std::optional<int32_t> survival_threshold;
    std::optional<int32_t> min_room_size;
    std::optional<int32_t> min_start_goal_distance;
    std::optional<int32_t> coin_count;
    std::optional<int32_t> enemy_count;
};

template <typename T>
T parse_number(std::string_view flag, std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        throw UsageError(fmt::format("Invalid value '{}' for {}", text, flag));
    }
    return value;
}

GenerateOptions parse_generate(const std::vector<std::string_view>& args) {
    GenerateOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view flag = args[i];
        if (flag == "--verbose" || flag == "-v") {
            options.verbose = true;
            continue;
        }
        if (i + 1 >= args.size()) {
            throw UsageError(fmt::format("Missing value for {}", flag));
        }
        const std::string_view value = args[++i];

        if (flag == "--seed" || flag == "-s") {
            options.seed = std::string(value);
        } else if (flag == "--width" || flag == "-w") {
            options.width = parse_number<int32_t>(flag, value);
        } else if (flag == "--height" || flag == "-h") {
            options.height = parse_number<int32_t>(flag, value);
        } else if (flag == "--initial-wall-ratio") {
            options.initial_wall_ratio = parse_number<double>(flag, value);
        } else if (flag == "--simulation-steps") {
            options.simulation_steps = parse_number<int32_t>(flag, value);
        } else if (flag == "--birth-threshold") {
            options.birth_threshold = parse_number<int32_t>(flag, value);
        } else if (flag == "--survival-threshold") {
            options.survival_threshold = parse_number<int32_t>(flag, value);
        } else if (flag == "--min-room-size") {
            options.min_room_size = parse_number<int32_t>(flag, value);
        } else if (flag == "--min-start-goal-distance") {
            options.min_start_goal_distance = parse_number<int32_t>(flag, value);
        } else if (flag == "--coin-count") {
            options.coin_count = parse_number<int32_t>(flag, value);
        } else if (flag == "--enemy-count") {
            options.enemy_count = parse_number<int32_t>(flag, value);
        } else if (flag == "--config") {
            options.config_path = std::string(value);
        } else if (flag == "--output" || flag == "-o") {
            options.output = std::string(value);
        } else {
            throw UsageError(fmt::format("Unknown option '{}'", flag));
        }
    }
    return options;
}

template <typename T, typename Setter>
void apply(const std::optional<T>& value, Setter&& set) {
    if (value) {
        set(*value);
    }
}

// Writes command-line overrides into the config so generate and config agree
void apply_overrides(const GenerateOptions& options, core::Config& config) {
    namespace section = core::config_section;
    namespace key = core::config_key;
    const auto set_int = [&config](const char* group, const char* name) {
        return [&config, group, name](int32_t value) { config.set_int(group, name, value); };
    };

    apply(options.seed, [&config](const std::string& value) {
        config.set_string(section::GENERATION, key::SEED, value);
    });
    apply(options.width, set_int(section::GENERATION, key::WIDTH));
    apply(options.height, set_int(section::GENERATION, key::HEIGHT));
    apply(options.initial_wall_ratio, [&config](double value) {
        config.set_double(section::GENERATION, key::INITIAL_WALL_RATIO, value);
    });
    apply(options.simulation_steps, set_int(section::GENERATION, key::SIMULATION_STEPS));
    apply(options.birth_threshold, set_int(section::GENERATION, key::BIRTH_THRESHOLD));
    apply(options.survival_threshold, set_int(section::GENERATION, key::SURVIVAL_THRESHOLD));
    apply(options.min_room_size, set_int(section::GENERATION, key::MIN_ROOM_SIZE));
    apply(options.min_start_goal_distance, set_int(section::PLACEMENT, key::MIN_START_GOAL_DISTANCE));
    apply(options.coin_count, set_int(section::PLACEMENT, key::COIN_COUNT));
    apply(options.enemy_count, set_int(section::PLACEMENT, key::ENEMY_COUNT));
}

bool load_config(const GenerateOptions& options, core::Config& config) {
    if (options.config_path && !config.load(*options.config_path)) {
        std::fprintf(stderr, "Error: could not load config file '%s'\n", options.config_path->c_str());
        return false;
    }
    apply_overrides(options, config);
    return true;
}

void print_help() {
    std::printf(
        "CaveGen - procedural platformer cave levels\n"
        "\n"
        "USAGE:\n"
        "  cavegen generate [options]\n"
        "  cavegen config [options]           Print the effective config, or save it with --output\n"
        "  cavegen help\n"
        "  cavegen version\n"
        "\n"
        "OPTIONS:\n"
        "  -s, --seed <text>                  Random seed (default: cavegen-level-1)\n"
        "  -w, --width <tiles>                Level width, 50-200 (default: 100)\n"
        "  -h, --height <tiles>               Level height, 30-120 (default: 60)\n"
        "      --initial-wall-ratio <ratio>   0.4-0.55 (default: 0.45)\n"
        "      --simulation-steps <n>         3-6 (default: 4)\n"
        "      --birth-threshold <n>          4-6 (default: 5)\n"
        "      --survival-threshold <n>       2-4 (default: 4)\n"
        "      --min-room-size <tiles>        20-100 (default: 50)\n"
        "      --min-start-goal-distance <n>  30-100 (default: 40)\n"
        "      --coin-count <n>               10-30 (default: 15)\n"
        "      --enemy-count <n>              3-10 (default: 5)\n"
        "      --config <file.json>           Load settings from a config file\n"
        "  -o, --output <file.json>           Output path (default: level.json)\n"
        "  -v, --verbose                      Log every stage\n"
        "\n"
        "EXAMPLES:\n"
        "  cavegen generate --seed my-level-1\n"
        "  cavegen generate --seed complex-cave --width 150 --height 80 --verbose\n"
        "  cavegen config --width 150 --coin-count 25 --output wide.json\n");
}

int run_config(const GenerateOptions& options, bool has_output) {
    core::LoggerConfig log_config;
    log_config.console_level = options.verbose ? core::LogLevel::Debug : core::LogLevel::Warn;
    core::Logger::initialize(log_config);

    core::Config config;
    int exit_code = EXIT_OK;
    if (!load_config(options, config)) {
        exit_code = EXIT_FAILURE_GENERATION;
    } else if (!has_output) {
        std::printf("%s\n", config.to_string().c_str());
    } else if (!config.save(options.output)) {
        std::fprintf(stderr, "Error writing config file '%s'\n", options.output.c_str());
        exit_code = EXIT_FAILURE_GENERATION;
    } else {
        std::printf("Config saved to %s\n", options.output.c_str());
    }

    core::Logger::shutdown();
    return exit_code;
}

int run_generate(const GenerateOptions& options) {
    core::Config config;
    if (!load_config(options, config)) {
        return EXIT_FAILURE_GENERATION;
    }

    core::LoggerConfig log_config;
    log_config.console_level =
        options.verbose ? core::LogLevel::Debug
                        : core::parse_log_level(
                              config.get_string(core::config_section::LOGGING, core::config_key::LOG_LEVEL, "info"));
    log_config.file_output = config.get_bool(core::config_section::LOGGING, core::config_key::LOG_TO_FILE, false);
    core::Logger::initialize(log_config);
    if (const auto log_file = core::Logger::log_file(); !log_file.empty()) {
        CAVEGEN_LOG_INFO(core::log_category::CLI, "Writing log to {}", log_file.string());
    }
    if (options.config_path) {
        CAVEGEN_LOG_DEBUG(core::log_category::CLI, "Using config file: {}", *options.config_path);
    }

    platform::Timer timer;
    int exit_code = EXIT_OK;
    try {
        const pipeline::GenerationParameters params = pipeline::ParameterValidator::from_config(config);
        const pipeline::LevelGenerator generator(pipeline::LevelGenerator::settings_from_config(config));

        const auto result = generator.generate(params);
        if (!result) {
            std::fprintf(stderr, "Generation Error: %s\n", result.error.c_str());
            exit_code = EXIT_FAILURE_GENERATION;
        } else if (!pipeline::LevelExporter::write(result.get(), options.output)) {
            std::fprintf(stderr, "Error writing output file '%s'\n", options.output.c_str());
            exit_code = EXIT_FAILURE_GENERATION;
        } else {
            std::printf("Generation completed in %.0f ms\n", timer.elapsed_milliseconds());
            std::printf("Level saved to %s\n", options.output.c_str());
        }
    } catch (const pipeline::ValidationError& e) {
        std::fprintf(stderr, "Validation Error: %s\n", e.detailed_message().c_str());
        exit_code = EXIT_FAILURE_GENERATION;
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "Configuration Error: %s\n", e.what());
        exit_code = EXIT_FAILURE_GENERATION;
    }

    core::Logger::shutdown();
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string_view> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_help();
        return EXIT_USAGE;
    }

    const std::string_view command = args.front();
    if (command == "help" || command == "--help") {
        print_help();
        return EXIT_OK;
    }
    if (command == "version" || command == "--version") {
        std::printf("CaveGen v%s\n", cavegen::core::VERSION);
        return EXIT_OK;
    }
    if (command != "generate" && command != "config") {
        std::fprintf(stderr, "Unknown command '%.*s'\n\n", static_cast<int>(command.size()), command.data());
        print_help();
        return EXIT_USAGE;
    }

    const std::vector<std::string_view> flags(args.begin() + 1, args.end());
    GenerateOptions options;
    try {
        options = parse_generate(flags);
    } catch (const UsageError& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return EXIT_USAGE;
    }
    if (command == "config") {
        const bool has_output = std::any_of(flags.begin(), flags.end(), [](std::string_view flag) {
            return flag == "--output" || flag == "-o";
        });
        return run_config(options, has_output);
    }
    return run_generate(options);
}
