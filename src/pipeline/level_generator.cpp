// CaveGen Pipeline
// level_generator.cpp - End-to-end generation of a solvable cave level

#include <cavegen/analysis/passage_repair.hpp>
#include <cavegen/analysis/region_detector.hpp>
#include <cavegen/core/logger.hpp>
#include <cavegen/core/random.hpp>
#include <cavegen/generation/cellular_automata.hpp>
#include <cavegen/generation/grid_seeder.hpp>
#include <cavegen/pipeline/level_generator.hpp>
#include <cavegen/placement/enemy_placer.hpp>
#include <cavegen/placement/goal_placer.hpp>
#include <cavegen/placement/platform_placer.hpp>
#include <cavegen/placement/reachable_coin_placer.hpp>
#include <cavegen/placement/spawn_placer.hpp>
#include <cavegen/platform/timer.hpp>

#include <stdexcept>
#include <utility>

namespace cavegen::pipeline {

namespace {

// Records the time since the previous mark under the given stage name
class StageClock {
public:
    explicit StageClock(GenerationStats& stats) : stats_(stats) {}

    void mark(const char* stage) {
        const double ms = stage_timer_.elapsed_milliseconds();
        stats_.timings.push_back({stage, ms});
        CAVEGEN_LOG_TRACE(core::log_category::PIPELINE, "Stage '{}' took {:.2f} ms", stage, ms);
        stage_timer_.reset();
    }

    void finish() { stats_.total_milliseconds = total_timer_.elapsed_milliseconds(); }

private:
    GenerationStats& stats_;
    platform::Timer stage_timer_;
    platform::Timer total_timer_;
};

core::Result<LevelResult> stage_failure(const char* stage, const std::string& error) {
    auto message = fmt::format("{} failed: {}", stage, error);
    CAVEGEN_LOG_ERROR(core::log_category::PIPELINE, "{}", message);
    return core::Result<LevelResult>::fail(std::move(message));
}

level::PointSet spawn_window(const level::Grid& grid, const level::Point& spawn, int32_t radius) {
    level::PointSet window;
    for (int32_t dy = -radius; dy <= radius; ++dy) {
        for (int32_t dx = -radius; dx <= radius; ++dx) {
            if (grid.in_bounds(spawn.x + dx, spawn.y + dy)) {
                window.emplace(spawn.x + dx, spawn.y + dy);
            }
        }
    }
    return window;
}

}  // namespace

level::Grid LevelResult::grid_with_platforms() const {
    std::vector<level::Point> tiles;
    for (const auto& platform : platforms) {
        const auto occupied = platform.occupied_tiles();
        tiles.insert(tiles.end(), occupied.begin(), occupied.end());
    }
    return level::with_walls(grid, tiles);
}

LevelGenerator::LevelGenerator(const GeneratorSettings& settings) : settings_(settings) {
    settings_.physics.validate();
    if (settings_.target_reachability < 0.0 || settings_.target_reachability > 1.0) {
        throw std::invalid_argument(
            fmt::format("target_reachability must be within [0, 1], got {}", settings_.target_reachability));
    }
    if (settings_.spawn_forbidden_radius < 0) {
        throw std::invalid_argument("spawn_forbidden_radius must be non-negative");
    }
}

GeneratorSettings LevelGenerator::settings_from_config(const core::Config& config) {
    namespace section = core::config_section;
    namespace key = core::config_key;

    GeneratorSettings settings;
    settings.physics.jump_height = config.get_double(section::PHYSICS, key::JUMP_HEIGHT, settings.physics.jump_height);
    settings.physics.gravity = config.get_double(section::PHYSICS, key::GRAVITY, settings.physics.gravity);
    settings.physics.tile_size = config.get_int(section::PHYSICS, key::TILE_SIZE, settings.physics.tile_size);

    settings.connectivity.max_fallback_attempts = config.get_int(
        section::CONNECTIVITY, key::MAX_FALLBACK_ATTEMPTS, settings.connectivity.max_fallback_attempts);
    settings.connectivity.fallback_timeout_ms = config.get_double(
        section::CONNECTIVITY, key::FALLBACK_TIMEOUT_MS, settings.connectivity.fallback_timeout_ms);
    settings.connectivity.min_connectivity_score = config.get_double(
        section::CONNECTIVITY, key::MIN_CONNECTIVITY_SCORE, settings.connectivity.min_connectivity_score);

    settings.target_reachability =
        config.get_double(section::PLACEMENT, key::TARGET_REACHABILITY, settings.target_reachability);
    return settings;
}

core::Result<LevelResult> LevelGenerator::generate(const GenerationParameters& params) const {
    ParameterValidator::validate_all(params);

    LevelResult level;
    level.params = params;
    level.tile_size = settings_.physics.tile_size;
    GenerationStats& stats = level.stats;
    StageClock clock(stats);

    CAVEGEN_LOG_INFO(core::log_category::PIPELINE, "Generating {}x{} level with seed '{}'", params.width,
                     params.height, params.seed);

    // ------------------------------------------------------------------------
    // Cave shape
    // ------------------------------------------------------------------------

    core::SeededRandom rng(params.seed);
    level::Grid grid =
        generation::GridSeeder::seed_grid({params.width, params.height, params.initial_wall_ratio}, rng);
    clock.mark("seed");

    grid = generation::CellularAutomata::simulate(
        grid, {params.simulation_steps, params.birth_threshold, params.survival_threshold});
    clock.mark("cellular_automata");

    grid = generation::CellularAutomata::enclose_borders(grid);
    clock.mark("enclose_borders");

    const analysis::RegionDetection detection = analysis::RegionDetector::detect_regions(grid);
    stats.regions_detected = detection.region_count();
    if (detection.region_count() == 0) {
        return stage_failure("Region detection", "cave contains no floor tiles");
    }
    grid = analysis::cull_small_regions(grid, detection, static_cast<size_t>(params.min_room_size));
    const analysis::RegionDetection culled = analysis::RegionDetector::detect_regions(grid);
    stats.regions_culled = stats.regions_detected - culled.region_count();
    clock.mark("regions");

    // ------------------------------------------------------------------------
    // Connectivity
    // ------------------------------------------------------------------------

    analysis::ConnectivityValidator validator(settings_.connectivity);
    core::SeededRandom corridor_rng = rng.derive("corridors");
    analysis::FallbackResult connectivity = validator.validate_connectivity_with_fallback(grid, corridor_rng);
    stats.connectivity_score = connectivity.score;
    stats.connectivity_attempts = connectivity.attempts;
    stats.connectivity_fallback_applied = connectivity.fallback_applied;
    if (!connectivity.success) {
        return stage_failure("Connectivity", connectivity.error);
    }
    // Corridors clamped at the edge can open border cells
    grid = generation::CellularAutomata::enclose_borders(connectivity.grid);
    clock.mark("connectivity");

    analysis::DiagonalFixResult diagonals = analysis::PassageRepair::fix_diagonal_corridors(grid);
    stats.diagonal_fixes = diagonals.fixes_applied;
    grid = analysis::PassageRepair::widen_narrow_passages(diagonals.grid);
    stats.floor_ratio = 1.0 - grid.wall_ratio();
    clock.mark("passage_repair");

    // ------------------------------------------------------------------------
    // Placement
    // ------------------------------------------------------------------------

    const analysis::ReachabilityAnalyzer analyzer(settings_.physics);

    placement::SpawnPlacerConfig spawn_config;
    spawn_config.left_side_boundary = settings_.spawn_left_boundary;
    const placement::SpawnPlacer spawn_placer(spawn_config);
    core::SeededRandom spawn_rng = rng.derive("spawn");
    const auto spawn = spawn_placer.place(grid, spawn_rng);
    if (!spawn) {
        return stage_failure("Spawn placement", spawn.error);
    }
    level.spawn = spawn.get().position;
    stats.spawn_fallback_used = spawn.get().fallback_used;
    clock.mark("spawn");

    placement::PlatformPlacerConfig platform_config;
    platform_config.target_reachability = settings_.target_reachability;
    const placement::PlatformPlacer platform_placer(analyzer, platform_config);
    core::SeededRandom platform_rng = rng.derive("platforms");
    auto platforms = platform_placer.place_platforms(
        grid, level.spawn, spawn_window(grid, level.spawn, settings_.spawn_forbidden_radius), platform_rng);
    if (!platforms) {
        return stage_failure("Platform placement", platforms.error);
    }
    placement::PlatformPlacementResult& placed = platforms.get();
    stats.initial_reachability = placed.initial_ratio;
    stats.final_reachability = placed.final_ratio;
    stats.platform_iterations = placed.iterations;
    stats.reachability_target_met = placed.target_met;
    level.platforms = std::move(placed.platforms);
    const level::Grid platform_grid = std::move(placed.grid);
    clock.mark("platforms");

    placement::GoalPlacerConfig goal_config;
    goal_config.min_distance = static_cast<double>(params.min_start_goal_distance);
    goal_config.right_side_boundary = settings_.goal_right_boundary;
    core::SeededRandom goal_rng = rng.derive("goal");
    auto goal = placement::GoalPlacer(analyzer, goal_config)
                    .place_goal_after_platforms(platform_grid, level.spawn, goal_rng);
    if (!goal) {
        CAVEGEN_LOG_WARN(core::log_category::PIPELINE, "{}; retrying with minimum distance {}", goal.error,
                         settings_.relaxed_goal_distance);
        goal_config.min_distance = settings_.relaxed_goal_distance;
        goal = placement::GoalPlacer(analyzer, goal_config)
                   .place_goal_after_platforms(platform_grid, level.spawn, goal_rng);
        stats.goal_fallback_used = true;
    }
    if (!goal) {
        return stage_failure("Goal placement", goal.error);
    }
    level.goal = goal.get().position;
    stats.goal_distance = goal.get().distance;
    stats.goal_fallback_used = stats.goal_fallback_used || goal.get().fallback_used;
    clock.mark("goal");

    placement::ReachableCoinPlacerConfig coin_config;
    coin_config.coin_count = params.coin_count;
    core::SeededRandom coin_rng = rng.derive("coins");
    auto coins = placement::ReachableCoinPlacer(analyzer, coin_config)
                     .place_coins(platform_grid, level.spawn, level.platforms, coin_rng, level.goal);
    if (coins) {
        level.coins = std::move(coins.get().coins);
    } else {
        stats.coin_error = coins.error;
        CAVEGEN_LOG_WARN(core::log_category::PIPELINE, "Level has no coins: {}", coins.error);
    }
    clock.mark("coins");

    placement::EnemyPlacerConfig enemy_config;
    enemy_config.max_enemies = params.enemy_count;
    enemy_config.enemy_density = settings_.enemy_density;
    enemy_config.min_distance_from_spawn = settings_.enemy_spawn_distance;
    enemy_config.min_distance_from_goal = settings_.enemy_goal_distance;
    core::SeededRandom enemy_rng = rng.derive("enemies");
    auto enemies = placement::EnemyPlacer(analyzer, enemy_config)
                       .place_enemies(platform_grid, level.spawn, level.coins, level.goal, level.platforms,
                                      enemy_rng);
    if (!enemies) {
        return stage_failure("Enemy placement", enemies.error);
    }
    stats.enemy_target = enemies.get().target_count;
    level.enemies = std::move(enemies.get().enemies);
    clock.mark("enemies");

    level.grid = std::move(grid);
    clock.finish();

    CAVEGEN_LOG_INFO(core::log_category::PIPELINE,
                     "Level '{}' ready in {:.1f} ms: {} platforms, {} coins, {} enemies, reachability {:.2f}",
                     params.seed, stats.total_milliseconds, level.platforms.size(), level.coins.size(),
                     level.enemies.size(), stats.final_reachability);
    return core::Result<LevelResult>::ok(std::move(level));
}

}  // namespace cavegen::pipeline
