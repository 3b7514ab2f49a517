// Brickfall - Brick-breaker destruction engine
// main.cpp - Headless simulator entry point

#include <brickfall/core/config.hpp>
#include <brickfall/core/logger.hpp>
#include <brickfall/core/scheduler.hpp>
#include <brickfall/destruction/destruction_engine.hpp>
#include <brickfall/endless/endless_mode.hpp>
#include <brickfall/gameplay/game_session.hpp>
#include <brickfall/grid/brick_store.hpp>
#include <brickfall/level/level_loader.hpp>
#include <brickfall/platform/file_io.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char* VERSION = "0.1.0";

constexpr double PLAYFIELD_WIDTH = 800.0;
constexpr double SHOT_INTERVAL_MS = 250.0;
constexpr double BALL_SPEED = 400.0;
constexpr int32_t HIT_BUDGET = 5000;
constexpr double ENDLESS_HIT_CHANCE = 0.7;

struct Options {
    bool endless = false;
    bool list_levels = false;
    std::optional<std::string> level_path;
    std::optional<std::string> config_path;
    std::vector<std::string> overrides;  // --set section.key=value
};

Options parse_options(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--endless") {
            options.endless = true;
        } else if (arg == "--list") {
            options.list_levels = true;
        } else if (arg == "--set" && i + 1 < argc) {
            options.overrides.emplace_back(argv[++i]);
        } else if (!options.level_path && !options.endless) {
            options.level_path = std::string(arg);
        } else if (!options.config_path) {
            options.config_path = std::string(arg);
        }
    }
    return options;
}

// Counts session events for the summary
class SimListener : public brickfall::gameplay::IGameEventListener {
public:
    void on_level_complete() override { ++levels_completed; }
    void on_lives_lost(int32_t count) override { lives_lost += count; }
    void on_item_drop(const brickfall::grid::PixelPos& /*position*/) override { ++item_drops; }

    int32_t levels_completed = 0;
    int32_t lives_lost = 0;
    int32_t item_drops = 0;
};

// Ball arriving from below, aimed at the brick
brickfall::destruction::BallState ball_towards(const brickfall::grid::Brick& brick) {
    brickfall::destruction::BallState ball;
    ball.position = brick.position + brickfall::grid::PixelPos(0.0, 10.0);
    ball.velocity = brickfall::grid::PixelPos(0.0, -BALL_SPEED);
    ball.pre_collision_velocity = ball.velocity;
    return ball;
}

std::optional<brickfall::grid::BrickId> pick_brick(const brickfall::grid::BrickStore& store, std::mt19937& rng) {
    const auto ids = store.snapshot();
    if (ids.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<size_t> dist(0, ids.size() - 1);
    return ids[dist(rng)];
}

// Bare level names are looked up in the user levels directory
std::filesystem::path resolve_level_path(const std::string& name) {
    namespace fs = std::filesystem;
    const fs::path path(name);
    if (brickfall::platform::FileSystem::exists(path) || path.has_parent_path()) {
        return path;
    }
    fs::path saved = brickfall::platform::FileSystem::get_user_levels_directory() / path;
    if (!saved.has_extension()) {
        saved += ".json";
    }
    return saved;
}

void list_saved_levels() {
    using brickfall::platform::FileSystem;
    const auto dir = FileSystem::get_user_levels_directory();
    const auto files = FileSystem::list_files(dir, ".json");
    BRICKFALL_LOG_INFO(brickfall::core::log_category::LEVEL, "{} saved levels in {}", files.size(), dir.string());
    for (const auto& file : files) {
        const auto level = brickfall::level::load_level_file(file);
        if (level) {
            BRICKFALL_LOG_INFO(brickfall::core::log_category::LEVEL, "  {} ({}x{}, {} bricks)",
                               file.stem().string(), level->width, level->height, level->bricks.size());
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace brickfall;

    const Options options = parse_options(argc, argv);

    core::Config config;
    if (options.config_path && !config.load(*options.config_path)) {
        return 1;
    }
    for (const auto& assignment : options.overrides) {
        if (!config.apply_override(assignment)) {
            return 1;
        }
    }

    core::Logger::initialize(core::LoggerConfig::from_config(config));

    BRICKFALL_LOG_INFO(core::log_category::ENGINE, "Brickfall simulator v{}", VERSION);

    if (options.list_levels) {
        list_saved_levels();
        core::Logger::shutdown();
        return 0;
    }

    const auto seed = static_cast<uint32_t>(config.get_int(core::config_section::ENDLESS, core::config_key::SEED, 0));
    std::mt19937 rng(seed != 0 ? seed : std::random_device{}());

    // Session and engine
    SimListener listener;
    gameplay::GameSession session(gameplay::GameSessionConfig::from_config(config));
    session.set_listener(&listener);

    grid::BrickStore store;
    core::DeferredScheduler scheduler;
    destruction::DestructionEngine engine;
    endless::EndlessModeManager endless_mode;

    if (options.endless) {
        const auto metrics = grid::compute_cell_metrics(grid::ENDLESS_GRID_SIZE, PLAYFIELD_WIDTH);
        endless::ShapeGeneratorConfig shape_config;
        shape_config.seed = seed;
        if (!endless_mode.initialize(&store, &session, nullptr, metrics, shape_config)) {
            core::Logger::shutdown();
            return 1;
        }
    } else {
        std::optional<level::LevelData> level_data;
        if (options.level_path) {
            level_data = level::load_level_file(resolve_level_path(*options.level_path));
            if (!level_data) {
                core::Logger::shutdown();
                return 1;
            }
            level_data->bricks = level::clean_bricks(level_data->bricks, level_data->width, level_data->height);
            for (const auto& id : level::unpaired_portal_ids(level_data->bricks)) {
                BRICKFALL_LOG_WARN(core::log_category::LEVEL, "Portal '{}' has no partner", id);
            }
        } else {
            level_data = level::make_default_level(
                grid::compute_cell_metrics(level::DEFAULT_LEVEL_COLUMNS, PLAYFIELD_WIDTH));
        }

        const auto metrics = level::metrics_for_level(*level_data, PLAYFIELD_WIDTH);
        const auto result = level::populate_store(*level_data, store, metrics);
        session.begin_level(result.required);
    }

    if (!engine.initialize(&store, &scheduler, &session, nullptr,
                           destruction::EngineSettings::from_config(config))) {
        core::Logger::shutdown();
        return 1;
    }
    engine.set_hit_callback([&endless_mode](grid::BrickId /*id*/) { endless_mode.on_brick_hit(); });

    // Play random shots until the level is cleared or the budget runs out
    double now = 0.0;
    int32_t shots = 0;
    std::uniform_real_distribution<double> chance(0.0, 1.0);

    while (shots < HIT_BUDGET && !session.is_game_over()) {
        ++shots;
        now += SHOT_INTERVAL_MS;

        const bool aim = !options.endless || chance(rng) < ENDLESS_HIT_CHANCE;
        if (aim) {
            if (auto id = pick_brick(store, rng)) {
                auto ball = ball_towards(*store.find(*id));
                const auto outcome = engine.on_collision(ball, *id, now);
                BRICKFALL_LOG_TRACE(core::log_category::ENGINE, "Shot {} at brick {}: {}", shots, *id,
                                    destruction::hit_outcome_to_string(outcome));
            }
        }
        scheduler.advance_to(now);

        if (options.endless) {
            // Every shot ends with a paddle return
            endless_mode.check_and_shift(now, false);
            endless_mode.reset_hit_tracking();
            if (endless_mode.all_bricks_destroyed()) {
                endless_mode.next_level();
            }
        } else if (session.is_level_complete()) {
            break;
        }
    }

    // Let pending fuse steps finish
    scheduler.run_all();

    const auto stats = engine.get_stats();
    BRICKFALL_LOG_INFO(core::log_category::ENGINE, "Simulation finished after {} shots ({:.0f} ms)", shots,
                       scheduler.now());
    BRICKFALL_LOG_INFO(core::log_category::ENGINE, "  Level {} {}", session.get_level(),
                       session.is_level_complete() ? "complete" : "incomplete");
    BRICKFALL_LOG_INFO(core::log_category::ENGINE, "  Score {}, coins {}, lives {}", session.get_score(),
                       session.get_coins(), session.get_lives());
    BRICKFALL_LOG_INFO(core::log_category::ENGINE, "  Destroyed {} bricks, {} left, {} item drops",
                       stats.bricks_destroyed, store.size(), listener.item_drops);
    BRICKFALL_LOG_INFO(core::log_category::ENGINE, "  TNT {}, fuses {} ({} steps), teleports {}, debounced {}",
                       stats.tnt_detonations, stats.fuse_ignitions, stats.fuse_steps_fired, stats.teleports,
                       stats.collisions_debounced);
    if (options.endless) {
        const auto endless_stats = endless_mode.get_stats();
        BRICKFALL_LOG_INFO(core::log_category::ENDLESS, "  Endless level {}, {} shifts, {} bricks discarded",
                           endless_mode.get_level(), endless_stats.shifts, endless_stats.bricks_discarded);
    }

    engine.shutdown();
    endless_mode.shutdown();
    core::Logger::shutdown();
    return 0;
}
