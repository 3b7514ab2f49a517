// Brickfall Core
// config.hpp - Tunables loaded from JSON, layered over built-in defaults

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace brickfall::core {

// Two-level "section.key" settings. Every accessor takes the fallback used when
// the key is missing or holds the wrong JSON type.
class Config {
public:
    Config();
    ~Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // Both overlay the document on the defaults; on failure nothing changes
    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view content);

    bool save(const std::filesystem::path& path) const;

    // "explosions.fuse_step_delay_ms=50"; the value is read as JSON, else as a string
    bool apply_override(std::string_view assignment);

    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;

    void reset_to_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* GAMEPLAY = "gameplay";
    inline constexpr const char* COLLISION = "collision";
    inline constexpr const char* EXPLOSIONS = "explosions";
    inline constexpr const char* ENDLESS = "endless";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
    // gameplay
    inline constexpr const char* COIN_MULTIPLIER = "coin_multiplier";
    inline constexpr const char* DROP_CHANCE_BONUS = "drop_chance_bonus";
    inline constexpr const char* TALENTS = "talents";  // Comma-separated talent ids
    inline constexpr const char* STARTING_LIVES = "starting_lives";

    // collision
    inline constexpr const char* DEBOUNCE_WINDOW_MS = "debounce_window_ms";
    inline constexpr const char* PRUNE_THRESHOLD = "prune_threshold";
    inline constexpr const char* PRUNE_MAX_AGE_MS = "prune_max_age_ms";

    // explosions
    inline constexpr const char* FUSE_STEP_DELAY_MS = "fuse_step_delay_ms";
    inline constexpr const char* TNT_FALLBACK_RADIUS = "tnt_fallback_radius";

    // endless
    inline constexpr const char* SEED = "seed";

    // debug
    inline constexpr const char* LOG_LEVEL = "log_level";
    inline constexpr const char* LOG_TO_FILE = "log_to_file";
    inline constexpr const char* LOG_CATEGORIES = "log_categories";  // "destruction=debug,level=trace"
}  // namespace config_key

}  // namespace brickfall::core
