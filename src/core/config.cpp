// Brickfall Core
// config.cpp - JSON settings implementation

#include <nlohmann/json.hpp>

#include <brickfall/core/config.hpp>
#include <brickfall/core/logger.hpp>
#include <brickfall/platform/file_io.hpp>

namespace brickfall::core {

using json = nlohmann::json;

namespace {

json default_settings() {
    return json{
        {config_section::GAMEPLAY,
         {{config_key::COIN_MULTIPLIER, 1.0},
          {config_key::DROP_CHANCE_BONUS, 0.0},
          {config_key::TALENTS, ""},
          {config_key::STARTING_LIVES, 3}}},
        {config_section::COLLISION,
         {{config_key::DEBOUNCE_WINDOW_MS, 50.0},
          {config_key::PRUNE_THRESHOLD, 100},
          {config_key::PRUNE_MAX_AGE_MS, 1000.0}}},
        {config_section::EXPLOSIONS, {{config_key::FUSE_STEP_DELAY_MS, 100.0}, {config_key::TNT_FALLBACK_RADIUS, 80.0}}},
        {config_section::ENDLESS, {{config_key::SEED, 0}}},
        {config_section::DEBUG,
         {{config_key::LOG_LEVEL, "info"}, {config_key::LOG_TO_FILE, false}, {config_key::LOG_CATEGORIES, ""}}},
    };
}

// Discarded value on malformed input
json parse_lenient(std::string_view text) {
    return json::parse(text.begin(), text.end(), nullptr, false);
}

}  // namespace

struct Config::Impl {
    json data = default_settings();

    const json* lookup(std::string_view section, std::string_view key) const {
        const auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        const auto key_it = section_it->find(std::string(key));
        return key_it == section_it->end() ? nullptr : &*key_it;
    }

    template<typename T>
    T read(std::string_view section, std::string_view key, T fallback, const char* expected) const {
        const json* value = lookup(section, key);
        if (value == nullptr) {
            return fallback;
        }
        try {
            return value->get<T>();
        } catch (const json::type_error&) {
            BRICKFALL_LOG_WARN(log_category::CONFIG, "{}.{} is not {}, using {}", section, key, expected, fallback);
            return fallback;
        }
    }

    void write(std::string_view section, std::string_view key, json value) {
        data[std::string(section)][std::string(key)] = std::move(value);
    }

    // Partial documents keep the defaults they do not mention
    bool overlay(std::string_view content) {
        json parsed = parse_lenient(content);
        if (parsed.is_discarded()) {
            BRICKFALL_LOG_ERROR(log_category::CONFIG, "Config is not valid JSON");
            return false;
        }
        if (!parsed.is_object()) {
            BRICKFALL_LOG_ERROR(log_category::CONFIG, "Config root must be an object");
            return false;
        }
        json merged = default_settings();
        merged.merge_patch(parsed);
        data = std::move(merged);
        return true;
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    const auto content = platform::FileSystem::read_text(path);
    if (!content) {
        BRICKFALL_LOG_ERROR(log_category::CONFIG, "Cannot read config '{}'", path.string());
        return false;
    }
    if (!impl_->overlay(*content)) {
        return false;
    }
    BRICKFALL_LOG_INFO(log_category::CONFIG, "Loaded config from {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view content) {
    return impl_->overlay(content);
}

bool Config::save(const std::filesystem::path& path) const {
    if (!platform::FileSystem::write_text(path, impl_->data.dump(4))) {
        BRICKFALL_LOG_ERROR(log_category::CONFIG, "Cannot write config '{}'", path.string());
        return false;
    }
    return true;
}

bool Config::apply_override(std::string_view assignment) {
    const auto dot = assignment.find('.');
    const auto equals = assignment.find('=');
    if (dot == std::string_view::npos || equals == std::string_view::npos || dot == 0 || dot + 1 >= equals) {
        BRICKFALL_LOG_WARN(log_category::CONFIG, "Ignoring override '{}', expected section.key=value", assignment);
        return false;
    }

    const std::string_view section = assignment.substr(0, dot);
    const std::string_view key = assignment.substr(dot + 1, equals - dot - 1);
    const std::string_view text = assignment.substr(equals + 1);

    json value = parse_lenient(text);
    if (value.is_discarded()) {
        value = std::string(text);
    }
    BRICKFALL_LOG_DEBUG(log_category::CONFIG, "Override {}.{} = {}", section, key, value.dump());
    impl_->write(section, key, std::move(value));
    return true;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    return impl_->read<int>(section, key, default_value, "an integer");
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    return impl_->read<double>(section, key, default_value, "a number");
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    return impl_->read<bool>(section, key, default_value, "a boolean");
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    return impl_->read<std::string>(section, key, std::string(default_value), "a string");
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->write(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->write(section, key, value);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->write(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->write(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->lookup(section, key) != nullptr;
}

void Config::reset_to_defaults() {
    impl_->data = default_settings();
}

}  // namespace brickfall::core
