// Brickfall Level System
// level_data.cpp - Level file records and JSON (de)serialization

#include <nlohmann/json.hpp>

#include <brickfall/core/logger.hpp>
#include <brickfall/level/level_data.hpp>
#include <brickfall/platform/file_io.hpp>

#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace brickfall::level {

using json = nlohmann::json;

namespace {

constexpr std::string_view PORTAL_ID_PREFIX = "portal_";

grid::HalfSlot half_slot_from_string(const std::string& name) {
    if (name == "left") {
        return grid::HalfSlot::Left;
    }
    if (name == "right") {
        return grid::HalfSlot::Right;
    }
    throw std::invalid_argument("unknown halfSizeAlign '" + name + "'");
}

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    } else {
        out.reset();
    }
}

template <typename T>
void write_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

}  // namespace

// ============================================================================
// JSON Conversion
// ============================================================================

void to_json(json& j, const BrickRecord& brick) {
    j = json{{"x", brick.x},
             {"y", brick.y},
             {"health", brick.health},
             {"maxHealth", brick.max_health},
             {"color", brick.color},
             {"dropChance", brick.drop_chance},
             {"coinValue", brick.coin_value},
             {"type", grid::brick_type_to_string(brick.type)}};

    write_optional(j, "col", brick.col);
    write_optional(j, "row", brick.row);
    write_optional(j, "id", brick.id);
    write_optional(j, "isHalfSize", brick.is_half_size);
    if (brick.half_size_align) {
        j["halfSizeAlign"] = grid::half_slot_to_string(*brick.half_size_align);
    }
    write_optional(j, "isRequired", brick.is_required);
    write_optional(j, "isOneWay", brick.is_one_way);
}

void from_json(const json& j, BrickRecord& brick) {
    j.at("x").get_to(brick.x);
    j.at("y").get_to(brick.y);
    j.at("health").get_to(brick.health);
    j.at("maxHealth").get_to(brick.max_health);
    j.at("color").get_to(brick.color);
    j.at("dropChance").get_to(brick.drop_chance);
    j.at("coinValue").get_to(brick.coin_value);

    const auto type_name = j.at("type").get<std::string>();
    auto type = grid::brick_type_from_string(type_name);
    if (!type) {
        throw std::invalid_argument("unknown brick type '" + type_name + "'");
    }
    brick.type = *type;

    read_optional(j, "col", brick.col);
    read_optional(j, "row", brick.row);
    read_optional(j, "id", brick.id);
    read_optional(j, "isHalfSize", brick.is_half_size);

    brick.half_size_align.reset();
    auto align_it = j.find("halfSizeAlign");
    if (align_it != j.end() && !align_it->is_null()) {
        brick.half_size_align = half_slot_from_string(align_it->get<std::string>());
    }

    read_optional(j, "isRequired", brick.is_required);
    read_optional(j, "isOneWay", brick.is_one_way);
}

void to_json(json& j, const LevelData& level) {
    j = json{{"name", level.name}, {"width", level.width}, {"height", level.height}, {"bricks", level.bricks}};
    write_optional(j, "backgroundColor", level.background_color);
    write_optional(j, "brickWidth", level.brick_width);
    write_optional(j, "brickHeight", level.brick_height);
    write_optional(j, "padding", level.padding);
}

void from_json(const json& j, LevelData& level) {
    j.at("name").get_to(level.name);
    j.at("width").get_to(level.width);
    j.at("height").get_to(level.height);
    j.at("bricks").get_to(level.bricks);
    read_optional(j, "backgroundColor", level.background_color);
    read_optional(j, "brickWidth", level.brick_width);
    read_optional(j, "brickHeight", level.brick_height);
    read_optional(j, "padding", level.padding);
}

// ============================================================================
// Load / Save
// ============================================================================

std::optional<LevelData> parse_level(std::string_view content) {
    LevelData level;
    try {
        json::parse(content).get_to(level);
    } catch (const json::exception& e) {
        BRICKFALL_LOG_ERROR(core::log_category::LEVEL, "Malformed level data: {}", e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        BRICKFALL_LOG_ERROR(core::log_category::LEVEL, "Invalid level data: {}", e.what());
        return std::nullopt;
    }

    if (level.width <= 0 || level.height <= 0) {
        BRICKFALL_LOG_ERROR(core::log_category::LEVEL, "Level '{}' has invalid size {}x{}", level.name, level.width,
                            level.height);
        return std::nullopt;
    }

    BRICKFALL_LOG_DEBUG(core::log_category::LEVEL, "Parsed level '{}' ({}x{}, {} bricks)", level.name, level.width,
                        level.height, level.bricks.size());
    return level;
}

std::string serialize_level(const LevelData& level, int indent) {
    return json(level).dump(indent);
}

std::optional<LevelData> load_level_file(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        BRICKFALL_LOG_ERROR(core::log_category::LEVEL, "Failed to read level file: {}", path.string());
        return std::nullopt;
    }

    auto level = parse_level(*content);
    if (level) {
        BRICKFALL_LOG_INFO(core::log_category::LEVEL, "Loaded level '{}' from: {}", level->name, path.string());
    }
    return level;
}

bool save_level_file(const std::filesystem::path& path, const LevelData& level) {
    if (!platform::FileSystem::write_text(path, serialize_level(level))) {
        BRICKFALL_LOG_ERROR(core::log_category::LEVEL, "Failed to write level file: {}", path.string());
        return false;
    }
    BRICKFALL_LOG_INFO(core::log_category::LEVEL, "Saved level '{}' to: {}", level.name, path.string());
    return true;
}

// ============================================================================
// Editor Validation
// ============================================================================

std::vector<BrickRecord> clean_bricks(const std::vector<BrickRecord>& bricks, int32_t width, int32_t height) {
    std::vector<BrickRecord> cleaned;
    cleaned.reserve(bricks.size());

    for (const auto& brick : bricks) {
        if (!brick.has_grid() || *brick.col < 0 || *brick.col >= width || *brick.row < 0 || *brick.row >= height ||
            !std::isfinite(brick.x) || !std::isfinite(brick.y)) {
            BRICKFALL_LOG_WARN(core::log_category::LEVEL, "Removing brick with invalid position ({}, {})", brick.x,
                               brick.y);
            continue;
        }

        const bool is_portal = brick.type == grid::BrickType::Portal;
        if (!is_portal && brick.id && brick.id->rfind(PORTAL_ID_PREFIX, 0) == 0) {
            BRICKFALL_LOG_WARN(core::log_category::LEVEL, "Removing {} brick carrying portal id '{}'",
                               grid::brick_type_to_string(brick.type), *brick.id);
            continue;
        }

        if (is_portal && (!brick.id || brick.id->empty())) {
            BRICKFALL_LOG_WARN(core::log_category::LEVEL, "Removing portal without id at ({}, {})", *brick.col,
                               *brick.row);
            continue;
        }

        cleaned.push_back(brick);
    }

    return cleaned;
}

std::vector<std::string> unpaired_portal_ids(const std::vector<BrickRecord>& bricks) {
    std::vector<std::string> order;
    std::unordered_map<std::string, size_t> counts;

    for (const auto& brick : bricks) {
        if (brick.type != grid::BrickType::Portal || !brick.id || brick.id->empty()) {
            continue;
        }
        if (counts[*brick.id]++ == 0) {
            order.push_back(*brick.id);
        }
    }

    std::vector<std::string> unpaired;
    for (const auto& id : order) {
        if (counts[id] == 1) {
            unpaired.push_back(id);
        }
    }
    return unpaired;
}

}  // namespace brickfall::level
