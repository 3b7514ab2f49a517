// Brickfall Level System
// level_data.hpp - Level file records and JSON (de)serialization

#pragma once

#include <brickfall/grid/brick.hpp>

#include <cstdint>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brickfall::level {

// ============================================================================
// Brick Record
// ============================================================================

// One brick as stored in a level file. Optional fields that were absent on
// input stay absent on output.
struct BrickRecord {
    // Pixel centre in editor space (legacy files carry no grid cell)
    double x = 0.0;
    double y = 0.0;
    std::optional<int32_t> col;
    std::optional<int32_t> row;

    int32_t health = 1;
    int32_t max_health = 1;
    grid::Color color = 0xffffff;
    double drop_chance = 0.0;
    int32_t coin_value = 0;
    grid::BrickType type = grid::BrickType::Default;

    // Portal pair id ("portal_..."), shared by both ends
    std::optional<std::string> id;

    std::optional<bool> is_half_size;
    std::optional<grid::HalfSlot> half_size_align;
    std::optional<bool> is_required;
    std::optional<bool> is_one_way;

    [[nodiscard]] bool has_grid() const { return col.has_value() && row.has_value(); }

    // Half-size bricks without an alignment sit in the left slot
    [[nodiscard]] grid::HalfSlot slot() const {
        if (!is_half_size.value_or(false)) {
            return grid::HalfSlot::None;
        }
        return half_size_align.value_or(grid::HalfSlot::Left);
    }
};

// ============================================================================
// Level Data
// ============================================================================

struct LevelData {
    std::string name;
    int32_t width = 0;   // Columns
    int32_t height = 0;  // Rows
    std::vector<BrickRecord> bricks;

    std::optional<grid::Color> background_color;

    // Cell metrics the editor used when it wrote the pixel positions
    std::optional<double> brick_width;
    std::optional<double> brick_height;
    std::optional<double> padding;

    [[nodiscard]] grid::GridBounds bounds() const { return grid::GridBounds{width, height}; }
};

// nlohmann ADL hooks
void to_json(nlohmann::json& j, const BrickRecord& brick);
void from_json(const nlohmann::json& j, BrickRecord& brick);
void to_json(nlohmann::json& j, const LevelData& level);
void from_json(const nlohmann::json& j, LevelData& level);

// ============================================================================
// Load / Save
// ============================================================================

// Returns std::nullopt (and logs) for malformed JSON, missing fields,
// unknown brick types or a non-positive grid size
[[nodiscard]] std::optional<LevelData> parse_level(std::string_view content);

[[nodiscard]] std::string serialize_level(const LevelData& level, int indent = 2);

[[nodiscard]] std::optional<LevelData> load_level_file(const std::filesystem::path& path);
bool save_level_file(const std::filesystem::path& path, const LevelData& level);

// ============================================================================
// Editor Validation
// ============================================================================

// Drops bricks outside the grid or without a cell, non-finite positions,
// non-portal bricks carrying a portal id and portals without an id
[[nodiscard]] std::vector<BrickRecord> clean_bricks(const std::vector<BrickRecord>& bricks, int32_t width,
                                                   int32_t height);

// Portal ids used by exactly one portal, in first-seen order
[[nodiscard]] std::vector<std::string> unpaired_portal_ids(const std::vector<BrickRecord>& bricks);

}  // namespace brickfall::level
