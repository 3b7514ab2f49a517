// Brickfall Grid System
// brick.hpp - Brick types and the live brick record

#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace brickfall::grid {

// ============================================================================
// Brick Identity
// ============================================================================

using BrickId = uint32_t;

inline constexpr BrickId INVALID_BRICK = 0;

// ============================================================================
// Brick Types
// ============================================================================

enum class BrickType : uint8_t {
    Default = 0,
    Metal,
    Unbreakable,
    TNT,
    Gold,
    Boost,
    Portal,
    Chaos,
    Invisible,
    FuseHorizontal,
    FuseVertical,
    FuseLeftUp,
    FuseRightUp,
    FuseLeftDown,
    FuseRightDown,
    Count
};

// Level-file names ("default", "fuse-left-up", ...)
[[nodiscard]] const char* brick_type_to_string(BrickType type);
[[nodiscard]] std::optional<BrickType> brick_type_from_string(std::string_view name);

// Orientation is cosmetic; every fuse sub-type connects to every other
[[nodiscard]] inline bool is_fuse_type(BrickType type) {
    switch (type) {
        case BrickType::FuseHorizontal:
        case BrickType::FuseVertical:
        case BrickType::FuseLeftUp:
        case BrickType::FuseRightUp:
        case BrickType::FuseLeftDown:
        case BrickType::FuseRightDown:
            return true;
        default:
            return false;
    }
}

// Packed 0xRRGGBB
using Color = uint32_t;

// ============================================================================
// Brick
// ============================================================================

struct Brick {
    BrickId id = INVALID_BRICK;  // Assigned by BrickStore::add
    BrickType type = BrickType::Default;

    // Grid placement (legacy bricks may lack a cell)
    std::optional<GridCoord> grid;
    HalfSlot half_slot = HalfSlot::None;

    // Derived from grid + metrics, never the source of truth
    PixelPos position{0.0, 0.0};

    int32_t health = 1;
    int32_t max_health = 1;

    Color color = 0xffffff;
    double drop_chance = 0.0;
    int32_t coin_value = 0;

    // Portal linkage
    std::optional<std::string> pair_id;
    bool is_one_way = false;

    // Counted towards level completion
    bool is_required = true;

    // Presentation state owned by the engine
    bool revealed = false;  // Invisible bricks turn visible on first damage
    bool burning = false;   // Fuse is lit and waiting for its cascade step

    [[nodiscard]] bool is_half_size() const { return half_slot != HalfSlot::None; }
    [[nodiscard]] bool is_destroyed() const { return health <= 0; }
    [[nodiscard]] bool has_grid() const { return grid.has_value(); }
    [[nodiscard]] bool is_fuse() const { return is_fuse_type(type); }

    // Counts towards the required-brick tally of a level
    [[nodiscard]] bool counts_for_completion() const { return type != BrickType::Unbreakable && is_required; }
};

// Health badge label, empty when no badge is shown (health <= 1 or >= 999)
[[nodiscard]] std::string health_badge_text(const Brick& brick);

}  // namespace brickfall::grid
