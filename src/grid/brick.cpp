// Brickfall Grid System
// brick.cpp - Brick type names and badge formatting

#include <array>
#include <brickfall/grid/brick.hpp>

namespace brickfall::grid {

namespace {

constexpr std::array<const char*, static_cast<size_t>(BrickType::Count)> TYPE_NAMES = {
    "default",        "metal",         "unbreakable",    "tnt",           "gold",
    "boost",          "portal",        "chaos",          "invisible",     "fuse-horizontal",
    "fuse-vertical",  "fuse-left-up",  "fuse-right-up",  "fuse-left-down", "fuse-right-down"};

constexpr int32_t BADGE_HIDDEN_HEALTH = 999;

}  // namespace

const char* brick_type_to_string(BrickType type) {
    auto index = static_cast<size_t>(type);
    if (index >= TYPE_NAMES.size()) {
        return "unknown";
    }
    return TYPE_NAMES[index];
}

std::optional<BrickType> brick_type_from_string(std::string_view name) {
    for (size_t i = 0; i < TYPE_NAMES.size(); ++i) {
        if (name == TYPE_NAMES[i]) {
            return static_cast<BrickType>(i);
        }
    }
    return std::nullopt;
}

std::string health_badge_text(const Brick& brick) {
    if (brick.health > 1 && brick.health < BADGE_HIDDEN_HEALTH) {
        return std::to_string(brick.health);
    }
    return {};
}

}  // namespace brickfall::grid
