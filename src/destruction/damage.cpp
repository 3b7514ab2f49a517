// Brickfall Destruction System
// damage.cpp - Damage application implementation

#include <algorithm>
#include <array>
#include <brickfall/destruction/damage.hpp>
#include <cmath>
#include <string>

namespace brickfall::destruction {

namespace {

constexpr std::array<grid::Color, METAL_STAGE_COUNT> METAL_PALETTE = {0xa0a0a0, 0x888888, 0x666666, 0x444444,
                                                                      0x222222};

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

Capability capability_from_talent(std::string_view talent) {
    if (talent == TALENT_BRICK_BREAKER) {
        return Capability::BrickBreaker;
    }
    if (talent == TALENT_UNBREAKABLE_BREAKER) {
        return Capability::UnbreakableBreaker;
    }
    return Capability::None;
}

Capability capabilities_from_talents(const std::vector<std::string>& talents) {
    Capability result = Capability::None;
    for (const auto& talent : talents) {
        result |= capability_from_talent(trim(talent));
    }
    return result;
}

Capability capabilities_from_string(std::string_view talents) {
    Capability result = Capability::None;
    while (!talents.empty()) {
        const auto comma = talents.find(',');
        result |= capability_from_talent(trim(talents.substr(0, comma)));
        if (comma == std::string_view::npos) {
            break;
        }
        talents.remove_prefix(comma + 1);
    }
    return result;
}

const char* damage_source_to_string(DamageSource source) {
    switch (source) {
        case DamageSource::Hit:
            return "hit";
        case DamageSource::Splash:
            return "splash";
        case DamageSource::Blast:
            return "blast";
        case DamageSource::BlastInner:
            return "blast-inner";
        default:
            return "unknown";
    }
}

bool is_damageable(const grid::Brick& brick, DamageSource source, Capability capabilities) {
    if (brick.is_destroyed()) {
        return false;
    }
    if (brick.type == grid::BrickType::Unbreakable) {
        return source == DamageSource::BlastInner || has_capability(capabilities, Capability::UnbreakableBreaker);
    }
    return true;
}

DamageResult apply_damage(grid::Brick& brick, int32_t amount, DamageSource source, Capability capabilities) {
    DamageResult result;
    if (amount <= 0 || !is_damageable(brick, source, capabilities)) {
        result.destroyed = brick.is_destroyed();
        return result;
    }

    brick.health = std::min(brick.health, brick.max_health);
    result.applied = std::min(amount, brick.health);
    brick.health -= result.applied;

    if (brick.type == grid::BrickType::Invisible && !brick.revealed && brick.health < brick.max_health) {
        brick.revealed = true;
        result.revealed = true;
    }

    result.destroyed = brick.is_destroyed();
    return result;
}

int32_t metal_appearance_stage(const grid::Brick& brick) {
    if (brick.max_health <= 0) {
        return METAL_STAGE_COUNT - 1;
    }
    const double ratio = static_cast<double>(brick.health) / static_cast<double>(brick.max_health);
    const auto stage = static_cast<int32_t>(std::floor((1.0 - ratio) * 4.0));
    return std::clamp(stage, 0, METAL_STAGE_COUNT - 1);
}

grid::Color metal_stage_color(int32_t stage) {
    return METAL_PALETTE[static_cast<size_t>(std::clamp(stage, 0, METAL_STAGE_COUNT - 1))];
}

}  // namespace brickfall::destruction
