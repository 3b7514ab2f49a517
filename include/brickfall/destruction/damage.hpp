// Brickfall Destruction System
// damage.hpp - Capabilities, damage application and metal appearance

#pragma once

#include <brickfall/grid/brick.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace brickfall::destruction {

// ============================================================================
// Capabilities
// ============================================================================

// Typed player capabilities, parsed from talent ids at the config boundary
enum class Capability : uint32_t {
    None = 0,
    BrickBreaker = 1 << 0,        // Normal hits deal 2 damage
    UnbreakableBreaker = 1 << 1,  // Normal hits damage unbreakable bricks
};

inline Capability operator|(Capability a, Capability b) {
    return static_cast<Capability>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline Capability operator&(Capability a, Capability b) {
    return static_cast<Capability>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline Capability& operator|=(Capability& a, Capability b) {
    a = a | b;
    return a;
}

[[nodiscard]] inline bool has_capability(Capability set, Capability flag) {
    return (static_cast<uint32_t>(set) & static_cast<uint32_t>(flag)) != 0;
}

inline constexpr std::string_view TALENT_BRICK_BREAKER = "brick-breaker";
inline constexpr std::string_view TALENT_UNBREAKABLE_BREAKER = "unbreakable-breaker";

// Unknown talent ids are ignored
[[nodiscard]] Capability capability_from_talent(std::string_view talent);
[[nodiscard]] Capability capabilities_from_talents(const std::vector<std::string>& talents);

// Comma-separated list, whitespace around ids is ignored
[[nodiscard]] Capability capabilities_from_string(std::string_view talents);

// ============================================================================
// Damage
// ============================================================================

enum class DamageSource : uint8_t {
    Hit,          // Ball collision
    Splash,       // Fuse cardinal splash
    Blast,        // TNT ring 2 and beyond
    BlastInner,   // TNT ring 0/1, the only source that breaks unbreakable bricks
};

[[nodiscard]] const char* damage_source_to_string(DamageSource source);

// Large enough to destroy any brick in one application
inline constexpr int32_t LETHAL_DAMAGE = std::numeric_limits<int32_t>::max();

inline constexpr int32_t BASE_HIT_DAMAGE = 1;
inline constexpr int32_t BRICK_BREAKER_HIT_DAMAGE = 2;

// Damage a normal ball hit deals under the given capabilities
[[nodiscard]] inline int32_t hit_damage(Capability capabilities) {
    return has_capability(capabilities, Capability::BrickBreaker) ? BRICK_BREAKER_HIT_DAMAGE : BASE_HIT_DAMAGE;
}

struct DamageResult {
    bool destroyed = false;  // Health is now 0
    int32_t applied = 0;     // Health actually removed
    bool revealed = false;   // Invisible brick became visible with this hit
};

// Health clamps to [0, max_health]. Unbreakable bricks only take damage from
// BlastInner or with the UnbreakableBreaker capability.
DamageResult apply_damage(grid::Brick& brick, int32_t amount, DamageSource source, Capability capabilities);

// Whether apply_damage would change the brick at all
[[nodiscard]] bool is_damageable(const grid::Brick& brick, DamageSource source, Capability capabilities);

// ============================================================================
// Metal Appearance
// ============================================================================

inline constexpr int32_t METAL_STAGE_COUNT = 5;

// 0 (pristine) .. 4 (nearly broken)
[[nodiscard]] int32_t metal_appearance_stage(const grid::Brick& brick);

// Palette entry for a stage, clamped
[[nodiscard]] grid::Color metal_stage_color(int32_t stage);

}  // namespace brickfall::destruction
