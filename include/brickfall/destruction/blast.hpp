// Brickfall Destruction System
// blast.hpp - TNT blast ring resolution

#pragma once

#include "damage.hpp"

#include <brickfall/grid/brick_store.hpp>

#include <cstdint>
#include <vector>

namespace brickfall::destruction {

// ============================================================================
// Blast Configuration
// ============================================================================

// Rings 0-2 deal heavy damage, ring 3 chips, beyond is untouched
inline constexpr int32_t BLAST_HEAVY_DAMAGE = 5;
inline constexpr int32_t BLAST_LIGHT_DAMAGE = 1;
inline constexpr int32_t BLAST_MAX_RING = 3;

// Unbreakable bricks are only destroyed this close to the TNT
inline constexpr int32_t BLAST_UNBREAKABLE_MAX_RING = 1;

// Pixel radius for TNT without grid coordinates
inline constexpr double DEFAULT_TNT_FALLBACK_RADIUS = 80.0;

// ============================================================================
// Half-Block Distance
// ============================================================================

// Distance in half-cell units between two placements. Full bricks occupy
// both halves; the minimum over all half pairs is returned. Column and row
// distances combine by Chebyshev max.
[[nodiscard]] double half_block_distance(const grid::GridCoord& a, grid::HalfSlot a_slot, const grid::GridCoord& b,
                                         grid::HalfSlot b_slot);

// ceil(distance)
[[nodiscard]] int32_t blast_ring(double distance);

// Non-increasing in ring: 5, 5, 5, 1, 0...
[[nodiscard]] int32_t blast_damage_for_ring(int32_t ring);

// ============================================================================
// Blast Planning
// ============================================================================

struct BlastTarget {
    grid::BrickId id = grid::INVALID_BRICK;
    double distance = 0.0;
    int32_t ring = 0;
    int32_t damage = 0;
    DamageSource source = DamageSource::Blast;
};

// Every other live gridded brick the TNT damages, in creation order. Pure
// read of the store; the caller applies the damage.
[[nodiscard]] std::vector<BlastTarget> plan_blast(const grid::BrickStore& store, grid::BrickId tnt);

// Legacy TNT: non-unbreakable bricks within radius pixels of the TNT centre
[[nodiscard]] std::vector<grid::BrickId> plan_fallback_blast(const grid::BrickStore& store, grid::BrickId tnt,
                                                             double radius);

}  // namespace brickfall::destruction
