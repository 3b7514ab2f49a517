// Brickfall Destruction System
// fuse_chain.hpp - Fuse connectivity and cardinal splash queries

#pragma once

#include <brickfall/grid/brick_store.hpp>

#include <cstdint>
#include <vector>

namespace brickfall::destruction {

inline constexpr double DEFAULT_FUSE_STEP_DELAY_MS = 100.0;
inline constexpr int32_t FUSE_SPLASH_DAMAGE = 1;

// Breadth-first flood fill over 4-neighbour cells holding a fuse brick.
// The start brick comes first, the rest follow BFS visitation order
// (up, down, left, right), and both halves of a split cell are collected.
// Returns empty when the start brick is missing, has no grid cell or is
// not a fuse.
[[nodiscard]] std::vector<grid::BrickId> find_connected_fuses(const grid::BrickStore& store, grid::BrickId start);

// Bricks in the four cardinal cells around cell that splash damage may
// reach (fuse and unbreakable bricks are immune)
[[nodiscard]] std::vector<grid::BrickId> splash_targets(const grid::BrickStore& store, const grid::GridCoord& cell);

}  // namespace brickfall::destruction
