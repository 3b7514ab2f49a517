// Brickfall Level System
// level_loader.hpp - Populating the brick store from level data

#pragma once

#include "level_data.hpp"

#include <brickfall/grid/brick_store.hpp>

#include <cstddef>

namespace brickfall::level {

// ============================================================================
// Default Level
// ============================================================================

inline constexpr int32_t DEFAULT_LEVEL_COLUMNS = 10;
inline constexpr int32_t DEFAULT_LEVEL_ROWS = 8;

// Row colours of the built-in level, top to bottom
inline constexpr grid::Color DEFAULT_LEVEL_PALETTE[] = {0xff6b6b, 0x4ecdc4, 0x45b7d1, 0xffa07a,
                                                        0x98d8c8, 0xf7dc6f, 0xbb8fce, 0x85c1e2};

// Full 10x8 wall used when no level data is supplied. Health grows every
// two rows; deeper rows drop more and pay more.
[[nodiscard]] LevelData make_default_level(const grid::CellMetrics& metrics);

// ============================================================================
// Population
// ============================================================================

struct PopulationResult {
    size_t added = 0;
    size_t migrated = 0;  // Legacy bricks placed from their pixel position
    size_t rejected = 0;  // Out of bounds, dead or slot conflicts
    size_t required = 0;  // Bricks counting towards completion
};

// Live brick for a record placed in cell, positioned with metrics
[[nodiscard]] grid::Brick brick_from_record(const BrickRecord& record, const grid::GridCoord& cell,
                                           const grid::CellMetrics& metrics);

// Metrics for laying a level out across available_width pixels
[[nodiscard]] grid::CellMetrics metrics_for_level(const LevelData& level, double available_width);

// Metrics the editor wrote the pixel positions with, falling back to the runtime ones
[[nodiscard]] grid::CellMetrics editor_metrics(const LevelData& level, const grid::CellMetrics& fallback);

// Clears the store, resizes it to the level grid and adds every valid brick.
// Positions are derived from the grid cell and the given metrics.
PopulationResult populate_store(const LevelData& level, grid::BrickStore& store, const grid::CellMetrics& metrics);

}  // namespace brickfall::level
