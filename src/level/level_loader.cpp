// Brickfall Level System
// level_loader.cpp - Populating the brick store from level data

#include <brickfall/core/logger.hpp>
#include <brickfall/level/level_loader.hpp>

#include <iterator>

namespace brickfall::level {

grid::Brick brick_from_record(const BrickRecord& record, const grid::GridCoord& cell,
                              const grid::CellMetrics& metrics) {
    grid::Brick brick;
    brick.type = record.type;
    brick.grid = cell;
    brick.half_slot = record.slot();
    brick.position = grid::to_pixel(cell, brick.half_slot, metrics);
    brick.health = record.health;
    brick.max_health = record.max_health;
    brick.color = record.color;
    brick.drop_chance = record.drop_chance;
    brick.coin_value = record.coin_value;
    if (record.type == grid::BrickType::Portal) {
        brick.pair_id = record.id;
    }
    brick.is_one_way = record.is_one_way.value_or(false);
    brick.is_required = record.is_required.value_or(true);
    return brick;
}

// ============================================================================
// Default Level
// ============================================================================

LevelData make_default_level(const grid::CellMetrics& metrics) {
    LevelData level;
    level.name = "Default";
    level.width = DEFAULT_LEVEL_COLUMNS;
    level.height = DEFAULT_LEVEL_ROWS;
    level.brick_width = metrics.cell_width;
    level.brick_height = metrics.cell_height;
    level.padding = metrics.padding;

    constexpr auto palette_size = static_cast<int32_t>(std::size(DEFAULT_LEVEL_PALETTE));

    for (int32_t row = 0; row < DEFAULT_LEVEL_ROWS; ++row) {
        for (int32_t col = 0; col < DEFAULT_LEVEL_COLUMNS; ++col) {
            const grid::PixelPos position = grid::to_pixel(grid::GridCoord(col, row), grid::HalfSlot::None, metrics);

            BrickRecord record;
            record.x = position.x;
            record.y = position.y;
            record.col = col;
            record.row = row;
            record.health = row / 2 + 1;
            record.max_health = record.health;
            record.color = DEFAULT_LEVEL_PALETTE[row % palette_size];
            record.drop_chance = 0.15 + row * 0.05;
            record.coin_value = (row + 1) * 2;
            record.type = grid::BrickType::Default;
            level.bricks.push_back(record);
        }
    }

    return level;
}

// ============================================================================
// Population
// ============================================================================

grid::CellMetrics metrics_for_level(const LevelData& level, double available_width) {
    return grid::compute_cell_metrics(level.width, available_width);
}

grid::CellMetrics editor_metrics(const LevelData& level, const grid::CellMetrics& fallback) {
    if (!level.brick_width || !level.brick_height || *level.brick_width <= 0.0 || *level.brick_height <= 0.0) {
        return fallback;
    }

    grid::CellMetrics metrics;
    metrics.cell_width = *level.brick_width;
    metrics.cell_height = *level.brick_height;
    metrics.padding = level.padding.value_or(*level.brick_width * grid::CELL_PADDING_RATIO);
    return metrics;
}

PopulationResult populate_store(const LevelData& level, grid::BrickStore& store, const grid::CellMetrics& metrics) {
    PopulationResult result;
    const grid::GridBounds bounds = level.bounds();

    store.clear();
    store.set_bounds(bounds);

    const grid::CellMetrics legacy_metrics = editor_metrics(level, metrics);

    for (const auto& record : level.bricks) {
        grid::GridCoord cell;
        if (record.has_grid()) {
            cell = grid::GridCoord(*record.col, *record.row);
            if (!bounds.contains(cell)) {
                BRICKFALL_LOG_WARN(core::log_category::LEVEL, "Skipping {} brick outside the grid at ({}, {})",
                                   grid::brick_type_to_string(record.type), cell.x, cell.y);
                ++result.rejected;
                continue;
            }
        } else {
            cell = grid::pixel_to_grid(grid::PixelPos(record.x, record.y), legacy_metrics, bounds);
            BRICKFALL_LOG_DEBUG(core::log_category::LEVEL, "Migrated legacy brick ({:.1f}, {:.1f}) to cell ({}, {})",
                                record.x, record.y, cell.x, cell.y);
            ++result.migrated;
        }

        if (record.health <= 0) {
            BRICKFALL_LOG_WARN(core::log_category::LEVEL, "Skipping dead brick at ({}, {})", cell.x, cell.y);
            ++result.rejected;
            continue;
        }

        grid::Brick brick = brick_from_record(record, cell, metrics);
        const bool required = brick.counts_for_completion();
        if (store.add(std::move(brick)) == grid::INVALID_BRICK) {
            BRICKFALL_LOG_WARN(core::log_category::LEVEL, "Skipping brick in occupied slot {} of cell ({}, {})",
                               grid::half_slot_to_string(record.slot()), cell.x, cell.y);
            ++result.rejected;
            continue;
        }

        ++result.added;
        if (required) {
            ++result.required;
        }
    }

    BRICKFALL_LOG_INFO(core::log_category::LEVEL, "Populated level '{}': {} bricks ({} migrated, {} rejected)",
                       level.name, result.added, result.migrated, result.rejected);
    return result;
}

}  // namespace brickfall::level
