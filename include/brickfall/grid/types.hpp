// Brickfall Grid System
// types.hpp - Grid coordinates, half-slots and cell <-> pixel conversion

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <glm/glm.hpp>

namespace brickfall::grid {

// ============================================================================
// Coordinate Types
// ============================================================================

// Logical cell address (x = column, y = row)
using GridCoord = glm::ivec2;

// Pixel-space centre of a brick
using PixelPos = glm::dvec2;

// Sub-cell occupancy of a brick
enum class HalfSlot : uint8_t {
    None = 0,  // Full-size brick, occupies both halves
    Left = 1,
    Right = 2
};

[[nodiscard]] inline const char* half_slot_to_string(HalfSlot slot) {
    switch (slot) {
        case HalfSlot::Left:
            return "left";
        case HalfSlot::Right:
            return "right";
        default:
            return "none";
    }
}

// ============================================================================
// Grid Bounds
// ============================================================================

struct GridBounds {
    int32_t width = 0;   // Columns
    int32_t height = 0;  // Rows

    [[nodiscard]] bool contains(const GridCoord& coord) const {
        return coord.x >= 0 && coord.x < width && coord.y >= 0 && coord.y < height;
    }

    [[nodiscard]] GridCoord clamp(const GridCoord& coord) const {
        return GridCoord(std::clamp(coord.x, 0, std::max(width - 1, 0)),
                         std::clamp(coord.y, 0, std::max(height - 1, 0)));
    }

    [[nodiscard]] size_t cell_count() const {
        return static_cast<size_t>(std::max(width, 0)) * static_cast<size_t>(std::max(height, 0));
    }
};

// Endless mode plays on a fixed square grid
inline constexpr int32_t ENDLESS_GRID_SIZE = 16;

// ============================================================================
// Cell Metrics
// ============================================================================

// Padding between cells as a fraction of the brick width
inline constexpr double CELL_PADDING_RATIO = 0.055;

// Bricks keep a 3:1 width:height aspect
inline constexpr double BRICK_ASPECT_RATIO = 3.0;

struct CellMetrics {
    double cell_width = 0.0;
    double cell_height = 0.0;
    double padding = 0.0;
    PixelPos offset{0.0, 0.0};  // Added to every derived position

    // Width of one half-size brick
    [[nodiscard]] double half_width() const { return (cell_width - padding) / 2.0; }

    // Pixel extent of a level of the given size
    [[nodiscard]] PixelPos level_extent(const GridBounds& bounds) const {
        return PixelPos((bounds.width - 1) * (cell_width + padding) + cell_width,
                        (bounds.height - 1) * (cell_height + padding) + cell_height);
    }
};

// Fit grid_width columns into available_width pixels
[[nodiscard]] inline CellMetrics compute_cell_metrics(int32_t grid_width, double available_width) {
    CellMetrics metrics;
    if (grid_width <= 0 || available_width <= 0.0) {
        return metrics;
    }
    metrics.cell_width = available_width / (grid_width + (grid_width - 1) * CELL_PADDING_RATIO);
    metrics.padding = metrics.cell_width * CELL_PADDING_RATIO;
    metrics.cell_height = metrics.cell_width / BRICK_ASPECT_RATIO;
    return metrics;
}

// ============================================================================
// Cell <-> Pixel Conversion
// ============================================================================

[[nodiscard]] inline PixelPos to_pixel(int32_t col, int32_t row, HalfSlot slot, double cell_width,
                                       double cell_height, double padding) {
    const double cell_left = col * (cell_width + padding);
    const double y = row * (cell_height + padding) + cell_height / 2.0;

    switch (slot) {
        case HalfSlot::Left: {
            const double half_width = (cell_width - padding) / 2.0;
            return PixelPos(cell_left + half_width / 2.0, y);
        }
        case HalfSlot::Right: {
            const double half_width = (cell_width - padding) / 2.0;
            return PixelPos(cell_left + cell_width / 2.0 + padding / 2.0 + half_width / 2.0, y);
        }
        default:
            return PixelPos(cell_left + cell_width / 2.0, y);
    }
}

[[nodiscard]] inline PixelPos to_pixel(const GridCoord& coord, HalfSlot slot, const CellMetrics& metrics) {
    return to_pixel(coord.x, coord.y, slot, metrics.cell_width, metrics.cell_height, metrics.padding) +
           metrics.offset;
}

// Legacy migration: nearest cell for a stored pixel centre, clamped to bounds
[[nodiscard]] inline GridCoord pixel_to_grid(const PixelPos& pos, const CellMetrics& metrics,
                                             const GridBounds& bounds) {
    const double step_x = metrics.cell_width + metrics.padding;
    const double step_y = metrics.cell_height + metrics.padding;
    if (step_x <= 0.0 || step_y <= 0.0) {
        return bounds.clamp(GridCoord(0, 0));
    }

    const PixelPos local = pos - metrics.offset;
    // JavaScript-style rounding (half rounds toward +inf) to match stored editor data
    const auto col = static_cast<int32_t>(std::floor((local.x - metrics.cell_width / 2.0) / step_x + 0.5));
    const auto row = static_cast<int32_t>(std::floor((local.y - metrics.cell_height / 2.0) / step_y + 0.5));
    return bounds.clamp(GridCoord(col, row));
}

// ============================================================================
// Neighbourhood
// ============================================================================

inline constexpr GridCoord CARDINAL_OFFSETS[4] = {{0, -1}, {0, 1}, {-1, 0}, {1, 0}};

}  // namespace brickfall::grid

// ============================================================================
// Hash Specializations
// ============================================================================

namespace std {

template <>
struct hash<brickfall::grid::GridCoord> {
    size_t operator()(const brickfall::grid::GridCoord& pos) const noexcept {
        size_t h1 = std::hash<int32_t>{}(pos.x);
        size_t h2 = std::hash<int32_t>{}(pos.y);
        return h1 ^ (h2 * 0x9e3779b97f4a7c15ULL);
    }
};

}  // namespace std
