// Brickfall Endless Mode
// shape_generator.hpp - Random brick formations for the 16x16 endless grid

#pragma once

#include <brickfall/grid/types.hpp>
#include <brickfall/level/level_data.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace brickfall::endless {

// ============================================================================
// Shape Types
// ============================================================================

enum class ShapeType : uint8_t {
    Rectangle = 0,
    Ellipse,
    Triangle,  // Pointing up
    Diamond,
    Cross,
    Count
};

[[nodiscard]] const char* shape_type_to_string(ShapeType type);

// Endless bricks draw from this palette uniformly
inline constexpr grid::Color ENDLESS_PALETTE[] = {0xff6b6b, 0x4ecdc4, 0x45b7d1, 0xffa07a, 0x98d8c8, 0xf7dc6f};

// ============================================================================
// Shape
// ============================================================================

struct ShapeParams {
    ShapeType type = ShapeType::Rectangle;
    int32_t width = 4;   // Cells
    int32_t height = 4;  // Cells
    grid::GridCoord center{0, 0};
    bool filled = true;  // false = outline only

    // Cell lies inside the shape
    [[nodiscard]] bool contains(const grid::GridCoord& cell) const;

    // Cell is inside with at least one 4-neighbour outside
    [[nodiscard]] bool on_border(const grid::GridCoord& cell) const;

    // Whether a brick goes into this cell
    [[nodiscard]] bool covers(const grid::GridCoord& cell) const { return filled ? contains(cell) : on_border(cell); }
};

// ============================================================================
// Generator Configuration
// ============================================================================

struct ShapeGeneratorConfig {
    uint32_t seed = 0;  // 0 = random
    int32_t grid_size = grid::ENDLESS_GRID_SIZE;
    int32_t min_size = 4;
    int32_t max_size = 10;
    double outline_chance = 0.3;
    double half_size_chance = 0.3;
    int32_t row_min_bricks = 3;
    int32_t row_max_bricks = 6;
};

// ============================================================================
// Shape Generator
// ============================================================================

// Brick stats scale with the endless level: metal unlocks at level 2, gold
// at level 3. Positions are derived from the given metrics.
class ShapeGenerator {
public:
    explicit ShapeGenerator(const ShapeGeneratorConfig& config = {});
    ~ShapeGenerator();

    // Non-copyable but movable
    ShapeGenerator(const ShapeGenerator&) = delete;
    ShapeGenerator& operator=(const ShapeGenerator&) = delete;
    ShapeGenerator(ShapeGenerator&&) noexcept;
    ShapeGenerator& operator=(ShapeGenerator&&) noexcept;

    // ========================================================================
    // Generation
    // ========================================================================

    // Random shape that fits inside the grid
    [[nodiscard]] ShapeParams random_shape();

    // One brick per covered cell, row-major
    [[nodiscard]] std::vector<level::BrickRecord> generate_bricks(int32_t level, const ShapeParams& shape,
                                                                  const grid::CellMetrics& metrics);

    // random_shape() + generate_bricks()
    [[nodiscard]] std::vector<level::BrickRecord> generate(int32_t level, const grid::CellMetrics& metrics);

    // Bricks in distinct random columns of one row
    [[nodiscard]] std::vector<level::BrickRecord> generate_row(int32_t level, int32_t row,
                                                               const grid::CellMetrics& metrics);

    // Single random brick for a cell
    [[nodiscard]] level::BrickRecord random_brick(int32_t level, const grid::GridCoord& cell,
                                                  const grid::CellMetrics& metrics);

    // ========================================================================
    // Configuration
    // ========================================================================

    [[nodiscard]] const ShapeGeneratorConfig& get_config() const;
    void reseed(uint32_t seed);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace brickfall::endless
