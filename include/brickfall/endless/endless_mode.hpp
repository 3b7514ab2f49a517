// Brickfall Endless Mode
// endless_mode.hpp - Shape levels that descend one row per unproductive shot

#pragma once

#include "shape_generator.hpp"

#include <brickfall/destruction/presentation.hpp>
#include <brickfall/gameplay/game_session.hpp>
#include <brickfall/grid/brick_store.hpp>

#include <cstdint>
#include <memory>

namespace brickfall::endless {

// ============================================================================
// Endless Mode Manager
// ============================================================================

// Owns the endless playfield lifecycle on a 16x16 grid. The board shifts down
// one row when a shot returns to the paddle without hitting a brick, or when
// the ball is missed. Bricks pushed past the bottom row are discarded and
// every discarded required brick costs one life.
class EndlessModeManager {
public:
    EndlessModeManager();
    ~EndlessModeManager();

    // Non-copyable, non-movable
    EndlessModeManager(const EndlessModeManager&) = delete;
    EndlessModeManager& operator=(const EndlessModeManager&) = delete;
    EndlessModeManager(EndlessModeManager&&) = delete;
    EndlessModeManager& operator=(EndlessModeManager&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Resets to level 1 and fills the store with a fresh shape.
    // store is required; session and presentation may be null.
    bool initialize(grid::BrickStore* store, gameplay::GameSession* session,
                    destruction::IPresentationSink* presentation, const grid::CellMetrics& metrics,
                    const ShapeGeneratorConfig& config = {});
    void shutdown();
    [[nodiscard]] bool is_initialized() const;

    // ========================================================================
    // Shot Tracking
    // ========================================================================

    // A brick was hit during the current shot
    void on_brick_hit();
    void reset_hit_tracking();

    // Shift when the paddle was hit again with no brick hit since the last
    // shift, or when the ball was missed. Returns the number of lives lost.
    int32_t check_and_shift(double paddle_hit_time, bool ball_missed);

    // Unconditional one-row shift. Returns the number of lives lost.
    int32_t shift_down();

    // ========================================================================
    // Level Progression
    // ========================================================================

    // Increments the level (session included) and regenerates the shape
    void next_level();
    [[nodiscard]] int32_t get_level() const;

    [[nodiscard]] bool all_bricks_destroyed() const;

    // Re-derive every brick position, e.g. after a resize
    void set_metrics(const grid::CellMetrics& metrics);
    [[nodiscard]] const grid::CellMetrics& get_metrics() const;

    // ========================================================================
    // Statistics
    // ========================================================================

    struct Stats {
        size_t shapes_generated = 0;
        size_t shifts = 0;
        size_t rows_added = 0;
        size_t bricks_discarded = 0;
        size_t lives_lost = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace brickfall::endless
