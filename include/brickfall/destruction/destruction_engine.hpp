// Brickfall Destruction System
// destruction_engine.hpp - Collision dispatch and cascading destruction

#pragma once

#include "ball_effects.hpp"
#include "blast.hpp"
#include "brick_behavior.hpp"
#include "collision_debounce.hpp"
#include "damage.hpp"
#include "fuse_chain.hpp"
#include "presentation.hpp"

#include <brickfall/core/scheduler.hpp>
#include <brickfall/gameplay/game_session.hpp>
#include <brickfall/grid/brick_store.hpp>

#include <functional>
#include <memory>

namespace brickfall::core {
class Config;
}

namespace brickfall::destruction {

// ============================================================================
// Engine Settings
// ============================================================================

struct EngineSettings {
    Capability capabilities = Capability::None;
    DebounceConfig debounce;
    double fuse_step_delay_ms = DEFAULT_FUSE_STEP_DELAY_MS;
    double tnt_fallback_radius = DEFAULT_TNT_FALLBACK_RADIUS;
    uint32_t seed = 0;  // Chaos direction RNG, 0 = random

    [[nodiscard]] static EngineSettings from_config(const core::Config& config);
};

// ============================================================================
// Destruction Event (for callbacks)
// ============================================================================

struct DestructionEvent {
    grid::Brick brick;  // State at removal
    gameplay::DestructionReward reward;
};

using DestructionCallback = std::function<void(const DestructionEvent&)>;

// Accepted (non-debounced) collision, before dispatch
using HitCallback = std::function<void(grid::BrickId id)>;

// ============================================================================
// Destruction Engine
// ============================================================================

// Resolves ball collisions against the brick store: debounce, per-type
// dispatch, damage, TNT blasts and fuse cascades. All collaborators are
// borrowed and must outlive the engine or its shutdown() call.
class DestructionEngine {
public:
    DestructionEngine();
    ~DestructionEngine();

    // Non-copyable, non-movable
    DestructionEngine(const DestructionEngine&) = delete;
    DestructionEngine& operator=(const DestructionEngine&) = delete;
    DestructionEngine(DestructionEngine&&) = delete;
    DestructionEngine& operator=(DestructionEngine&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // store and scheduler are required; session and presentation may be null
    bool initialize(grid::BrickStore* store, core::IScheduler* scheduler, gameplay::GameSession* session,
                    IPresentationSink* presentation, const EngineSettings& settings = {});

    // Cancels every pending fuse step
    void shutdown();
    [[nodiscard]] bool is_initialized() const;

    // ========================================================================
    // Collision Entry Point
    // ========================================================================

    // Physics callback: debounced, then dispatched by brick type
    HitOutcome on_collision(BallState& ball, grid::BrickId id, double now_ms);

    // Dispatch without debounce
    HitOutcome handle_hit(BallState& ball, grid::BrickId id);

    // ========================================================================
    // Direct Triggers
    // ========================================================================

    // Detonate a TNT brick as if it had been hit
    bool detonate(grid::BrickId id);

    // Light a fuse brick as if it had reached 0 health
    bool ignite(grid::BrickId id);

    // Destroy any brick through its type path (TNT blasts, fuses ignite)
    bool destroy(grid::BrickId id);

    // ========================================================================
    // Configuration
    // ========================================================================

    [[nodiscard]] const EngineSettings& get_settings() const;
    void set_capabilities(Capability capabilities);

    // Replace the behaviour of one brick type
    void set_behavior(grid::BrickType type, std::shared_ptr<const IBrickBehavior> behavior);

    // ========================================================================
    // Callbacks
    // ========================================================================

    void set_destruction_callback(DestructionCallback callback);
    void set_hit_callback(HitCallback callback);

    // ========================================================================
    // Statistics
    // ========================================================================

    struct Stats {
        size_t collisions_received = 0;
        size_t collisions_debounced = 0;
        size_t bricks_destroyed = 0;
        size_t tnt_detonations = 0;
        size_t fuse_ignitions = 0;
        size_t fuse_steps_fired = 0;
        size_t teleports = 0;
        size_t pending_fuse_steps = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace brickfall::destruction
