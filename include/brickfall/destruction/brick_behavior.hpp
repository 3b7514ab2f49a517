// Brickfall Destruction System
// brick_behavior.hpp - Per-type hit and destroy behaviour table

#pragma once

#include "ball_effects.hpp"
#include "damage.hpp"
#include "presentation.hpp"

#include <brickfall/grid/brick_store.hpp>

#include <array>
#include <memory>
#include <random>
#include <unordered_set>

namespace brickfall::destruction {

// ============================================================================
// Resolution Pass
// ============================================================================

// Bricks already routed through destruction during one collision or cascade
// step. Stops TNT/fuse recursion on degenerate layouts.
struct ResolutionPass {
    std::unordered_set<grid::BrickId> processed;

    // Returns false if the brick was already processed
    bool mark(grid::BrickId id) { return processed.insert(id).second; }

    [[nodiscard]] bool was_processed(grid::BrickId id) const { return processed.count(id) != 0; }
};

enum class HitOutcome : uint8_t {
    Ignored,     // Debounced, unknown brick or nothing happened
    Bounced,     // Unbreakable deflection
    Damaged,
    Destroyed,
    Detonated,   // TNT blast
    Teleported,
};

[[nodiscard]] const char* hit_outcome_to_string(HitOutcome outcome);

// ============================================================================
// Destruction Context
// ============================================================================

// Engine services the behaviours act through
class IDestructionContext {
public:
    virtual ~IDestructionContext() = default;

    virtual grid::BrickStore& store() = 0;
    [[nodiscard]] virtual Capability capabilities() const = 0;
    virtual std::mt19937& rng() = 0;

    virtual void spawn_effect(VisualEffect effect, const grid::PixelPos& position, const EffectParams& params) = 0;

    // Normal hit damage, appearance update, destruction at 0 health
    virtual HitOutcome apply_hit(grid::BrickId id, ResolutionPass& pass) = 0;

    // Route a dead brick through its type's on_destroy, once per pass
    virtual void resolve_destruction(grid::BrickId id, ResolutionPass& pass) = 0;

    virtual void detonate_tnt(grid::BrickId id, ResolutionPass& pass) = 0;
    virtual void ignite_fuse(grid::BrickId id, ResolutionPass& pass) = 0;

    // Remove from the store and hand the rewards to the session
    virtual void finalize_destruction(grid::BrickId id) = 0;
};

// ============================================================================
// Brick Behaviour
// ============================================================================

class IBrickBehavior {
public:
    virtual ~IBrickBehavior() = default;

    virtual HitOutcome on_hit(IDestructionContext& context, grid::Brick& brick, BallState& ball,
                              ResolutionPass& pass) const = 0;

    virtual void on_destroy(IDestructionContext& context, grid::BrickId id, ResolutionPass& pass) const = 0;
};

// ============================================================================
// Behaviour Table
// ============================================================================

class BrickBehaviorTable {
public:
    // Registers the built-in behaviour for every brick type
    BrickBehaviorTable();
    ~BrickBehaviorTable();

    // Non-copyable, movable
    BrickBehaviorTable(const BrickBehaviorTable&) = delete;
    BrickBehaviorTable& operator=(const BrickBehaviorTable&) = delete;
    BrickBehaviorTable(BrickBehaviorTable&&) noexcept;
    BrickBehaviorTable& operator=(BrickBehaviorTable&&) noexcept;

    [[nodiscard]] const IBrickBehavior& get(grid::BrickType type) const;

    // Replace the behaviour of one type; nullptr restores the built-in one
    void set(grid::BrickType type, std::shared_ptr<const IBrickBehavior> behavior);

private:
    std::array<std::shared_ptr<const IBrickBehavior>, static_cast<size_t>(grid::BrickType::Count)> behaviors_;

    static std::shared_ptr<const IBrickBehavior> make_builtin(grid::BrickType type);
};

}  // namespace brickfall::destruction
