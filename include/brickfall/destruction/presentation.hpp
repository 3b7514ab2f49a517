// Brickfall Destruction System
// presentation.hpp - Interface to the rendering collaborator

#pragma once

#include <brickfall/grid/brick.hpp>

#include <cstdint>

namespace brickfall::destruction {

enum class VisualEffect : uint8_t {
    Bounce,        // Unbreakable deflection
    Hit,           // Damage without destruction
    TntExplosion,
    FuseBurst,
    PortalFlash,
    ChaosSpin,
    BoostPulse,
    Reveal,        // Invisible brick became visible
};

[[nodiscard]] const char* visual_effect_to_string(VisualEffect effect);

struct EffectParams {
    double radius = 0.0;
    grid::Color color = 0xffffff;
    double duration_ms = 0.0;
};

// Fire-and-forget hooks; the engine never waits on them
class IPresentationSink {
public:
    virtual ~IPresentationSink() = default;

    virtual void spawn_visual_effect(VisualEffect effect, const grid::PixelPos& position,
                                     const EffectParams& params) = 0;

    // Brick appeared or moved, or its health, metal stage, reveal or burning state changed
    virtual void update_brick_appearance(const grid::Brick& brick) = 0;

    // Called just before the brick leaves the store
    virtual void remove_brick_visual(const grid::Brick& brick) = 0;
};

}  // namespace brickfall::destruction
