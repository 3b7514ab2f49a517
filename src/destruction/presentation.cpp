// Brickfall Destruction System
// presentation.cpp - Visual effect names

#include <brickfall/destruction/presentation.hpp>

namespace brickfall::destruction {

const char* visual_effect_to_string(VisualEffect effect) {
    switch (effect) {
        case VisualEffect::Bounce:
            return "bounce";
        case VisualEffect::Hit:
            return "hit";
        case VisualEffect::TntExplosion:
            return "tnt-explosion";
        case VisualEffect::FuseBurst:
            return "fuse-burst";
        case VisualEffect::PortalFlash:
            return "portal-flash";
        case VisualEffect::ChaosSpin:
            return "chaos-spin";
        case VisualEffect::BoostPulse:
            return "boost-pulse";
        case VisualEffect::Reveal:
            return "reveal";
        default:
            return "unknown";
    }
}

}  // namespace brickfall::destruction
