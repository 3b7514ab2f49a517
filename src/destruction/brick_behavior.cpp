// Brickfall Destruction System
// brick_behavior.cpp - Built-in brick behaviours

#include <brickfall/core/logger.hpp>
#include <brickfall/destruction/brick_behavior.hpp>

namespace brickfall::destruction {

namespace {

// ============================================================================
// Effect Styling
// ============================================================================

constexpr EffectParams BOUNCE_EFFECT{0.0, 0xffffff, 100.0};
constexpr EffectParams PORTAL_EFFECT{0.0, 0x9b59bd, 150.0};
constexpr EffectParams CHAOS_EFFECT{0.0, 0xffffff, 200.0};
constexpr EffectParams BOOST_EFFECT{0.0, 0xffffff, 200.0};

// ============================================================================
// Built-in Behaviours
// ============================================================================

// Default, Metal, Gold and Invisible: normal damage, ordinary destruction
class DefaultBehavior : public IBrickBehavior {
public:
    HitOutcome on_hit(IDestructionContext& context, grid::Brick& brick, BallState& /*ball*/,
                      ResolutionPass& pass) const override {
        return context.apply_hit(brick.id, pass);
    }

    void on_destroy(IDestructionContext& context, grid::BrickId id, ResolutionPass& /*pass*/) const override {
        context.finalize_destruction(id);
    }
};

class UnbreakableBehavior : public DefaultBehavior {
public:
    HitOutcome on_hit(IDestructionContext& context, grid::Brick& brick, BallState& ball,
                      ResolutionPass& pass) const override {
        if (!has_capability(context.capabilities(), Capability::UnbreakableBreaker)) {
            context.spawn_effect(VisualEffect::Bounce, brick.position, BOUNCE_EFFECT);
            return HitOutcome::Bounced;
        }
        return DefaultBehavior::on_hit(context, brick, ball, pass);
    }
};

// Any hit detonates, bypassing health
class TntBehavior : public IBrickBehavior {
public:
    HitOutcome on_hit(IDestructionContext& context, grid::Brick& brick, BallState& /*ball*/,
                      ResolutionPass& pass) const override {
        context.resolve_destruction(brick.id, pass);
        return HitOutcome::Detonated;
    }

    void on_destroy(IDestructionContext& context, grid::BrickId id, ResolutionPass& pass) const override {
        context.detonate_tnt(id, pass);
    }
};

class PortalBehavior : public DefaultBehavior {
public:
    HitOutcome on_hit(IDestructionContext& context, grid::Brick& brick, BallState& ball,
                      ResolutionPass& pass) const override {
        // A portal without a pair id is an ordinary brick
        if (!brick.pair_id) {
            return DefaultBehavior::on_hit(context, brick, ball, pass);
        }

        if (brick.is_one_way) {
            return HitOutcome::Ignored;
        }

        const grid::Brick* partner = find_portal_partner(context.store(), brick);
        if (partner == nullptr) {
            BRICKFALL_LOG_DEBUG(core::log_category::DESTRUCTION, "Portal '{}' has no live partner", *brick.pair_id);
            return HitOutcome::Ignored;
        }

        const grid::PixelPos destination = partner->position;
        if (!teleport_ball(ball, context.store(), brick)) {
            return HitOutcome::Ignored;
        }
        context.spawn_effect(VisualEffect::PortalFlash, brick.position, PORTAL_EFFECT);
        context.spawn_effect(VisualEffect::PortalFlash, destination, PORTAL_EFFECT);
        return HitOutcome::Teleported;
    }
};

class ChaosBehavior : public DefaultBehavior {
public:
    HitOutcome on_hit(IDestructionContext& context, grid::Brick& brick, BallState& ball,
                      ResolutionPass& pass) const override {
        randomize_ball_direction(ball, context.rng());
        context.spawn_effect(VisualEffect::ChaosSpin, brick.position, CHAOS_EFFECT);
        return DefaultBehavior::on_hit(context, brick, ball, pass);
    }
};

// Visual pulse only until buffs exist
class BoostBehavior : public DefaultBehavior {
public:
    HitOutcome on_hit(IDestructionContext& context, grid::Brick& brick, BallState& ball,
                      ResolutionPass& pass) const override {
        context.spawn_effect(VisualEffect::BoostPulse, brick.position, BOOST_EFFECT);
        return DefaultBehavior::on_hit(context, brick, ball, pass);
    }
};

class FuseBehavior : public IBrickBehavior {
public:
    HitOutcome on_hit(IDestructionContext& context, grid::Brick& brick, BallState& /*ball*/,
                      ResolutionPass& pass) const override {
        brick.burning = true;
        return context.apply_hit(brick.id, pass);
    }

    void on_destroy(IDestructionContext& context, grid::BrickId id, ResolutionPass& pass) const override {
        context.ignite_fuse(id, pass);
    }
};

}  // namespace

const char* hit_outcome_to_string(HitOutcome outcome) {
    switch (outcome) {
        case HitOutcome::Ignored:
            return "ignored";
        case HitOutcome::Bounced:
            return "bounced";
        case HitOutcome::Damaged:
            return "damaged";
        case HitOutcome::Destroyed:
            return "destroyed";
        case HitOutcome::Detonated:
            return "detonated";
        case HitOutcome::Teleported:
            return "teleported";
        default:
            return "unknown";
    }
}

// ============================================================================
// BrickBehaviorTable
// ============================================================================

BrickBehaviorTable::BrickBehaviorTable() {
    for (size_t i = 0; i < behaviors_.size(); ++i) {
        behaviors_[i] = make_builtin(static_cast<grid::BrickType>(i));
    }
}

BrickBehaviorTable::~BrickBehaviorTable() = default;

BrickBehaviorTable::BrickBehaviorTable(BrickBehaviorTable&&) noexcept = default;
BrickBehaviorTable& BrickBehaviorTable::operator=(BrickBehaviorTable&&) noexcept = default;

const IBrickBehavior& BrickBehaviorTable::get(grid::BrickType type) const {
    auto index = static_cast<size_t>(type);
    if (index >= behaviors_.size()) {
        index = static_cast<size_t>(grid::BrickType::Default);
    }
    return *behaviors_[index];
}

void BrickBehaviorTable::set(grid::BrickType type, std::shared_ptr<const IBrickBehavior> behavior) {
    const auto index = static_cast<size_t>(type);
    if (index >= behaviors_.size()) {
        return;
    }
    behaviors_[index] = behavior ? std::move(behavior) : make_builtin(type);
}

std::shared_ptr<const IBrickBehavior> BrickBehaviorTable::make_builtin(grid::BrickType type) {
    static const auto default_behavior = std::make_shared<const DefaultBehavior>();
    static const auto unbreakable_behavior = std::make_shared<const UnbreakableBehavior>();
    static const auto tnt_behavior = std::make_shared<const TntBehavior>();
    static const auto portal_behavior = std::make_shared<const PortalBehavior>();
    static const auto chaos_behavior = std::make_shared<const ChaosBehavior>();
    static const auto boost_behavior = std::make_shared<const BoostBehavior>();
    static const auto fuse_behavior = std::make_shared<const FuseBehavior>();

    if (grid::is_fuse_type(type)) {
        return fuse_behavior;
    }
    switch (type) {
        case grid::BrickType::Unbreakable:
            return unbreakable_behavior;
        case grid::BrickType::TNT:
            return tnt_behavior;
        case grid::BrickType::Portal:
            return portal_behavior;
        case grid::BrickType::Chaos:
            return chaos_behavior;
        case grid::BrickType::Boost:
            return boost_behavior;
        default:
            return default_behavior;
    }
}

}  // namespace brickfall::destruction
