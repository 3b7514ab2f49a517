// Brickfall Destruction System
// destruction_engine.cpp - Destruction engine implementation

#include <algorithm>
#include <brickfall/core/config.hpp>
#include <brickfall/core/logger.hpp>
#include <brickfall/destruction/destruction_engine.hpp>
#include <map>
#include <random>
#include <string>
#include <unordered_map>

namespace brickfall::destruction {

namespace {

constexpr EffectParams TNT_EFFECT{100.0, 0xff0000, 300.0};
constexpr EffectParams FUSE_EFFECT{60.0, 0xff8800, 200.0};
constexpr EffectParams HIT_EFFECT{0.0, 0xffffff, 50.0};
constexpr EffectParams REVEAL_EFFECT{0.0, 0xffffff, 200.0};

}  // namespace

// ============================================================================
// EngineSettings
// ============================================================================

EngineSettings EngineSettings::from_config(const core::Config& config) {
    using namespace core;

    EngineSettings settings;
    settings.capabilities =
        capabilities_from_string(config.get_string(config_section::GAMEPLAY, config_key::TALENTS, ""));
    settings.debounce.window_ms =
        config.get_double(config_section::COLLISION, config_key::DEBOUNCE_WINDOW_MS, settings.debounce.window_ms);
    settings.debounce.prune_threshold = static_cast<size_t>(
        std::max(0, config.get_int(config_section::COLLISION, config_key::PRUNE_THRESHOLD,
                                   static_cast<int>(settings.debounce.prune_threshold))));
    settings.debounce.prune_max_age_ms = config.get_double(config_section::COLLISION, config_key::PRUNE_MAX_AGE_MS,
                                                           settings.debounce.prune_max_age_ms);
    settings.fuse_step_delay_ms =
        config.get_double(config_section::EXPLOSIONS, config_key::FUSE_STEP_DELAY_MS, settings.fuse_step_delay_ms);
    settings.tnt_fallback_radius =
        config.get_double(config_section::EXPLOSIONS, config_key::TNT_FALLBACK_RADIUS, settings.tnt_fallback_radius);
    settings.seed = static_cast<uint32_t>(std::max(0, config.get_int(config_section::ENDLESS, config_key::SEED, 0)));
    return settings;
}

// ============================================================================
// Implementation Details
// ============================================================================

struct DestructionEngine::Impl : public IDestructionContext {
    EngineSettings settings;
    bool initialized = false;

    grid::BrickStore* brick_store = nullptr;
    core::IScheduler* scheduler = nullptr;
    gameplay::GameSession* session = nullptr;
    IPresentationSink* presentation = nullptr;

    BrickBehaviorTable behaviors;
    CollisionDebouncer debouncer;
    std::mt19937 random;

    // Pending cascade steps by step id
    std::unordered_map<uint64_t, core::ScheduleHandle> pending_steps;
    uint64_t next_step_id = 1;

    DestructionCallback destruction_callback;
    HitCallback hit_callback;

    Stats stats;

    // ========================================================================
    // IDestructionContext
    // ========================================================================

    grid::BrickStore& store() override { return *brick_store; }

    Capability capabilities() const override { return settings.capabilities; }

    std::mt19937& rng() override { return random; }

    void spawn_effect(VisualEffect effect, const grid::PixelPos& position, const EffectParams& params) override {
        if (presentation != nullptr) {
            presentation->spawn_visual_effect(effect, position, params);
        }
    }

    HitOutcome apply_hit(grid::BrickId id, ResolutionPass& pass) override {
        grid::Brick* brick = brick_store->find(id);
        if (brick == nullptr) {
            return HitOutcome::Ignored;
        }

        const DamageResult result =
            apply_damage(*brick, hit_damage(settings.capabilities), DamageSource::Hit, settings.capabilities);
        if (result.revealed) {
            spawn_effect(VisualEffect::Reveal, brick->position, REVEAL_EFFECT);
        }
        if (result.destroyed) {
            resolve_destruction(id, pass);
            return HitOutcome::Destroyed;
        }
        if (result.applied > 0) {
            notify_appearance(*brick);
            spawn_effect(VisualEffect::Hit, brick->position, HIT_EFFECT);
            return HitOutcome::Damaged;
        }
        return HitOutcome::Ignored;
    }

    void resolve_destruction(grid::BrickId id, ResolutionPass& pass) override {
        if (!pass.mark(id)) {
            return;
        }
        const grid::Brick* brick = brick_store->find(id);
        if (brick == nullptr) {
            return;
        }
        behaviors.get(brick->type).on_destroy(*this, id, pass);
    }

    void detonate_tnt(grid::BrickId id, ResolutionPass& pass) override {
        grid::Brick* tnt = brick_store->find(id);
        if (tnt == nullptr) {
            return;
        }
        tnt->health = 0;
        ++stats.tnt_detonations;
        spawn_effect(VisualEffect::TntExplosion, tnt->position, TNT_EFFECT);

        if (!tnt->grid) {
            BRICKFALL_LOG_WARN(core::log_category::DESTRUCTION,
                               "TNT brick {} has no grid coordinates, using {}px radius fallback", id,
                               settings.tnt_fallback_radius);
            for (grid::BrickId target : plan_fallback_blast(*brick_store, id, settings.tnt_fallback_radius)) {
                grid::Brick* brick = brick_store->find(target);
                if (brick == nullptr || pass.was_processed(target)) {
                    continue;
                }
                brick->health = 0;
                resolve_destruction(target, pass);
            }
            finalize_destruction(id);
            return;
        }

        // Damage is planned from one snapshot; no distances are re-evaluated
        const auto targets = plan_blast(*brick_store, id);
        std::map<int32_t, size_t> hits_by_ring;
        for (const auto& target : targets) {
            grid::Brick* brick = brick_store->find(target.id);
            if (brick == nullptr || pass.was_processed(target.id)) {
                continue;  // Removed by an earlier chain reaction in this pass
            }
            ++hits_by_ring[target.ring];

            const DamageResult result = apply_damage(*brick, target.damage, target.source, settings.capabilities);
            if (result.destroyed) {
                resolve_destruction(target.id, pass);
            } else if (result.applied > 0) {
                notify_appearance(*brick);
                spawn_effect(VisualEffect::Hit, brick->position, HIT_EFFECT);
            }
        }

        if (core::Logger::is_enabled(core::LogLevel::Debug, core::log_category::DESTRUCTION)) {
            std::string summary;
            for (const auto& [ring, count] : hits_by_ring) {
                summary += fmt::format(" ring{}={}", ring, count);
            }
            BRICKFALL_LOG_DEBUG(core::log_category::DESTRUCTION, "TNT {} at ({}, {}) hit {} bricks:{}", id,
                                tnt->grid->x, tnt->grid->y, targets.size(), summary);
        }

        finalize_destruction(id);
    }

    void ignite_fuse(grid::BrickId id, ResolutionPass& pass) override {
        grid::Brick* fuse = brick_store->find(id);
        if (fuse == nullptr) {
            return;
        }
        fuse->health = 0;
        fuse->burning = true;
        ++stats.fuse_ignitions;
        spawn_effect(VisualEffect::FuseBurst, fuse->position, FUSE_EFFECT);

        if (!fuse->grid) {
            finalize_destruction(id);
            return;
        }
        const grid::GridCoord cell = *fuse->grid;

        // The igniting fuse is index 0 and burns now; the rest follow in BFS order
        const auto chain = find_connected_fuses(*brick_store, id);
        for (size_t i = 1; i < chain.size(); ++i) {
            grid::Brick* link = brick_store->find(chain[i]);
            if (link == nullptr) {
                continue;
            }
            if (!link->burning) {
                link->burning = true;
                notify_appearance(*link);
            }
            schedule_fuse_step(chain[i], static_cast<double>(i) * settings.fuse_step_delay_ms);
        }
        if (chain.size() > 1) {
            BRICKFALL_LOG_DEBUG(core::log_category::DESTRUCTION, "Fuse {} lit a chain of {} bricks", id,
                                chain.size());
        }

        splash(cell, pass);
        finalize_destruction(id);
    }

    void finalize_destruction(grid::BrickId id) override {
        grid::Brick* live = brick_store->find(id);
        if (live == nullptr) {
            return;
        }

        DestructionEvent event;
        event.brick = *live;
        event.brick.health = 0;

        if (presentation != nullptr) {
            presentation->remove_brick_visual(event.brick);
        }
        brick_store->remove(id);
        debouncer.forget(id);
        ++stats.bricks_destroyed;

        if (session != nullptr) {
            event.reward = session->on_brick_destroyed(event.brick);
        }
        if (destruction_callback) {
            destruction_callback(event);
        }
    }

    // ========================================================================
    // Helpers
    // ========================================================================

    void notify_appearance(const grid::Brick& brick) {
        if (presentation != nullptr) {
            presentation->update_brick_appearance(brick);
        }
    }

    // One damage to each cardinal neighbour that is neither fuse nor unbreakable
    void splash(const grid::GridCoord& cell, ResolutionPass& pass) {
        for (grid::BrickId target : splash_targets(*brick_store, cell)) {
            grid::Brick* brick = brick_store->find(target);
            if (brick == nullptr || pass.was_processed(target)) {
                continue;
            }
            const DamageResult result =
                apply_damage(*brick, FUSE_SPLASH_DAMAGE, DamageSource::Splash, settings.capabilities);
            if (result.revealed) {
                spawn_effect(VisualEffect::Reveal, brick->position, REVEAL_EFFECT);
            }
            if (result.destroyed) {
                resolve_destruction(target, pass);
            } else if (result.applied > 0) {
                notify_appearance(*brick);
                spawn_effect(VisualEffect::Hit, brick->position, HIT_EFFECT);
            }
        }
    }

    void schedule_fuse_step(grid::BrickId id, double delay_ms) {
        const uint64_t step_id = next_step_id++;
        const core::ScheduleHandle handle = scheduler->schedule(
            [this, step_id, id]() {
                pending_steps.erase(step_id);
                run_fuse_step(id);
            },
            delay_ms);
        pending_steps.emplace(step_id, handle);
    }

    // Deferred cascade step: the fuse may have been destroyed meanwhile
    void run_fuse_step(grid::BrickId id) {
        if (!initialized) {
            return;
        }
        grid::Brick* fuse = brick_store->find(id);
        if (fuse == nullptr) {
            return;
        }
        ++stats.fuse_steps_fired;

        ResolutionPass pass;
        pass.mark(id);
        fuse->health = 0;
        spawn_effect(VisualEffect::FuseBurst, fuse->position, FUSE_EFFECT);
        if (fuse->grid) {
            splash(*fuse->grid, pass);
        }
        finalize_destruction(id);
    }

    void cancel_pending_steps() {
        for (const auto& [step_id, handle] : pending_steps) {
            scheduler->cancel(handle);
        }
        pending_steps.clear();
    }
};

// ============================================================================
// DestructionEngine
// ============================================================================

DestructionEngine::DestructionEngine() : impl_(std::make_unique<Impl>()) {}

DestructionEngine::~DestructionEngine() {
    shutdown();
}

bool DestructionEngine::initialize(grid::BrickStore* store, core::IScheduler* scheduler,
                                   gameplay::GameSession* session, IPresentationSink* presentation,
                                   const EngineSettings& settings) {
    if (impl_->initialized) {
        BRICKFALL_LOG_WARN(core::log_category::DESTRUCTION, "Destruction engine already initialized");
        return false;
    }
    if (store == nullptr || scheduler == nullptr) {
        BRICKFALL_LOG_ERROR(core::log_category::DESTRUCTION, "Destruction engine requires a brick store and scheduler");
        return false;
    }

    impl_->brick_store = store;
    impl_->scheduler = scheduler;
    impl_->session = session;
    impl_->presentation = presentation;
    impl_->settings = settings;
    impl_->debouncer.set_config(settings.debounce);
    impl_->debouncer.clear();
    impl_->random.seed(settings.seed != 0 ? settings.seed : std::random_device{}());
    impl_->stats = {};
    impl_->initialized = true;

    BRICKFALL_LOG_DEBUG(core::log_category::DESTRUCTION, "Destruction engine initialized with {} bricks",
                        store->size());
    return true;
}

void DestructionEngine::shutdown() {
    if (!impl_->initialized) {
        return;
    }
    impl_->cancel_pending_steps();
    impl_->debouncer.clear();
    impl_->initialized = false;
    impl_->brick_store = nullptr;
    impl_->scheduler = nullptr;
    impl_->session = nullptr;
    impl_->presentation = nullptr;
}

bool DestructionEngine::is_initialized() const {
    return impl_->initialized;
}

HitOutcome DestructionEngine::on_collision(BallState& ball, grid::BrickId id, double now_ms) {
    if (!impl_->initialized) {
        return HitOutcome::Ignored;
    }
    ++impl_->stats.collisions_received;

    const grid::Brick* brick = impl_->brick_store->find(id);
    if (brick == nullptr || brick->is_destroyed()) {
        return HitOutcome::Ignored;
    }
    if (!impl_->debouncer.should_accept(id, now_ms)) {
        ++impl_->stats.collisions_debounced;
        BRICKFALL_LOG_TRACE(core::log_category::DESTRUCTION, "Debounced collision with brick {} at {}ms", id, now_ms);
        return HitOutcome::Ignored;
    }

    if (impl_->hit_callback) {
        impl_->hit_callback(id);
    }
    return handle_hit(ball, id);
}

HitOutcome DestructionEngine::handle_hit(BallState& ball, grid::BrickId id) {
    if (!impl_->initialized) {
        return HitOutcome::Ignored;
    }
    grid::Brick* brick = impl_->brick_store->find(id);
    if (brick == nullptr || brick->is_destroyed()) {
        return HitOutcome::Ignored;
    }

    ResolutionPass pass;
    const HitOutcome outcome = impl_->behaviors.get(brick->type).on_hit(*impl_, *brick, ball, pass);
    if (outcome == HitOutcome::Teleported) {
        ++impl_->stats.teleports;
    }
    BRICKFALL_LOG_TRACE(core::log_category::DESTRUCTION, "Hit brick {}: {}", id, hit_outcome_to_string(outcome));
    return outcome;
}

bool DestructionEngine::detonate(grid::BrickId id) {
    if (!impl_->initialized) {
        return false;
    }
    const grid::Brick* brick = impl_->brick_store->find(id);
    if (brick == nullptr || brick->type != grid::BrickType::TNT) {
        return false;
    }
    ResolutionPass pass;
    impl_->resolve_destruction(id, pass);
    return true;
}

bool DestructionEngine::ignite(grid::BrickId id) {
    if (!impl_->initialized) {
        return false;
    }
    const grid::Brick* brick = impl_->brick_store->find(id);
    if (brick == nullptr || !brick->is_fuse()) {
        return false;
    }
    ResolutionPass pass;
    impl_->resolve_destruction(id, pass);
    return true;
}

bool DestructionEngine::destroy(grid::BrickId id) {
    if (!impl_->initialized) {
        return false;
    }
    grid::Brick* brick = impl_->brick_store->find(id);
    if (brick == nullptr) {
        return false;
    }
    brick->health = 0;
    ResolutionPass pass;
    impl_->resolve_destruction(id, pass);
    return true;
}

const EngineSettings& DestructionEngine::get_settings() const {
    return impl_->settings;
}

void DestructionEngine::set_capabilities(Capability capabilities) {
    impl_->settings.capabilities = capabilities;
}

void DestructionEngine::set_behavior(grid::BrickType type, std::shared_ptr<const IBrickBehavior> behavior) {
    impl_->behaviors.set(type, std::move(behavior));
}

void DestructionEngine::set_destruction_callback(DestructionCallback callback) {
    impl_->destruction_callback = std::move(callback);
}

void DestructionEngine::set_hit_callback(HitCallback callback) {
    impl_->hit_callback = std::move(callback);
}

DestructionEngine::Stats DestructionEngine::get_stats() const {
    Stats stats = impl_->stats;
    stats.pending_fuse_steps = impl_->pending_steps.size();
    return stats;
}

}  // namespace brickfall::destruction
