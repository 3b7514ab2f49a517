// Brickfall Destruction Tests
// destruction_engine_test.cpp - Collision dispatch and cascade tests

#include <gtest/gtest.h>

#include <brickfall/destruction/destruction_engine.hpp>

#include <algorithm>
#include <vector>

namespace brickfall::destruction {
namespace {

using grid::BrickId;
using grid::BrickType;
using grid::GridCoord;
using grid::HalfSlot;

// ============================================================================
// Recording Collaborators
// ============================================================================

class RecordingPresentation : public IPresentationSink {
public:
    void spawn_visual_effect(VisualEffect effect, const grid::PixelPos& /*position*/,
                             const EffectParams& /*params*/) override {
        effects.push_back(effect);
    }

    void update_brick_appearance(const grid::Brick& brick) override { updated.push_back(brick.id); }

    void remove_brick_visual(const grid::Brick& brick) override { removed.push_back(brick.id); }

    [[nodiscard]] size_t count(VisualEffect effect) const {
        return static_cast<size_t>(std::count(effects.begin(), effects.end(), effect));
    }

    std::vector<VisualEffect> effects;
    std::vector<BrickId> updated;
    std::vector<BrickId> removed;
};

class RecordingListener : public gameplay::IGameEventListener {
public:
    void on_level_complete() override { ++completions; }
    void on_lives_lost(int32_t count) override { lives_lost += count; }
    void on_item_drop(const grid::PixelPos& /*position*/) override { ++drops; }

    int completions = 0;
    int32_t lives_lost = 0;
    int drops = 0;
};

// ============================================================================
// Fixture
// ============================================================================

class DestructionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        session.set_listener(&listener);
        session.set_random_source([]() { return 1.0; });  // No drops

        engine.set_destruction_callback([this](const DestructionEvent& event) {
            destroyed.push_back(event.brick.id);
            destroyed_at.push_back(scheduler.now());
        });
    }

    void TearDown() override { engine.shutdown(); }

    void start(const EngineSettings& settings = make_settings()) {
        ASSERT_TRUE(engine.initialize(&store, &scheduler, &session, &presentation, settings));
        session.begin_level(store.required_count());
    }

    static EngineSettings make_settings() {
        EngineSettings settings;
        settings.seed = 99;
        return settings;
    }

    BrickId add(int32_t col, int32_t row, BrickType type = BrickType::Default, int32_t health = 1,
                HalfSlot slot = HalfSlot::None) {
        grid::Brick brick;
        brick.type = type;
        brick.grid = GridCoord(col, row);
        brick.half_slot = slot;
        brick.health = health;
        brick.max_health = health;
        brick.position = grid::PixelPos(col * 100.0, row * 40.0);
        return store.add(brick);
    }

    [[nodiscard]] bool alive(BrickId id) const { return store.find(id) != nullptr; }

    [[nodiscard]] int32_t health(BrickId id) const {
        const grid::Brick* brick = store.find(id);
        return brick != nullptr ? brick->health : 0;
    }

    HitOutcome hit(BrickId id, double now_ms = 0.0) { return engine.on_collision(ball, id, now_ms); }

    grid::BrickStore store{grid::GridBounds{10, 8}};
    core::DeferredScheduler scheduler;
    gameplay::GameSession session;
    RecordingPresentation presentation;
    RecordingListener listener;
    DestructionEngine engine;
    BallState ball;

    std::vector<BrickId> destroyed;
    std::vector<double> destroyed_at;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(DestructionEngineTest, RequiresStoreAndScheduler) {
    EXPECT_FALSE(engine.initialize(nullptr, &scheduler, nullptr, nullptr));
    EXPECT_FALSE(engine.initialize(&store, nullptr, nullptr, nullptr));
    EXPECT_FALSE(engine.is_initialized());

    EXPECT_TRUE(engine.initialize(&store, &scheduler, nullptr, nullptr));
    EXPECT_FALSE(engine.initialize(&store, &scheduler, nullptr, nullptr));
}

TEST_F(DestructionEngineTest, IgnoresCollisionsBeforeInitialize) {
    const BrickId id = add(0, 0);
    EXPECT_EQ(hit(id), HitOutcome::Ignored);
    EXPECT_TRUE(alive(id));
}

TEST_F(DestructionEngineTest, WorksWithoutOptionalCollaborators) {
    const BrickId id = add(0, 0);
    ASSERT_TRUE(engine.initialize(&store, &scheduler, nullptr, nullptr, make_settings()));

    EXPECT_EQ(hit(id), HitOutcome::Destroyed);
    EXPECT_FALSE(alive(id));
}

// ============================================================================
// Normal Hits
// ============================================================================

TEST_F(DestructionEngineTest, HitDamagesThenDestroys) {
    const BrickId id = add(2, 2, BrickType::Metal, 2);
    start();

    EXPECT_EQ(hit(id, 0.0), HitOutcome::Damaged);
    EXPECT_EQ(health(id), 1);
    EXPECT_EQ(std::count(presentation.updated.begin(), presentation.updated.end(), id), 1);

    EXPECT_EQ(hit(id, 100.0), HitOutcome::Destroyed);
    EXPECT_FALSE(alive(id));
    ASSERT_EQ(presentation.removed.size(), 1u);
    EXPECT_EQ(presentation.removed[0], id);
}

TEST_F(DestructionEngineTest, DestructionAwardsCoins) {
    grid::Brick brick;
    brick.grid = GridCoord(0, 0);
    brick.coin_value = 4;
    const BrickId id = store.add(brick);
    start();

    hit(id);
    EXPECT_EQ(session.get_coins(), 4);
    EXPECT_EQ(session.get_score(), 40);
    EXPECT_EQ(session.get_bricks_destroyed(), 1u);
}

TEST_F(DestructionEngineTest, DuplicateCollisionsAreDebounced) {
    const BrickId id = add(1, 1, BrickType::Default, 3);
    start();

    std::vector<BrickId> accepted;
    engine.set_hit_callback([&accepted](BrickId hit_id) { accepted.push_back(hit_id); });

    hit(id, 1000.0);
    hit(id, 1030.0);
    EXPECT_EQ(health(id), 2);
    EXPECT_EQ(accepted.size(), 1u);

    hit(id, 1060.0);
    EXPECT_EQ(health(id), 1);
    EXPECT_EQ(accepted.size(), 2u);
    EXPECT_EQ(engine.get_stats().collisions_debounced, 1u);
}

TEST_F(DestructionEngineTest, UnbreakableBounces) {
    const BrickId id = add(1, 1, BrickType::Unbreakable);
    start();

    EXPECT_EQ(hit(id), HitOutcome::Bounced);
    EXPECT_TRUE(alive(id));
    EXPECT_EQ(presentation.count(VisualEffect::Bounce), 1u);
}

TEST_F(DestructionEngineTest, UnbreakableBreakerCapability) {
    const BrickId id = add(1, 1, BrickType::Unbreakable);
    EngineSettings settings = make_settings();
    settings.capabilities = Capability::UnbreakableBreaker;
    start(settings);

    EXPECT_EQ(hit(id), HitOutcome::Destroyed);
    EXPECT_FALSE(alive(id));
}

TEST_F(DestructionEngineTest, BrickBreakerDoublesHitDamage) {
    const BrickId id = add(1, 1, BrickType::Gold, 2);
    start();
    engine.set_capabilities(Capability::BrickBreaker);

    EXPECT_EQ(hit(id), HitOutcome::Destroyed);
}

TEST_F(DestructionEngineTest, InvisibleRevealsOnFirstHit) {
    const BrickId id = add(3, 3, BrickType::Invisible, 2);
    start();

    hit(id);
    EXPECT_TRUE(store.find(id)->revealed);
    EXPECT_EQ(presentation.count(VisualEffect::Reveal), 1u);
}

TEST_F(DestructionEngineTest, ChaosRedirectsBallAndTakesDamage) {
    const BrickId id = add(3, 3, BrickType::Chaos, 2);
    start();
    ball.velocity = glm::dvec2(0.0, 6.0);

    EXPECT_EQ(hit(id), HitOutcome::Damaged);
    EXPECT_NEAR(glm::length(ball.velocity), 6.0, 1e-9);
    EXPECT_LE(ball.velocity.y, 1e-9);
    EXPECT_EQ(presentation.count(VisualEffect::ChaosSpin), 1u);
}

// ============================================================================
// Portals
// ============================================================================

TEST_F(DestructionEngineTest, PortalTeleportsWithoutDamage) {
    const BrickId a = add(1, 1, BrickType::Portal, 2);
    const BrickId b = add(8, 6, BrickType::Portal, 2);
    store.find(a)->pair_id = "portal_1";
    store.find(b)->pair_id = "portal_1";
    start();

    ball.velocity = glm::dvec2(2.0, 5.0);
    ball.pre_collision_velocity = glm::dvec2(2.0, -5.0);

    EXPECT_EQ(hit(a), HitOutcome::Teleported);
    EXPECT_EQ(ball.position, store.find(b)->position);
    EXPECT_EQ(ball.velocity, glm::dvec2(2.0, -5.0));
    EXPECT_EQ(health(a), 2);
    EXPECT_EQ(presentation.count(VisualEffect::PortalFlash), 2u);
    EXPECT_EQ(engine.get_stats().teleports, 1u);
}

TEST_F(DestructionEngineTest, OneWayPortalIsInert) {
    const BrickId a = add(1, 1, BrickType::Portal, 2);
    const BrickId b = add(8, 6, BrickType::Portal, 2);
    store.find(a)->pair_id = "portal_1";
    store.find(a)->is_one_way = true;
    store.find(b)->pair_id = "portal_1";
    start();

    ball.position = grid::PixelPos(5.0, 5.0);
    EXPECT_EQ(hit(a), HitOutcome::Ignored);
    EXPECT_EQ(ball.position, grid::PixelPos(5.0, 5.0));
    EXPECT_EQ(health(a), 2);
}

TEST_F(DestructionEngineTest, PortalWithoutPairIdIsAnOrdinaryBrick) {
    const BrickId id = add(1, 1, BrickType::Portal, 1);
    start();

    EXPECT_EQ(hit(id), HitOutcome::Destroyed);
}

// ============================================================================
// TNT
// ============================================================================

TEST_F(DestructionEngineTest, TntBlastResolvesRings) {
    const BrickId tnt = add(4, 4, BrickType::TNT);

    std::vector<BrickId> moore;
    for (const GridCoord& cell : {GridCoord(4, 3), GridCoord(5, 3), GridCoord(3, 4), GridCoord(5, 4),
                                  GridCoord(3, 5), GridCoord(4, 5), GridCoord(5, 5)}) {
        moore.push_back(add(cell.x, cell.y, BrickType::Default, 3));
    }
    const BrickId inner_unbreakable = add(3, 3, BrickType::Unbreakable);
    const BrickId two_rows_down = add(4, 6, BrickType::Default, 3);
    const BrickId right = add(6, 4, BrickType::Default, 3);
    const BrickId left = add(2, 4, BrickType::Default, 3);
    const BrickId outer_unbreakable = add(4, 2, BrickType::Unbreakable);
    const BrickId far = add(8, 4, BrickType::Default, 3);
    start();

    EXPECT_EQ(hit(tnt), HitOutcome::Detonated);

    EXPECT_FALSE(alive(tnt));
    for (BrickId id : moore) {
        EXPECT_FALSE(alive(id));
    }
    EXPECT_FALSE(alive(inner_unbreakable));
    EXPECT_FALSE(alive(two_rows_down));
    EXPECT_EQ(health(right), 2);
    EXPECT_EQ(health(left), 2);
    EXPECT_TRUE(alive(outer_unbreakable));
    EXPECT_EQ(health(far), 3);

    EXPECT_EQ(destroyed.size(), 10u);
    EXPECT_EQ(presentation.count(VisualEffect::TntExplosion), 1u);
    EXPECT_EQ(engine.get_stats().tnt_detonations, 1u);
}

TEST_F(DestructionEngineTest, TntChainReaction) {
    const BrickId first = add(1, 1, BrickType::TNT);
    const BrickId second = add(3, 1, BrickType::TNT);         // Ring 3 from the first
    const BrickId beyond = add(4, 1, BrickType::Default, 5);  // Out of the first blast
    start();

    hit(first);

    EXPECT_FALSE(alive(first));
    EXPECT_FALSE(alive(second));
    EXPECT_FALSE(alive(beyond));
    EXPECT_EQ(engine.get_stats().tnt_detonations, 2u);
}

TEST_F(DestructionEngineTest, TntWithoutGridUsesRadius) {
    grid::Brick legacy_tnt;
    legacy_tnt.type = BrickType::TNT;
    legacy_tnt.position = grid::PixelPos(100.0, 100.0);
    const BrickId tnt = store.add(legacy_tnt);

    grid::Brick near;
    near.position = grid::PixelPos(150.0, 100.0);
    near.health = 4;
    near.max_health = 4;
    const BrickId near_id = store.add(near);

    grid::Brick far;
    far.position = grid::PixelPos(400.0, 100.0);
    const BrickId far_id = store.add(far);
    start();

    EXPECT_TRUE(engine.detonate(tnt));
    EXPECT_FALSE(alive(tnt));
    EXPECT_FALSE(alive(near_id));
    EXPECT_TRUE(alive(far_id));
}

TEST_F(DestructionEngineTest, DetonateRejectsNonTnt) {
    const BrickId id = add(0, 0);
    start();
    EXPECT_FALSE(engine.detonate(id));
    EXPECT_TRUE(alive(id));
}

// ============================================================================
// Fuses
// ============================================================================

TEST_F(DestructionEngineTest, FuseLineBurnsOneStepAtATime) {
    std::vector<BrickId> line;
    for (int32_t col = 1; col <= 5; ++col) {
        line.push_back(add(col, 2, BrickType::FuseHorizontal));
    }
    start();

    EXPECT_EQ(hit(line[0]), HitOutcome::Destroyed);
    ASSERT_EQ(destroyed.size(), 1u);
    EXPECT_EQ(engine.get_stats().pending_fuse_steps, 4u);
    for (size_t i = 1; i < line.size(); ++i) {
        EXPECT_TRUE(store.find(line[i])->burning);
    }

    scheduler.advance_to(1000.0);

    ASSERT_EQ(destroyed, line);
    const std::vector<double> expected = {0.0, 100.0, 200.0, 300.0, 400.0};
    EXPECT_EQ(destroyed_at, expected);
    EXPECT_EQ(engine.get_stats().pending_fuse_steps, 0u);
}

TEST_F(DestructionEngineTest, FuseSplashesCardinalNeighbours) {
    const BrickId fuse = add(4, 4, BrickType::FuseVertical);
    const BrickId above = add(4, 3, BrickType::Default, 2);
    const BrickId beside = add(5, 4, BrickType::Default, 1);
    const BrickId diagonal = add(5, 5, BrickType::Default, 2);
    const BrickId wall = add(3, 4, BrickType::Unbreakable);
    start();

    hit(fuse);

    EXPECT_EQ(health(above), 1);
    EXPECT_FALSE(alive(beside));
    EXPECT_EQ(health(diagonal), 2);
    EXPECT_TRUE(alive(wall));
}

TEST_F(DestructionEngineTest, DelayedFuseStepSplashesWhenItFires) {
    const BrickId trigger = add(1, 2, BrickType::FuseHorizontal);
    add(2, 2, BrickType::FuseHorizontal);
    const BrickId above_second = add(2, 1, BrickType::Default, 2);
    start();

    hit(trigger);
    EXPECT_EQ(health(above_second), 2);

    scheduler.advance_to(99.0);
    EXPECT_EQ(health(above_second), 2);

    scheduler.advance_to(100.0);
    EXPECT_EQ(health(above_second), 1);
}

TEST_F(DestructionEngineTest, FuseBrokenMidChainIsSkipped) {
    const BrickId a = add(1, 2, BrickType::FuseHorizontal);
    const BrickId b = add(2, 2, BrickType::FuseHorizontal);
    const BrickId c = add(3, 2, BrickType::FuseHorizontal);
    start();

    hit(a);
    EXPECT_TRUE(engine.destroy(b));  // Removed before its step fires
    scheduler.advance_to(1000.0);

    EXPECT_FALSE(alive(c));
    EXPECT_EQ(std::count(destroyed.begin(), destroyed.end(), b), 1);
}

TEST_F(DestructionEngineTest, ShutdownCancelsPendingSteps) {
    std::vector<BrickId> line;
    for (int32_t col = 0; col < 4; ++col) {
        line.push_back(add(col, 0, BrickType::FuseHorizontal));
    }
    start();

    ASSERT_TRUE(engine.ignite(line[0]));
    EXPECT_EQ(scheduler.pending_count(), 3u);

    engine.shutdown();
    EXPECT_EQ(scheduler.pending_count(), 0u);

    scheduler.advance_to(1000.0);
    EXPECT_EQ(destroyed.size(), 1u);
    EXPECT_TRUE(alive(line[3]));
}

TEST_F(DestructionEngineTest, TntIgnitesFuse) {
    const BrickId tnt = add(2, 2, BrickType::TNT);
    const BrickId fuse = add(3, 2, BrickType::FuseHorizontal);
    const BrickId next = add(4, 2, BrickType::FuseHorizontal);
    start();

    hit(tnt);
    EXPECT_FALSE(alive(fuse));
    // Ring 3 from the TNT; destroyed by the blast or by the cascade
    scheduler.advance_to(1000.0);
    EXPECT_FALSE(alive(next));
}

// ============================================================================
// Level Completion
// ============================================================================

TEST_F(DestructionEngineTest, LastRequiredBrickCompletesLevel) {
    const BrickId a = add(0, 0);
    const BrickId b = add(1, 0);
    add(2, 0, BrickType::Unbreakable);
    grid::Brick optional;
    optional.grid = GridCoord(3, 0);
    optional.is_required = false;
    store.add(optional);
    start();

    hit(a);
    EXPECT_EQ(listener.completions, 0);
    hit(b);
    EXPECT_EQ(listener.completions, 1);
    EXPECT_TRUE(session.is_level_complete());
}

}  // namespace
}  // namespace brickfall::destruction
