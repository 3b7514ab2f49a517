// Brickfall Endless Mode Tests
// endless_mode_test.cpp - Descending board and level progression tests

#include <gtest/gtest.h>

#include <brickfall/endless/endless_mode.hpp>

#include <vector>

namespace brickfall::endless {
namespace {

class RecordingPresentation : public destruction::IPresentationSink {
public:
    void spawn_visual_effect(destruction::VisualEffect /*effect*/, const grid::PixelPos& /*position*/,
                             const destruction::EffectParams& /*params*/) override {}

    void update_brick_appearance(const grid::Brick& brick) override { shown.push_back(brick.id); }

    void remove_brick_visual(const grid::Brick& brick) override { hidden.push_back(brick.id); }

    std::vector<grid::BrickId> shown;
    std::vector<grid::BrickId> hidden;
};

class LivesListener : public gameplay::IGameEventListener {
public:
    void on_level_complete() override { ++completions; }
    void on_lives_lost(int32_t count) override { lives_lost += count; }
    void on_item_drop(const grid::PixelPos& /*position*/) override {}

    int completions = 0;
    int32_t lives_lost = 0;
};

class EndlessModeTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.seed = 4242;
        metrics = grid::compute_cell_metrics(grid::ENDLESS_GRID_SIZE, 800.0);
        session.set_listener(&listener);
    }

    void start() { ASSERT_TRUE(endless.initialize(&store, &session, &presentation, metrics, config)); }

    // Replace the generated shape with a hand-placed board
    void clear_board() {
        store.clear();
        presentation.shown.clear();
        presentation.hidden.clear();
    }

    grid::BrickId place(int32_t col, int32_t row, bool required = true) {
        grid::Brick brick;
        brick.grid = grid::GridCoord(col, row);
        brick.position = grid::to_pixel(*brick.grid, grid::HalfSlot::None, metrics);
        brick.is_required = required;
        return store.add(brick);
    }

    ShapeGeneratorConfig config;
    grid::CellMetrics metrics;
    grid::BrickStore store;
    gameplay::GameSession session;
    LivesListener listener;
    RecordingPresentation presentation;
    EndlessModeManager endless;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(EndlessModeTest, RequiresAStore) {
    EXPECT_FALSE(endless.initialize(nullptr, &session, nullptr, metrics, config));
    EXPECT_FALSE(endless.is_initialized());
}

TEST_F(EndlessModeTest, RejectsInvalidGeneratorConfig) {
    config.min_size = 8;
    config.max_size = 4;
    EXPECT_FALSE(endless.initialize(&store, &session, nullptr, metrics, config));

    config.min_size = 4;
    config.max_size = 20;
    EXPECT_FALSE(endless.initialize(&store, &session, nullptr, metrics, config));
}

TEST_F(EndlessModeTest, InitializeGeneratesTheFirstShape) {
    start();

    EXPECT_EQ(endless.get_level(), 1);
    EXPECT_FALSE(store.empty());
    EXPECT_EQ(store.get_bounds().width, grid::ENDLESS_GRID_SIZE);
    EXPECT_EQ(store.get_bounds().height, grid::ENDLESS_GRID_SIZE);
    EXPECT_EQ(session.get_required_remaining(), static_cast<int64_t>(store.required_count()));
    EXPECT_EQ(presentation.shown.size(), store.size());
    EXPECT_EQ(endless.get_stats().shapes_generated, 1u);

    store.for_each([](const grid::Brick& brick) { EXPECT_EQ(brick.type, grid::BrickType::Default); });
}

TEST_F(EndlessModeTest, ShutdownStopsShifting) {
    start();
    endless.shutdown();

    EXPECT_FALSE(endless.is_initialized());
    EXPECT_EQ(endless.check_and_shift(100.0, true), 0);
}

// ============================================================================
// Shifting
// ============================================================================

TEST_F(EndlessModeTest, EmptyShotShiftsTheBoardDown) {
    start();
    clear_board();
    const grid::BrickId id = place(4, 5);
    session.begin_level(store.required_count());

    EXPECT_EQ(endless.check_and_shift(100.0, false), 0);

    const grid::Brick* moved = store.find(id);
    ASSERT_NE(moved, nullptr);
    EXPECT_EQ(*moved->grid, grid::GridCoord(4, 6));
    EXPECT_EQ(moved->position, grid::to_pixel({4, 6}, grid::HalfSlot::None, metrics));

    // Fresh top row of 3 to 6 bricks
    size_t top_row = 0;
    store.for_each([&top_row](const grid::Brick& brick) {
        if (brick.grid && brick.grid->y == 0) {
            ++top_row;
        }
    });
    EXPECT_GE(top_row, 3u);
    EXPECT_LE(top_row, 6u);
    EXPECT_EQ(store.size(), top_row + 1);
    EXPECT_EQ(session.get_required_remaining(), static_cast<int64_t>(store.required_count()));
    EXPECT_EQ(endless.get_stats().shifts, 1u);
}

TEST_F(EndlessModeTest, ProductiveShotDoesNotShift) {
    start();
    clear_board();
    const grid::BrickId id = place(4, 5);

    endless.on_brick_hit();
    EXPECT_EQ(endless.check_and_shift(100.0, false), 0);
    EXPECT_EQ(store.find(id)->grid->y, 5);
    EXPECT_EQ(endless.get_stats().shifts, 0u);

    endless.reset_hit_tracking();
    endless.check_and_shift(200.0, false);
    EXPECT_EQ(store.find(id)->grid->y, 6);
}

TEST_F(EndlessModeTest, SamePaddleHitShiftsOnce) {
    start();
    clear_board();

    endless.check_and_shift(100.0, false);
    endless.check_and_shift(100.0, false);
    EXPECT_EQ(endless.get_stats().shifts, 1u);
}

TEST_F(EndlessModeTest, MissedBallAlwaysShifts) {
    start();
    clear_board();

    endless.on_brick_hit();
    endless.check_and_shift(0.0, true);
    EXPECT_EQ(endless.get_stats().shifts, 1u);
}

TEST_F(EndlessModeTest, BottomRowCostsLivesForRequiredBricks) {
    start();
    clear_board();
    const grid::BrickId required = place(2, 15);
    const grid::BrickId optional = place(3, 15, false);
    session.begin_level(store.required_count());

    EXPECT_EQ(endless.shift_down(), 1);

    EXPECT_EQ(store.find(required), nullptr);
    EXPECT_EQ(store.find(optional), nullptr);
    EXPECT_EQ(session.get_lives(), 2);
    EXPECT_EQ(listener.lives_lost, 1);
    EXPECT_EQ(presentation.hidden.size(), 2u);
    EXPECT_EQ(endless.get_stats().bricks_discarded, 2u);

    // Discarded bricks never complete the level
    EXPECT_EQ(listener.completions, 0);
    EXPECT_EQ(session.get_required_remaining(), static_cast<int64_t>(store.required_count()));
}

TEST_F(EndlessModeTest, StackedBricksMoveTogether) {
    start();
    clear_board();
    const grid::BrickId upper = place(7, 9);
    const grid::BrickId lower = place(7, 10);

    endless.shift_down();

    EXPECT_EQ(store.find(upper)->grid->y, 10);
    EXPECT_EQ(store.find(lower)->grid->y, 11);
}

// ============================================================================
// Levels
// ============================================================================

TEST_F(EndlessModeTest, NextLevelRegenerates) {
    start();
    const size_t first_count = store.size();

    endless.next_level();

    EXPECT_EQ(endless.get_level(), 2);
    EXPECT_EQ(session.get_level(), 2);
    EXPECT_EQ(presentation.hidden.size(), first_count);
    EXPECT_FALSE(store.empty());
    EXPECT_FALSE(session.is_level_complete());
    EXPECT_EQ(endless.get_stats().shapes_generated, 2u);
}

TEST_F(EndlessModeTest, AllBricksDestroyedFollowsTheSession) {
    start();
    EXPECT_FALSE(endless.all_bricks_destroyed());

    session.begin_level(0);
    EXPECT_TRUE(endless.all_bricks_destroyed());
}

TEST_F(EndlessModeTest, WithoutSessionUsesTheStore) {
    ASSERT_TRUE(endless.initialize(&store, nullptr, nullptr, metrics, config));
    EXPECT_FALSE(endless.all_bricks_destroyed());

    store.clear();
    EXPECT_TRUE(endless.all_bricks_destroyed());
}

TEST_F(EndlessModeTest, SetMetricsRepositionsBricks) {
    start();
    const grid::CellMetrics wider = grid::compute_cell_metrics(grid::ENDLESS_GRID_SIZE, 1600.0);

    endless.set_metrics(wider);

    store.for_each([&wider](const grid::Brick& brick) {
        EXPECT_EQ(brick.position, grid::to_pixel(*brick.grid, brick.half_slot, wider));
    });
    EXPECT_DOUBLE_EQ(endless.get_metrics().cell_width, wider.cell_width);
}

}  // namespace
}  // namespace brickfall::endless
