// Brickfall Grid Tests
// brick_test.cpp - Brick type and record tests

#include <gtest/gtest.h>

#include <brickfall/grid/brick.hpp>

namespace brickfall::grid {
namespace {

TEST(BrickTypeTest, NamesRoundTrip) {
    for (size_t i = 0; i < static_cast<size_t>(BrickType::Count); ++i) {
        const auto type = static_cast<BrickType>(i);
        auto parsed = brick_type_from_string(brick_type_to_string(type));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, type);
    }
}

TEST(BrickTypeTest, LevelFileNames) {
    EXPECT_STREQ(brick_type_to_string(BrickType::TNT), "tnt");
    EXPECT_STREQ(brick_type_to_string(BrickType::FuseLeftUp), "fuse-left-up");
    EXPECT_EQ(brick_type_from_string("fuse-right-down"), BrickType::FuseRightDown);
    EXPECT_FALSE(brick_type_from_string("dynamite").has_value());
}

TEST(BrickTypeTest, FuseFamily) {
    EXPECT_TRUE(is_fuse_type(BrickType::FuseHorizontal));
    EXPECT_TRUE(is_fuse_type(BrickType::FuseVertical));
    EXPECT_TRUE(is_fuse_type(BrickType::FuseRightUp));
    EXPECT_FALSE(is_fuse_type(BrickType::TNT));
    EXPECT_FALSE(is_fuse_type(BrickType::Default));
}

TEST(BrickTest, CompletionCounting) {
    Brick brick;
    EXPECT_TRUE(brick.counts_for_completion());

    brick.is_required = false;
    EXPECT_FALSE(brick.counts_for_completion());

    brick.is_required = true;
    brick.type = BrickType::Unbreakable;
    EXPECT_FALSE(brick.counts_for_completion());
}

TEST(BrickTest, HalfSizeFollowsSlot) {
    Brick brick;
    EXPECT_FALSE(brick.is_half_size());
    brick.half_slot = HalfSlot::Right;
    EXPECT_TRUE(brick.is_half_size());
}

TEST(HealthBadgeTest, ShownOnlyForMultiHitBricks) {
    Brick brick;
    brick.max_health = 5000;

    brick.health = 1;
    EXPECT_EQ(health_badge_text(brick), "");
    brick.health = 2;
    EXPECT_EQ(health_badge_text(brick), "2");
    brick.health = 998;
    EXPECT_EQ(health_badge_text(brick), "998");
    brick.health = 999;
    EXPECT_EQ(health_badge_text(brick), "");
}

}  // namespace
}  // namespace brickfall::grid
