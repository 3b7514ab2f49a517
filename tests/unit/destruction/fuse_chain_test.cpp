// Brickfall Destruction Tests
// fuse_chain_test.cpp - Fuse flood fill and splash query tests

#include <gtest/gtest.h>

#include <brickfall/destruction/fuse_chain.hpp>

#include <algorithm>

namespace brickfall::destruction {
namespace {

using grid::BrickType;
using grid::GridCoord;
using grid::HalfSlot;

class FuseChainTest : public ::testing::Test {
protected:
    grid::BrickId add(int32_t col, int32_t row, BrickType type = BrickType::FuseHorizontal,
                      HalfSlot slot = HalfSlot::None) {
        grid::Brick brick;
        brick.type = type;
        brick.grid = GridCoord(col, row);
        brick.half_slot = slot;
        return store.add(brick);
    }

    static bool contains(const std::vector<grid::BrickId>& ids, grid::BrickId id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    }

    grid::BrickStore store{grid::GridBounds{10, 8}};
};

TEST_F(FuseChainTest, LineInBfsOrder) {
    std::vector<grid::BrickId> line;
    for (int32_t col = 1; col <= 5; ++col) {
        line.push_back(add(col, 2));
    }

    const auto chain = find_connected_fuses(store, line[0]);
    EXPECT_EQ(chain, line);
}

TEST_F(FuseChainTest, StartingMidChainSpreadsBothWays) {
    const auto a = add(1, 2);
    const auto b = add(2, 2);
    const auto c = add(3, 2);

    const auto chain = find_connected_fuses(store, b);
    ASSERT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain[0], b);
    // Left is visited before right
    EXPECT_EQ(chain[1], a);
    EXPECT_EQ(chain[2], c);
}

TEST_F(FuseChainTest, OrientationDoesNotMatter) {
    const auto a = add(4, 4, BrickType::FuseVertical);
    const auto b = add(4, 5, BrickType::FuseLeftUp);
    const auto c = add(5, 5, BrickType::FuseRightDown);

    const auto chain = find_connected_fuses(store, a);
    ASSERT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain[1], b);
    EXPECT_EQ(chain[2], c);
}

TEST_F(FuseChainTest, StopsAtNonFuseAndDiagonals) {
    const auto start = add(2, 2);
    add(3, 2, BrickType::Default);
    const auto beyond = add(4, 2);
    const auto diagonal = add(3, 3);

    const auto chain = find_connected_fuses(store, start);
    EXPECT_EQ(chain.size(), 1u);
    EXPECT_FALSE(contains(chain, beyond));
    EXPECT_FALSE(contains(chain, diagonal));
}

TEST_F(FuseChainTest, CollectsBothHalvesOfASplitCell) {
    const auto start = add(2, 2);
    const auto left = add(3, 2, BrickType::FuseHorizontal, HalfSlot::Left);
    const auto right = add(3, 2, BrickType::FuseHorizontal, HalfSlot::Right);

    const auto chain = find_connected_fuses(store, start);
    ASSERT_EQ(chain.size(), 3u);
    EXPECT_TRUE(contains(chain, left));
    EXPECT_TRUE(contains(chain, right));
}

TEST_F(FuseChainTest, StartingOnAHalfCollectsItsSibling) {
    const auto left = add(3, 2, BrickType::FuseHorizontal, HalfSlot::Left);
    const auto right = add(3, 2, BrickType::FuseHorizontal, HalfSlot::Right);

    const auto chain = find_connected_fuses(store, right);
    ASSERT_EQ(chain.size(), 2u);
    EXPECT_EQ(chain[0], right);
    EXPECT_EQ(chain[1], left);
}

TEST_F(FuseChainTest, NonFuseStartIsEmpty) {
    const auto tnt = add(0, 0, BrickType::TNT);
    add(1, 0);

    EXPECT_TRUE(find_connected_fuses(store, tnt).empty());
    EXPECT_TRUE(find_connected_fuses(store, 999).empty());
}

TEST_F(FuseChainTest, SplashHitsCardinalNeighboursOnly) {
    const auto up = add(5, 4, BrickType::Default);
    const auto down = add(5, 6, BrickType::Metal);
    const auto left_half = add(4, 5, BrickType::Gold, HalfSlot::Right);
    add(6, 5, BrickType::Unbreakable);
    add(6, 6, BrickType::Default);
    add(5, 5);

    const auto targets = splash_targets(store, GridCoord(5, 5));
    ASSERT_EQ(targets.size(), 3u);
    EXPECT_EQ(targets[0], up);
    EXPECT_EQ(targets[1], down);
    EXPECT_EQ(targets[2], left_half);
}

TEST_F(FuseChainTest, SplashSkipsFuses) {
    add(5, 4, BrickType::FuseVertical);
    EXPECT_TRUE(splash_targets(store, GridCoord(5, 5)).empty());
}

TEST_F(FuseChainTest, SplashAtTheEdgeIgnoresOutsideCells) {
    const auto right = add(1, 0, BrickType::Default);
    const auto targets = splash_targets(store, GridCoord(0, 0));
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0], right);
}

}  // namespace
}  // namespace brickfall::destruction
