#include <gtest/gtest.h>

#include "Oracle/Oracle.hpp"
#include "core/MazeBuilder.hpp"

namespace {

MapOracle makeOracle()
{
    WorldMap world;
    std::string err;
    const bool ok = MazeBuilder::Parse(
        "+ - + - +\n"
        "| o . w |\n"
        "+ . + - +\n"
        "| o . x |\n"
        "+ - + - +\n", world, err);
    if (!ok) throw std::runtime_error(err);
    return MapOracle(std::move(world));
}

} // namespace

TEST(MapOracle, WallsAhead)
{
    const MapOracle oracle = makeOracle();

    EXPECT_TRUE(oracle.IsWallAhead({ 1, 3, Direction::West }));
    EXPECT_TRUE(oracle.IsWallAhead({ 1, 3, Direction::South }));
    EXPECT_FALSE(oracle.IsWallAhead({ 1, 3, Direction::North }));
    EXPECT_FALSE(oracle.IsWallAhead({ 1, 3, Direction::East }));
    EXPECT_TRUE(oracle.IsWallAhead({ 3, 1, Direction::South }));
}

TEST(MapOracle, CellsAhead)
{
    const MapOracle oracle = makeOracle();

    EXPECT_TRUE(oracle.IsPitAhead({ 1, 3, Direction::East }));
    EXPECT_FALSE(oracle.IsGoalAhead({ 1, 3, Direction::East }));

    EXPECT_TRUE(oracle.IsGoalAhead({ 1, 1, Direction::East }));
    EXPECT_FALSE(oracle.IsPitAhead({ 1, 1, Direction::East }));

    EXPECT_FALSE(oracle.IsGoalAhead({ 1, 3, Direction::North }));
    EXPECT_FALSE(oracle.IsPitAhead({ 1, 3, Direction::North }));
}

TEST(MapOracle, GoalHere)
{
    const MapOracle oracle = makeOracle();
    EXPECT_TRUE(oracle.IsGoalHere({ 3, 1, Direction::North }));
    EXPECT_FALSE(oracle.IsGoalHere({ 1, 3, Direction::North }));
}

TEST(MapOracle, QueriesBeyondTheFrameThrow)
{
    const MapOracle oracle = makeOracle();
    EXPECT_TRUE(oracle.IsWallAhead({ 3, 1, Direction::East }));
    EXPECT_THROW(oracle.IsPitAhead({ 3, 1, Direction::East }), OutOfBoundsError);
}

TEST(MapOracle, RejectsMalformedWorlds)
{
    EXPECT_THROW(MapOracle(WorldMap{}), std::invalid_argument);

    WorldMap ragged;
    ragged.grid.assign(3, std::vector<Slot>(5, Slot::Wall));
    EXPECT_THROW(MapOracle(std::move(ragged)), std::invalid_argument);
}
