#include <gtest/gtest.h>

#include "core/Geometry.hpp"
#include "core/DataStruct.hpp"

TEST(Geometry, RotationsFollowTheCompassCycle)
{
    EXPECT_EQ(RotateRight(Direction::North), Direction::East);
    EXPECT_EQ(RotateRight(Direction::East),  Direction::South);
    EXPECT_EQ(RotateRight(Direction::South), Direction::West);
    EXPECT_EQ(RotateRight(Direction::West),  Direction::North);

    EXPECT_EQ(RotateLeft(Direction::North), Direction::West);
    EXPECT_EQ(RotateLeft(Direction::West),  Direction::South);
    EXPECT_EQ(RotateLeft(Direction::South), Direction::East);
    EXPECT_EQ(RotateLeft(Direction::East),  Direction::North);
}

TEST(Geometry, LeftAndRightUndoEachOther)
{
    for (Direction d : kAllDirections)
    {
        EXPECT_EQ(RotateLeft(RotateRight(d)), d);
        EXPECT_EQ(RotateRight(RotateLeft(d)), d);
        EXPECT_EQ(Opposite(Opposite(d)), d);
        EXPECT_NE(Opposite(d), d);
    }
}

TEST(Geometry, OffsetsAreExact)
{
    EXPECT_EQ(OffsetFor(Direction::North, Step::Wall), (Offset{0, -1}));
    EXPECT_EQ(OffsetFor(Direction::South, Step::Wall), (Offset{0, 1}));
    EXPECT_EQ(OffsetFor(Direction::East,  Step::Wall), (Offset{1, 0}));
    EXPECT_EQ(OffsetFor(Direction::West,  Step::Wall), (Offset{-1, 0}));

    EXPECT_EQ(OffsetFor(Direction::North, Step::Cell), (Offset{0, -2}));
    EXPECT_EQ(OffsetFor(Direction::South, Step::Cell), (Offset{0, 2}));
    EXPECT_EQ(OffsetFor(Direction::East,  Step::Cell), (Offset{2, 0}));
    EXPECT_EQ(OffsetFor(Direction::West,  Step::Cell), (Offset{-2, 0}));
}

TEST(Geometry, OffsetsComposeBack)
{
    for (Direction d : kAllDirections)
    {
        EXPECT_EQ(OffsetFor(RotateRight(RotateLeft(d)), Step::Cell), OffsetFor(d, Step::Cell));

        const Offset a = OffsetFor(d, Step::Cell);
        const Offset b = OffsetFor(Opposite(d), Step::Cell);
        EXPECT_EQ(a.dx + b.dx, 0);
        EXPECT_EQ(a.dy + b.dy, 0);

        // two wall steps make one cell step
        const Offset w = OffsetFor(d, Step::Wall);
        EXPECT_EQ(w.dx * 2, a.dx);
        EXPECT_EQ(w.dy * 2, a.dy);
    }
}

TEST(Geometry, RightTurnsBetween)
{
    EXPECT_EQ(RightTurnsBetween(Direction::North, Direction::North), 0);
    EXPECT_EQ(RightTurnsBetween(Direction::North, Direction::East), 1);
    EXPECT_EQ(RightTurnsBetween(Direction::North, Direction::South), 2);
    EXPECT_EQ(RightTurnsBetween(Direction::North, Direction::West), 3);
    EXPECT_EQ(RightTurnsBetween(Direction::West, Direction::North), 1);
    EXPECT_EQ(RightTurnsBetween(Direction::East, Direction::North), 3);
}

TEST(Geometry, PointAndPoseNeighbours)
{
    const Pose p{3, 5, Direction::North};
    EXPECT_EQ(p.Ahead(Step::Wall), (Point{3, 4}));
    EXPECT_EQ(p.Ahead(Step::Cell), (Point{3, 3}));
    EXPECT_EQ(p.At().Neighbor(Direction::West, Step::Cell), (Point{1, 5}));
}

TEST(Geometry, DirectionNames)
{
    Direction d = Direction::North;
    EXPECT_TRUE(ParseDirection("East", d));
    EXPECT_EQ(d, Direction::East);
    EXPECT_TRUE(ParseDirection("w", d));
    EXPECT_EQ(d, Direction::West);
    EXPECT_FALSE(ParseDirection("up", d));
    EXPECT_EQ(d, Direction::West);

    for (Direction dir : kAllDirections)
    {
        Direction back = Direction::North;
        ASSERT_TRUE(ParseDirection(DirectionName(dir), back));
        EXPECT_EQ(back, dir);
    }
}
