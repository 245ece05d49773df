#include <gtest/gtest.h>

#include "Explorer/Frontier.hpp"

TEST(Frontier, ScanningOrderIsForwardLeftBackRight)
{
    const Frontier::Order east = Frontier::ScanningOrder(Direction::East);
    EXPECT_EQ(east[0], Direction::East);
    EXPECT_EQ(east[1], Direction::North);
    EXPECT_EQ(east[2], Direction::West);
    EXPECT_EQ(east[3], Direction::South);
}

TEST(Frontier, PathfindingOrderStartsLeftOfFacing)
{
    const Frontier::Order north = Frontier::PathfindingOrder(Direction::North);
    EXPECT_EQ(north[0], Direction::West);
    EXPECT_EQ(north[1], Direction::South);
    EXPECT_EQ(north[2], Direction::North);
    EXPECT_EQ(north[3], Direction::East);
}

TEST(Frontier, OrdersCoverEveryDirectionOnce)
{
    for (Direction f : kAllDirections)
    {
        for (const Frontier::Order& order : { Frontier::ScanningOrder(f), Frontier::PathfindingOrder(f) })
        {
            for (Direction d : kAllDirections)
                EXPECT_EQ(std::count(order.begin(), order.end(), d), 1);
        }
    }
}

TEST(Frontier, UnexploredScoreCountsUnknownNeighbours)
{
    KnowledgeGrid grid(2, { 1, 3 });

    // (1,3): north and east unknown, west and south are frame
    EXPECT_EQ(Frontier::UnexploredScore(grid, { 1, 3 }), 2);
    EXPECT_EQ(Frontier::UnexploredScore(grid, { 3, 1 }), 2);

    // (3,1): its west neighbour becomes known
    grid.RecordWall({ 1, 3 }, Direction::North, false);
    grid.RecordCell({ 1, 3 }, Direction::North, Hazard::None);
    EXPECT_EQ(Frontier::UnexploredScore(grid, { 3, 1 }), 1);
    EXPECT_EQ(Frontier::UnexploredScore(grid, { 1, 3 }), 1);

    // a known wall hides the neighbour entirely
    grid.RecordWall({ 3, 1 }, Direction::South, true);
    EXPECT_EQ(Frontier::UnexploredScore(grid, { 3, 1 }), 0);
}

TEST(Frontier, NoOpenDirectionGivesNothing)
{
    KnowledgeGrid grid(2, { 1, 3 });
    grid.RecordWall({ 1, 3 }, Direction::North, true);
    grid.RecordWall({ 1, 3 }, Direction::East, true);

    EXPECT_FALSE(Frontier::SelectBestMove(grid, { 1, 3, Direction::East }).has_value());
}

TEST(Frontier, TiesGoToTheEarlierPathfindingEntry)
{
    KnowledgeGrid grid(2, { 1, 3 });
    const Point start{ 1, 3 };
    grid.RecordWall(start, Direction::North, false);
    grid.RecordCell(start, Direction::North, Hazard::None);
    grid.RecordWall(start, Direction::East, false);
    grid.RecordCell(start, Direction::East, Hazard::None);

    // both neighbours score 1 (their shared corner cell is unknown)
    ASSERT_EQ(Frontier::UnexploredScore(grid, { 1, 1 }), 1);
    ASSERT_EQ(Frontier::UnexploredScore(grid, { 3, 3 }), 1);

    // facing north: order W S N E, north comes first
    auto best = Frontier::SelectBestMove(grid, { 1, 3, Direction::North });
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, Direction::North);

    // facing west: order S E W N, east comes first
    best = Frontier::SelectBestMove(grid, { 1, 3, Direction::West });
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, Direction::East);
}

TEST(Frontier, PitsAreNeverChosen)
{
    KnowledgeGrid grid(2, { 1, 3 });
    const Point start{ 1, 3 };
    grid.RecordWall(start, Direction::East, false);
    grid.RecordCell(start, Direction::East, Hazard::Pit);
    grid.RecordWall(start, Direction::North, false);
    grid.RecordCell(start, Direction::North, Hazard::None);
    grid.RecordWall({ 1, 1 }, Direction::East, true);

    // the pit side comes first in the order and (1,1) scores 0, still north
    auto best = Frontier::SelectBestMove(grid, { 1, 3, Direction::West });
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, Direction::North);
}

TEST(Frontier, BacktrackingIsAllowed)
{
    KnowledgeGrid grid(2, { 1, 3 });
    const Point start{ 1, 3 };
    grid.RecordWall(start, Direction::North, true);
    grid.RecordWall(start, Direction::East, false);
    grid.RecordCell(start, Direction::East, Hazard::None);

    // whatever the facing, the single passage is taken, even straight back
    for (Direction f : kAllDirections)
    {
        auto best = Frontier::SelectBestMove(grid, { 1, 3, f });
        ASSERT_TRUE(best.has_value());
        EXPECT_EQ(*best, Direction::East);
    }
}

TEST(Frontier, ReachableFrontier)
{
    KnowledgeGrid grid(2, { 1, 3 });
    const Point start{ 1, 3 };

    EXPECT_TRUE(Frontier::HasReachableFrontier(grid, start));

    grid.RecordWall(start, Direction::North, true);
    grid.RecordWall(start, Direction::East, false);
    grid.RecordCell(start, Direction::East, Hazard::None);
    EXPECT_TRUE(Frontier::HasReachableFrontier(grid, start));

    // (3,3): north closed, nothing else to learn there
    grid.RecordWall({ 3, 3 }, Direction::North, true);
    EXPECT_FALSE(Frontier::HasReachableFrontier(grid, start));
    EXPECT_FALSE(Frontier::HasReachableFrontier(grid, { 3, 3 }));
}
