#include <gtest/gtest.h>

#include "core/KnowledgeGrid.hpp"

TEST(KnowledgeGrid, FreshGridKnowsOnlyTheFrame)
{
    KnowledgeGrid grid(2, { 1, 3 });

    EXPECT_EQ(grid.MazeSize(), 2);
    EXPECT_EQ(grid.Extent(), 5);

    for (int32_t y = 0; y < 5; y += 2)
        for (int32_t x = 0; x < 5; x += 2)
            EXPECT_EQ(grid.At(x, y), Slot::Intersection);

    for (int32_t i = 1; i < 5; i += 2)
    {
        EXPECT_EQ(grid.At(i, 0), Slot::Wall);
        EXPECT_EQ(grid.At(i, 4), Slot::Wall);
        EXPECT_EQ(grid.At(0, i), Slot::Wall);
        EXPECT_EQ(grid.At(4, i), Slot::Wall);
    }

    EXPECT_EQ(grid.At(1, 3), Slot::Cell);
    EXPECT_EQ(grid.VisitCount({ 1, 3 }), 1u);

    // 4 interior walls + 3 cells
    EXPECT_EQ(grid.UnknownCount(), 7u);
    EXPECT_EQ(grid.At(2, 1), Slot::Unknown);
    EXPECT_EQ(grid.At(3, 1), Slot::Unknown);
}

TEST(KnowledgeGrid, RejectsBadConstruction)
{
    EXPECT_THROW(KnowledgeGrid(0, { 1, 1 }), std::invalid_argument);
    EXPECT_THROW(KnowledgeGrid(2, { 2, 3 }), std::invalid_argument);
    EXPECT_THROW(KnowledgeGrid(2, { 5, 1 }), std::invalid_argument);
}

TEST(KnowledgeGrid, OutOfBoundsIsReported)
{
    KnowledgeGrid grid(2, { 1, 3 });

    EXPECT_THROW(grid.At(-1, 0), OutOfBoundsError);
    EXPECT_THROW(grid.At(0, 5), OutOfBoundsError);
    // looking a cell beyond the frame
    EXPECT_THROW(grid.CellAt({ 1, 1 }, Direction::North), OutOfBoundsError);

    try
    {
        grid.At(7, 2);
        FAIL() << "expected OutOfBoundsError";
    }
    catch (const OutOfBoundsError& e)
    {
        EXPECT_EQ(e.x(), 7);
        EXPECT_EQ(e.y(), 2);
    }
}

TEST(KnowledgeGrid, RecordsAreMonotonic)
{
    KnowledgeGrid grid(2, { 1, 3 });

    grid.RecordWall({ 1, 3 }, Direction::East, false);
    EXPECT_EQ(grid.WallBetween({ 1, 3 }, Direction::East), Slot::NoWall);
    EXPECT_EQ(grid.At(2, 3), Slot::NoWall);

    // same value again is fine
    EXPECT_NO_THROW(grid.RecordWall({ 1, 3 }, Direction::East, false));
    // seen from the other side it is the same slot
    EXPECT_NO_THROW(grid.RecordWall({ 3, 3 }, Direction::West, false));

    EXPECT_THROW(grid.RecordWall({ 1, 3 }, Direction::East, true), InconsistentRecordError);
    EXPECT_EQ(grid.At(2, 3), Slot::NoWall);

    grid.RecordCell({ 1, 3 }, Direction::East, Hazard::Pit);
    EXPECT_EQ(grid.At(3, 3), Slot::Pit);

    try
    {
        grid.RecordCell({ 1, 3 }, Direction::East, Hazard::None);
        FAIL() << "expected InconsistentRecordError";
    }
    catch (const InconsistentRecordError& e)
    {
        EXPECT_EQ(e.recorded(), Slot::Pit);
        EXPECT_EQ(e.attempted(), Slot::Cell);
    }
}

TEST(KnowledgeGrid, BoundaryWallsCannotBeOpened)
{
    KnowledgeGrid grid(2, { 1, 3 });

    EXPECT_NO_THROW(grid.RecordWall({ 1, 3 }, Direction::South, true));
    EXPECT_THROW(grid.RecordWall({ 1, 3 }, Direction::West, false), InconsistentRecordError);
}

TEST(KnowledgeGrid, PathOpenNeedsKnownPassageAndNoPit)
{
    KnowledgeGrid grid(2, { 1, 3 });
    const Point start{ 1, 3 };

    // unknown counts as closed
    EXPECT_FALSE(grid.IsPathOpen(start, Direction::North));

    grid.RecordWall(start, Direction::North, false);
    EXPECT_TRUE(grid.IsPathOpen(start, Direction::North));

    grid.RecordCell(start, Direction::North, Hazard::None);
    EXPECT_TRUE(grid.IsPathOpen(start, Direction::North));

    grid.RecordWall(start, Direction::East, false);
    grid.RecordCell(start, Direction::East, Hazard::Pit);
    EXPECT_FALSE(grid.IsPathOpen(start, Direction::East));

    EXPECT_FALSE(grid.IsPathOpen(start, Direction::West));
    EXPECT_FALSE(grid.IsPathOpen(start, Direction::South));
}

TEST(KnowledgeGrid, ScanCompleteTracksEveryDirection)
{
    KnowledgeGrid grid(2, { 1, 3 });
    const Point start{ 1, 3 };

    EXPECT_TRUE(grid.DirectionRecorded(start, Direction::West));
    EXPECT_TRUE(grid.DirectionRecorded(start, Direction::South));
    EXPECT_FALSE(grid.DirectionRecorded(start, Direction::North));
    EXPECT_FALSE(grid.ScanComplete(start));

    grid.RecordWall(start, Direction::North, true);
    EXPECT_TRUE(grid.DirectionRecorded(start, Direction::North));

    // open wall alone is not enough, the cell behind it must be known
    grid.RecordWall(start, Direction::East, false);
    EXPECT_FALSE(grid.DirectionRecorded(start, Direction::East));
    EXPECT_FALSE(grid.ScanComplete(start));

    grid.RecordCell(start, Direction::East, Hazard::None);
    EXPECT_TRUE(grid.ScanComplete(start));
}

TEST(KnowledgeGrid, VisitCountsAndMarksCells)
{
    KnowledgeGrid grid(2, { 1, 3 });

    grid.Visit({ 3, 3 });
    grid.Visit({ 3, 3 });
    EXPECT_EQ(grid.At(3, 3), Slot::Cell);
    EXPECT_EQ(grid.VisitCount({ 3, 3 }), 2u);
    EXPECT_EQ(grid.VisitCount({ 1, 1 }), 0u);

    EXPECT_THROW(grid.Visit({ 2, 3 }), std::invalid_argument);
    EXPECT_THROW(grid.Visit({ 9, 9 }), OutOfBoundsError);
}

TEST(KnowledgeGrid, SingleCellMazeIsFullyKnown)
{
    KnowledgeGrid grid(1, { 1, 1 });
    EXPECT_EQ(grid.UnknownCount(), 0u);
    EXPECT_TRUE(grid.ScanComplete({ 1, 1 }));
}
