#include "Explorer/Frontier.hpp"

Frontier::Order Frontier::ScanningOrder(Direction facing)
{
    return { facing, RotateLeft(facing), Opposite(facing), RotateRight(facing) };
}

Frontier::Order Frontier::PathfindingOrder(Direction facing)
{
    const Direction forward = RotateLeft(facing);
    return { forward, RotateLeft(forward), RotateRight(forward), Opposite(forward) };
}

int32_t Frontier::UnexploredScore(const KnowledgeGrid& grid, Point cell)
{
    int32_t score = 0;
    for (Direction d : kAllDirections)
    {
        if (grid.WallBetween(cell, d) == Slot::Wall) continue;
        if (grid.CellAt(cell, d) == Slot::Unknown) ++score;
    }
    return score;
}

std::optional<Direction> Frontier::SelectBestMove(const KnowledgeGrid& grid, const Pose& pose)
{
    const Point here = pose.At();

    std::optional<Direction> best;
    int32_t bestScore = -1;

    for (Direction d : PathfindingOrder(pose.dir))
    {
        if (!grid.IsPathOpen(here, d)) continue;

        const int32_t score = UnexploredScore(grid, here.Neighbor(d, Step::Cell));
        if (score > bestScore) // strict: first seen keeps ties
        {
            bestScore = score;
            best = d;
        }
    }
    return best;
}

bool Frontier::HasReachableFrontier(const KnowledgeGrid& grid, Point from)
{
    const int32_t W = grid.Extent();
    std::vector<uint8_t> visited((size_t)W * (size_t)W, 0);
    std::queue<Point> q;

    q.push(from);
    visited[(size_t)from.y * W + from.x] = 1;

    while (!q.empty())
    {
        const Point cur = q.front();
        q.pop();

        if (!grid.ScanComplete(cur)) return true;

        for (Direction d : kAllDirections)
        {
            if (!grid.IsPathOpen(cur, d)) continue;

            const Point next = cur.Neighbor(d, Step::Cell);
            uint8_t& v = visited[(size_t)next.y * W + next.x];
            if (v) continue;

            v = 1;
            q.push(next);
        }
    }
    return false;
}
