#pragma once
#include "core/Common.hpp"
#include "core/KnowledgeGrid.hpp"

class Frontier
{
public:
    using Order = std::array<Direction, 4>;

    // forward, left, back, right
    static Order ScanningOrder(Direction facing);

    // Scanning leaves the agent 90 degrees clockwise of where it started, so
    // the logical forward is left of `facing`:
    //   forward, left, right, back  (relative to that forward)
    static Order PathfindingOrder(Direction facing);

    // Neighbours of `cell` not behind a known wall and still Unknown (0..4).
    static int32_t UnexploredScore(const KnowledgeGrid& grid, Point cell);

    // Open direction whose neighbour scores highest; ties go to the earlier
    // entry of PathfindingOrder. Empty when no direction is open.
    static std::optional<Direction> SelectBestMove(const KnowledgeGrid& grid, const Pose& pose);

    // Breadth-first over open passages from `from`: does any reachable cell
    // still have an unrecorded direction?
    static bool HasReachableFrontier(const KnowledgeGrid& grid, Point from);
};
