#include "Oracle/Oracle.hpp"

MapOracle::MapOracle(WorldMap world)
    : world_(std::move(world))
{
    if (world_.grid.empty() || world_.grid.size() != world_.grid[0].size())
        throw std::invalid_argument("world map must be a non-empty square grid");
}

bool MapOracle::IsWallAhead(Pose pose) const
{
    const Point p = pose.Ahead(Step::Wall);
    return world_.At(p.x, p.y) == Slot::Wall;
}

bool MapOracle::IsPitAhead(Pose pose) const
{
    const Point p = pose.Ahead(Step::Cell);
    return world_.At(p.x, p.y) == Slot::Pit;
}

bool MapOracle::IsGoalAhead(Pose pose) const
{
    const Point p = pose.Ahead(Step::Cell);
    return world_.At(p.x, p.y) == Slot::Goal;
}

bool MapOracle::IsGoalHere(Pose pose) const
{
    return world_.At(pose.x, pose.y) == Slot::Goal;
}
