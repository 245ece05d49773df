#include "core/KnowledgeGrid.hpp"

#include <sstream>

KnowledgeGrid::KnowledgeGrid(int32_t mazeSize, Point start)
    : mazeSize_(mazeSize), extent_(2 * mazeSize + 1)
{
    if (mazeSize < 1)
        throw std::invalid_argument("maze size must be at least 1");

    if (!InBounds(start.x, start.y) || !IsCellSlot(start.x, start.y))
    {
        std::ostringstream os;
        os << "start (" << start.x << ", " << start.y << ") is not a cell of a "
           << mazeSize << "x" << mazeSize << " maze";
        throw std::invalid_argument(os.str());
    }

    grid_.assign(extent_, std::vector<Slot>(extent_, Slot::Unknown));
    visits_.assign((size_t)extent_ * (size_t)extent_, 0);

    const int32_t last = extent_ - 1;
    for (int32_t y = 0; y < extent_; ++y)
    {
        for (int32_t x = 0; x < extent_; ++x)
        {
            const bool evenX = (x & 1) == 0;
            const bool evenY = (y & 1) == 0;

            if (evenX && evenY)
                grid_[y][x] = Slot::Intersection;
            else if (x == 0 || y == 0 || x == last || y == last)
                grid_[y][x] = Slot::Wall; // enclosed maze
        }
    }

    grid_[start.y][start.x] = Slot::Cell;
    visits_[(size_t)start.y * (size_t)extent_ + (size_t)start.x] = 1;
}

void KnowledgeGrid::checkBounds_(int32_t x, int32_t y) const
{
    if (!InBounds(x, y))
        throw OutOfBoundsError(x, y, extent_);
}

Slot KnowledgeGrid::At(int32_t x, int32_t y) const
{
    checkBounds_(x, y);
    return grid_[y][x];
}

void KnowledgeGrid::write_(int32_t x, int32_t y, Slot value)
{
    checkBounds_(x, y);

    Slot& s = grid_[y][x];
    if (s == value) return;
    if (s != Slot::Unknown)
        throw InconsistentRecordError(x, y, s, value);
    s = value;
}

Slot KnowledgeGrid::WallBetween(Point pos, Direction dir) const
{
    return At(pos.Neighbor(dir, Step::Wall));
}

void KnowledgeGrid::RecordWall(Point pos, Direction dir, bool present)
{
    const Point w = pos.Neighbor(dir, Step::Wall);
    write_(w.x, w.y, present ? Slot::Wall : Slot::NoWall);
}

Slot KnowledgeGrid::CellAt(Point pos, Direction dir) const
{
    return At(pos.Neighbor(dir, Step::Cell));
}

void KnowledgeGrid::RecordCell(Point pos, Direction dir, Hazard hazard)
{
    const Point c = pos.Neighbor(dir, Step::Cell);
    write_(c.x, c.y, hazard == Hazard::Pit ? Slot::Pit : Slot::Cell);
}

bool KnowledgeGrid::IsPathOpen(Point pos, Direction dir) const
{
    if (WallBetween(pos, dir) != Slot::NoWall) return false;
    return CellAt(pos, dir) != Slot::Pit;
}

bool KnowledgeGrid::DirectionRecorded(Point pos, Direction dir) const
{
    const Slot wall = WallBetween(pos, dir);
    if (wall == Slot::Wall) return true;
    if (wall == Slot::Unknown) return false;
    return CellAt(pos, dir) != Slot::Unknown;
}

bool KnowledgeGrid::ScanComplete(Point pos) const
{
    for (Direction d : kAllDirections)
        if (!DirectionRecorded(pos, d)) return false;
    return true;
}

void KnowledgeGrid::Visit(Point pos)
{
    checkBounds_(pos.x, pos.y);
    if (!IsCellSlot(pos.x, pos.y))
        throw std::invalid_argument("only cell slots can be visited");

    write_(pos.x, pos.y, Slot::Cell);
    ++visits_[(size_t)pos.y * (size_t)extent_ + (size_t)pos.x];
}

uint32_t KnowledgeGrid::VisitCount(Point pos) const
{
    checkBounds_(pos.x, pos.y);
    return visits_[(size_t)pos.y * (size_t)extent_ + (size_t)pos.x];
}

size_t KnowledgeGrid::UnknownCount() const
{
    size_t n = 0;
    for (const auto& row : grid_)
        n += (size_t)std::count(row.begin(), row.end(), Slot::Unknown);
    return n;
}
