#pragma once
#include "core/Common.hpp"
#include "core/Geometry.hpp"

struct Point
{
    int32_t x;
    int32_t y;

    bool operator==(const Point& other) const
    {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Point& other) const { return !(*this == other); }

    Point Neighbor(Direction d, Step step) const
    {
        const Offset o = OffsetFor(d, step);
        return { x + o.dx, y + o.dy };
    }
};

// Agent position (doubled coordinates) plus facing.
struct Pose
{
    int32_t x;
    int32_t y;
    Direction dir;

    Point At() const { return { x, y }; }
    Point Ahead(Step step) const { return At().Neighbor(dir, step); }

    bool operator==(const Pose& other) const
    {
        return x == other.x && y == other.y && dir == other.dir;
    }
};

enum class Slot : uint8_t
{
    Unknown,
    Wall,
    NoWall,
    Intersection,
    Cell,
    Pit,
    Goal
};

enum class Hazard : uint8_t
{
    None,
    Pit
};

const char* SlotName(Slot s);

// trail entry: cell visited at a given move count
struct PointInfo
{
    uint32_t x, y;
    uint32_t step;
};

// Ground truth. Same doubled layout as the agent's KnowledgeGrid.
struct WorldMap
{
    std::vector<std::vector<Slot>> grid{};
    int32_t size{0};   // cells per side
    int32_t seed{0};
    std::string info;
    Point start{1, 1};
    Point goal{1, 1};

    int32_t Extent() const { return (int32_t)grid.size(); }

    bool InBounds(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && y < (int32_t)grid.size() && x < (int32_t)grid[0].size();
    }

    Slot At(int32_t x, int32_t y) const;
};

// A computed grid index fell outside the allocated extent.
class OutOfBoundsError : public std::out_of_range
{
public:
    OutOfBoundsError(int32_t x, int32_t y, int32_t extent);

    int32_t x() const noexcept { return x_; }
    int32_t y() const noexcept { return y_; }

private:
    int32_t x_;
    int32_t y_;
};

// A record contradicts what was recorded earlier at the same slot.
class InconsistentRecordError : public std::logic_error
{
public:
    InconsistentRecordError(int32_t x, int32_t y, Slot recorded, Slot attempted);

    Slot recorded() const noexcept { return recorded_; }
    Slot attempted() const noexcept { return attempted_; }

private:
    Slot recorded_;
    Slot attempted_;
};
