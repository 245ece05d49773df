#include "core/DataStruct.hpp"

#include <sstream>

const char* SlotName(Slot s)
{
    switch (s)
    {
    case Slot::Unknown:      return "unknown";
    case Slot::Wall:         return "wall";
    case Slot::NoWall:       return "no-wall";
    case Slot::Intersection: return "intersection";
    case Slot::Cell:         return "cell";
    case Slot::Pit:          return "pit";
    case Slot::Goal:         return "goal";
    }
    return "?";
}

Slot WorldMap::At(int32_t x, int32_t y) const
{
    if (!InBounds(x, y))
        throw OutOfBoundsError(x, y, Extent());
    return grid[y][x];
}

static std::string outOfBoundsMessage_(int32_t x, int32_t y, int32_t extent)
{
    std::ostringstream os;
    os << "grid index (" << x << ", " << y << ") outside extent " << extent;
    return os.str();
}

OutOfBoundsError::OutOfBoundsError(int32_t x, int32_t y, int32_t extent)
    : std::out_of_range(outOfBoundsMessage_(x, y, extent)), x_(x), y_(y)
{
}

static std::string inconsistentMessage_(int32_t x, int32_t y, Slot recorded, Slot attempted)
{
    std::ostringstream os;
    os << "slot (" << x << ", " << y << ") already recorded as " << SlotName(recorded)
       << ", refusing " << SlotName(attempted);
    return os.str();
}

InconsistentRecordError::InconsistentRecordError(int32_t x, int32_t y, Slot recorded, Slot attempted)
    : std::logic_error(inconsistentMessage_(x, y, recorded, attempted)),
      recorded_(recorded),
      attempted_(attempted)
{
}
