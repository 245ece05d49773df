#include "core/Geometry.hpp"

#include <cctype>

static int32_t indexOf(Direction d) { return static_cast<int32_t>(d); }
static Direction fromIndex(int32_t i) { return static_cast<Direction>(((i % 4) + 4) % 4); }

Direction RotateLeft(Direction d)
{
    return fromIndex(indexOf(d) - 1);
}

Direction RotateRight(Direction d)
{
    return fromIndex(indexOf(d) + 1);
}

Direction Opposite(Direction d)
{
    return RotateLeft(RotateLeft(d));
}

Offset OffsetFor(Direction d, Step step)
{
    const int32_t s = static_cast<int32_t>(step);
    switch (d)
    {
    case Direction::North: return { 0, -s };
    case Direction::East:  return { s, 0 };
    case Direction::South: return { 0, s };
    case Direction::West:  return { -s, 0 };
    }
    return { 0, 0 };
}

int32_t RightTurnsBetween(Direction from, Direction to)
{
    return (((indexOf(to) - indexOf(from)) % 4) + 4) % 4;
}

const char* DirectionName(Direction d)
{
    switch (d)
    {
    case Direction::North: return "north";
    case Direction::East:  return "east";
    case Direction::South: return "south";
    case Direction::West:  return "west";
    }
    return "?";
}

bool ParseDirection(const std::string& s, Direction& out)
{
    std::string t;
    t.reserve(s.size());
    for (unsigned char ch : s) t.push_back((char)std::tolower(ch));

    if (t == "north" || t == "n") { out = Direction::North; return true; }
    if (t == "east"  || t == "e") { out = Direction::East;  return true; }
    if (t == "south" || t == "s") { out = Direction::South; return true; }
    if (t == "west"  || t == "w") { out = Direction::West;  return true; }
    return false;
}
