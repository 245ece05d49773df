#pragma once
#include "core/Common.hpp"

// Cyclic order matters: left = previous, right = next.
enum class Direction : uint8_t
{
    North = 0,
    East  = 1,
    South = 2,
    West  = 3
};

// Magnitude of a move in doubled coordinates.
enum class Step : int32_t
{
    Wall = 1, // to the wall segment between two cells
    Cell = 2  // to the neighbouring cell
};

struct Offset
{
    int32_t dx;
    int32_t dy;

    bool operator==(const Offset& other) const
    {
        return dx == other.dx && dy == other.dy;
    }
};

inline constexpr std::array<Direction, 4> kAllDirections = {
    Direction::North, Direction::East, Direction::South, Direction::West
};

Direction RotateLeft(Direction d);
Direction RotateRight(Direction d);
Direction Opposite(Direction d);

Offset OffsetFor(Direction d, Step step);

// Number of 90 degree right turns that bring `from` onto `to` (0..3).
int32_t RightTurnsBetween(Direction from, Direction to);

const char* DirectionName(Direction d);
bool ParseDirection(const std::string& s, Direction& out);
