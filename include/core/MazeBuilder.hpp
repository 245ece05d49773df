#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

struct BuildOptions
{
    int32_t size{4};        // cells per side
    int32_t seed{0};
    int32_t extraLoops{2};  // walls knocked out after carving
    int32_t pitCount{2};
    Point start{1, 7};      // cell slots, doubled coordinates
    Point goal{7, 1};
};

// Bottom-left start and top-right goal for a maze of `size` cells.
BuildOptions DefaultBuildOptions(int32_t size, int32_t seed);

class MazeBuilder
{
public:
    // Seeded perfect maze, braided with extra loops, pits placed only where
    // the goal stays reachable from the start.
    static WorldMap Build(const BuildOptions& options);

    // Text notation:
    //   +  wall intersection     - |  wall      .  no wall
    //   o  cell                  x    pit       w  goal
    // Spaces and blank lines are ignored.
    static bool Parse(const std::string& text, WorldMap& out, std::string& outError);
    static bool Load(const std::string& path, WorldMap& out, std::string& outError);

    static std::string Format(const WorldMap& world);
};
