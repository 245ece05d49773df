#pragma once
#include "core/Common.hpp"
#include "core/Config.hpp"
#include "core/DataStruct.hpp"

// Built-in 4x4 map used by the interactive menu.
extern const char* const kDemoMap;

// Explore one world, printing the map as it is learned.
// Returns 0 when the goal was reached.
int exploreWorld(const WorldMap& world, const AppConfig& config);

// Dispatch on the config: batch, viewer, map file or generated maze.
int runApp(const AppConfig& config);

// Menu on stdin, used when no options are given.
int runInteractive();
