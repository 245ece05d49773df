#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

struct AppConfig
{
    int32_t size{4};
    int32_t seed{0};
    int32_t pits{2};
    int32_t loops{2};
    std::string mapPath;        // empty: generate from size/seed

    bool hasStart{false};       // default: bottom-left cell facing east
    Pose start{1, 7, Direction::East};

    int32_t delayMs{0};
    bool quiet{false};          // only print the final map
    uint32_t maxMoves{0};       // 0: automatic
    int32_t batch{0};           // > 0: statistics over that many seeds
    bool viewer{false};
    bool help{false};
};

// --size N --seed N --pits N --loops N --map FILE --start X,Y,DIR
// --delay MS --quiet --max-moves N --batch N --viewer --help
bool ParseArgs(int argc, const char* const* argv, AppConfig& out, std::string& outError);

std::string UsageText(const std::string& program);

// bottom-left cell facing east unless --start was given
Pose StartPoseFor(const AppConfig& config, int32_t mazeSize);
