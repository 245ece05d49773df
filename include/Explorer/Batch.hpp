#pragma once
#include "core/Common.hpp"
#include "core/Config.hpp"
#include "Explorer/Explorer.hpp"
#include "Thread/ThreadPool.hpp"

struct ExploreResult
{
    int32_t seed{0};
    State state{State::START};
    bool found{false};
    ExploreStats stats{};
    std::string error;
};

struct BatchSummary
{
    int32_t runs{0};
    int32_t goal{0};
    int32_t stuck{0};
    int32_t unreachable{0};
    int32_t ended{0};     // cancelled, move limit or exception
    double avgMoves{0.0}; // over runs that found the goal
    double avgTurns{0.0};
    double avgQueries{0.0};
    std::vector<ExploreResult> results; // ordered by seed
};

class Batch
{
public:
    // Generate the maze for `seed` from the config and explore it.
    static ExploreResult ExploreSeed(const AppConfig& config, int32_t seed);

    // config.batch seeds starting at config.seed, one job per seed.
    static BatchSummary Run(const AppConfig& config, ThreadPool& pool);

    static std::string Describe(const BatchSummary& summary);
};
