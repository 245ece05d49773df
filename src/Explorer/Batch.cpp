#include "Explorer/Batch.hpp"
#include "core/MazeBuilder.hpp"
#include "Oracle/Oracle.hpp"

#include <iomanip>
#include <sstream>

ExploreResult Batch::ExploreSeed(const AppConfig& config, int32_t seed)
{
    ExploreResult r;
    r.seed = seed;

    try
    {
        const Pose start = StartPoseFor(config, config.size);

        BuildOptions opt = DefaultBuildOptions(config.size, seed);
        opt.pitCount = config.pits;
        opt.extraLoops = config.loops;
        opt.start = start.At();

        MapOracle oracle(MazeBuilder::Build(opt));
        Explorer explorer(oracle, config.size, start);
        explorer.maxMoves = config.maxMoves;

        r.found = explorer.Run();
        r.state = explorer.state;
        r.stats = explorer.Stats();
        r.error = explorer.error;
    }
    catch (const std::exception& e)
    {
        r.state = State::END;
        r.found = false;
        r.error = e.what();
    }
    return r;
}

BatchSummary Batch::Run(const AppConfig& config, ThreadPool& pool)
{
    BatchSummary s;

    std::vector<std::future<ExploreResult>> futures;
    futures.reserve((size_t)std::max(0, config.batch));

    for (int32_t i = 0; i < config.batch; ++i)
    {
        const int32_t seed = config.seed + i;
        futures.push_back(pool.enqueue([config, seed] { return ExploreSeed(config, seed); }));
    }

    double moves = 0.0, turns = 0.0, queries = 0.0;
    for (auto& f : futures)
    {
        ExploreResult r = f.get();

        ++s.runs;
        switch (r.state)
        {
        case State::GOAL:        ++s.goal; break;
        case State::STUCK:       ++s.stuck; break;
        case State::UNREACHABLE: ++s.unreachable; break;
        default:                 ++s.ended; break;
        }

        if (r.found)
        {
            moves += r.stats.moves;
            turns += r.stats.turns;
            queries += r.stats.queries;
        }
        s.results.push_back(std::move(r));
    }

    if (s.goal > 0)
    {
        s.avgMoves = moves / s.goal;
        s.avgTurns = turns / s.goal;
        s.avgQueries = queries / s.goal;
    }
    return s;
}

std::string Batch::Describe(const BatchSummary& s)
{
    std::ostringstream os;
    os << "runs=" << s.runs
       << " goal=" << s.goal
       << " stuck=" << s.stuck
       << " unreachable=" << s.unreachable
       << " ended=" << s.ended << "\n";

    os << std::fixed << std::setprecision(2)
       << "avg moves=" << s.avgMoves
       << " turns=" << s.avgTurns
       << " queries=" << s.avgQueries << "\n";

    for (const auto& r : s.results)
    {
        if (r.found) continue;
        os << "  seed " << r.seed << ": " << StateName(r.state);
        if (!r.error.empty()) os << " - " << r.error;
        os << "\n";
    }
    return os.str();
}
