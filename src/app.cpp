#include "app.hpp"
#include "core/MazeBuilder.hpp"
#include "Oracle/Oracle.hpp"
#include "Explorer/Explorer.hpp"
#include "Explorer/Batch.hpp"
#include "Viewer/TextRenderer.hpp"
#include "Thread/ThreadPool.hpp"

#ifdef MAZE_EXPLORER_HAS_VIEWER
#include "Viewer/core.hpp"
#endif

#include <algorithm>
#include <cctype>
#include <string>

const char* const kDemoMap = R"(
+  -  +  -  +  -  +  -  +
|  o  .  o  .  w  .  o  |
+  .  +  .  +  -  +  .  +
|  o  .  x  .  o  .  o  |
+  -  +  .  +  .  +  .  +
|  o  .  o  .  o  .  o  |
+  .  +  .  +  .  +  .  +
|  o  .  o  .  x  .  o  |
+  -  +  -  +  -  +  -  +
)";

int exploreWorld(const WorldMap& world, const AppConfig& config)
{
    const Pose start = StartPoseFor(config, world.size);
    const auto delay = std::chrono::milliseconds(config.delayMs);

    // a --start that is not a cell of the loaded map is rejected here
    std::unique_ptr<MapOracle> oracle;
    std::unique_ptr<Explorer> exp;
    try
    {
        oracle = std::make_unique<MapOracle>(world);
        exp = std::make_unique<Explorer>(*oracle, world.size, start);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "Cannot start exploration: " << e.what() << "\n";
        return 1;
    }

    Explorer& explorer = *exp;
    explorer.maxMoves = config.maxMoves;

    std::cout << "Exploring " << world.info << ", start (" << start.x << ", " << start.y
              << ") facing " << DirectionName(start.dir) << "\n";

    if (!config.quiet)
    {
        std::cout << TextRenderer::Render(explorer.Grid(), explorer.CurrentPose()) << "\n";
        explorer.onStep = [&](const KnowledgeGrid& grid, const Pose& pose) {
            std::cout << "-----------------\n" << TextRenderer::Render(grid, pose) << "\n";
            if (delay.count() > 0) std::this_thread::sleep_for(delay);
        };
    }

    try
    {
        explorer.Run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Exploration aborted: " << e.what() << "\n";
        return 1;
    }

    if (config.quiet)
        std::cout << TextRenderer::Render(explorer.Grid(), explorer.CurrentPose()) << "\n";

    const ExploreStats& st = explorer.Stats();
    const Pose& p = explorer.CurrentPose();

    if (explorer.found)
    {
        std::cout << "Goal located - cell (" << p.x << ", " << p.y << ") after "
                  << st.moves << " moves, " << st.turns << " turns, "
                  << st.queries << " queries\n"
                  << "Note: (0, 0) is the '+' in the top left corner\n";
        return 0;
    }

    std::cerr << "Goal not reached (" << StateName(explorer.state) << "): " << explorer.error << "\n";
    return 1;
}

static int runBatch(const AppConfig& config)
{
    ThreadPool pool(0);
    std::cout << "Exploring " << config.batch << " mazes of size " << config.size
              << " from seed " << config.seed << " on " << pool.size() << " threads\n";

    const BatchSummary summary = Batch::Run(config, pool);
    std::cout << Batch::Describe(summary);
    return summary.goal == summary.runs ? 0 : 1;
}

int runApp(const AppConfig& config)
{
    if (config.batch > 0)
        return runBatch(config);

    if (config.viewer)
    {
#ifdef MAZE_EXPLORER_HAS_VIEWER
        try
        {
            Viewer::getInstance().run(config);
        }
        catch (const std::exception& e)
        {
            std::cerr << "Viewer failed: " << e.what() << "\n";
            return 1;
        }
        return 0;
#else
        std::cerr << "This build has no viewer (GLFW/glad were not found).\n";
        return 1;
#endif
    }

    WorldMap world;
    if (!config.mapPath.empty())
    {
        std::string err;
        if (!MazeBuilder::Load(config.mapPath, world, err))
        {
            std::cerr << err << "\n";
            return 1;
        }
    }
    else
    {
        BuildOptions opt = DefaultBuildOptions(config.size, config.seed);
        opt.pitCount = config.pits;
        opt.extraLoops = config.loops;
        opt.start = StartPoseFor(config, config.size).At();
        try
        {
            world = MazeBuilder::Build(opt);
        }
        catch (const std::invalid_argument& e)
        {
            std::cerr << "Cannot build maze: " << e.what() << "\n";
            return 1;
        }
    }

    return exploreWorld(world, config);
}

static bool readInt(const char* prompt, int32_t& out)
{
    std::cout << prompt;
    if (std::cin >> out) return true;

    std::cin.clear();
    std::string junk;
    std::getline(std::cin, junk);
    std::cout << "Invalid number." << std::endl;
    return false;
}

int runInteractive()
{
    while (1) {
        std::string input;
        std::cout << "press b to build and explore a maze" << std::endl;
        std::cout << "press d to explore the demo map" << std::endl;
        std::cout << "press l to load a map file" << std::endl;
        std::cout << "press s for statistics over many seeds" << std::endl;
#ifdef MAZE_EXPLORER_HAS_VIEWER
        std::cout << "press v to open the viewer" << std::endl;
#endif
        std::cout << "press q to quit" << std::endl;
        if (!(std::cin >> input)) break;

        std::transform(input.begin(), input.end(), input.begin(),
                       [](unsigned char ch) { return (char)std::tolower(ch); });

        AppConfig config;
        if (input == "b" || input == "v") {
            if (!readInt("Enter maze size: ", config.size) || config.size < 1) continue;
            if (!readInt("Enter seed value: ", config.seed)) continue;
            if (!readInt("Enter delay (ms): ", config.delayMs) || config.delayMs < 0) continue;
            config.viewer = (input == "v");
            runApp(config);
        } else if (input == "d") {
            WorldMap world;
            std::string err;
            if (!MazeBuilder::Parse(kDemoMap, world, err)) {
                std::cerr << err << std::endl;
                continue;
            }
            if (!readInt("Enter delay (ms): ", config.delayMs) || config.delayMs < 0) continue;
            exploreWorld(world, config);
        } else if (input == "l") {
            std::cout << "Enter map path: ";
            std::cin >> config.mapPath;
            runApp(config);
        } else if (input == "s") {
            if (!readInt("Enter maze size: ", config.size) || config.size < 1) continue;
            if (!readInt("Enter number of seeds: ", config.batch) || config.batch < 1) continue;
            runApp(config);
        } else if (input == "q") {
            break;
        } else {
            std::cout << "Invalid input. Please try again." << std::endl;
        }
    }

    return 0;
}
