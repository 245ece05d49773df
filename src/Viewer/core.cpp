#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"
#include "core/MazeBuilder.hpp"
#include "Oracle/Oracle.hpp"

#include <stdexcept>
#include <algorithm>

// pacing when --delay is not given, otherwise the run is over in one frame
static constexpr int32_t kDefaultDelayMs = 80;

Viewer& Viewer::getInstance()
{
    static Viewer inst;
    return inst;
}

Viewer::Viewer() = default;

Viewer::~Viewer()
{
    cancelExploration();
    pool.shutdown();
    shutdownGL();
}

void Viewer::run(const AppConfig& cfg)
{
    config = cfg;

    initWindowAndGL();

    if (window)
    {
        int w = 1, h = 1;
        glfwGetFramebufferSize(static_cast<GLFWwindow*>(window), &w, &h);
        fbW = std::max(1, w);
        fbH = std::max(1, h);
        glViewport(0, 0, fbW, fbH);
    }

    startExploration(config.seed);

    auto* win = static_cast<GLFWwindow*>(window);
    while (win && !glfwWindowShouldClose(win))
    {
        glClearColor(0.08f, 0.08f, 0.09f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        drawMaze();
        updateWindowTitle();

        glfwSwapBuffers(win);
        glfwPollEvents();
    }

    cancelExploration();
    shutdownGL();
}

void Viewer::updateWindowTitle()
{
    if (!window) return;

    std::string title = "Maze Explorer  |  seed=" + std::to_string(seed);
    {
        std::lock_guard<std::mutex> lk(snapMutex);
        title += "  |  " + std::string(StateName(snap.state));
        title += "  moves=" + std::to_string(snap.stats.moves);
        title += "  turns=" + std::to_string(snap.stats.turns);
        if (!snap.error.empty()) title += "  |  " + snap.error;
    }
    glfwSetWindowTitle(static_cast<GLFWwindow*>(window), title.c_str());
}

void Viewer::cancelExploration()
{
    if (cancelFlag) cancelFlag->store(true, std::memory_order_relaxed);
    if (job.valid()) job.wait();
}

void Viewer::startExploration(int32_t newSeed)
{
    cancelExploration();

    seed = newSeed;
    auto myCancel = std::make_shared<std::atomic<bool>>(false);
    cancelFlag = myCancel;

    {
        std::lock_guard<std::mutex> lk(snapMutex);
        snap = Snapshot{};
        snapDirty = true;
    }

    const AppConfig cfg = config;
    const auto delay = std::chrono::milliseconds(cfg.delayMs > 0 ? cfg.delayMs : kDefaultDelayMs);

    job = pool.enqueue([this, cfg, newSeed, myCancel, delay] {
        try
        {
            WorldMap world;
            if (!cfg.mapPath.empty())
            {
                std::string err;
                if (!MazeBuilder::Load(cfg.mapPath, world, err))
                {
                    publishFailure(err);
                    return;
                }
            }
            else
            {
                BuildOptions opt = DefaultBuildOptions(cfg.size, newSeed);
                opt.pitCount = cfg.pits;
                opt.extraLoops = cfg.loops;
                opt.start = StartPoseFor(cfg, cfg.size).At();
                world = MazeBuilder::Build(opt);
            }

            const int32_t size = world.size;
            MapOracle oracle(std::move(world));
            Explorer explorer(oracle, size, StartPoseFor(cfg, size));
            explorer.cancel = myCancel.get();
            explorer.maxMoves = cfg.maxMoves;
            explorer.onStep = [&](const KnowledgeGrid& g, const Pose& p) {
                publish(g, p, &explorer);
                std::this_thread::sleep_for(delay);
            };

            publish(explorer.Grid(), explorer.CurrentPose(), &explorer);
            explorer.Run();
            publish(explorer.Grid(), explorer.CurrentPose(), &explorer);
        }
        catch (const std::exception& e)
        {
            publishFailure(std::string("Exploration failed: ") + e.what());
        }
    });
}

void Viewer::publish(const KnowledgeGrid& grid, const Pose& pose, const Explorer* explorer)
{
    std::lock_guard<std::mutex> lk(snapMutex);
    snap.grid = grid;
    snap.pose = pose;
    if (explorer)
    {
        snap.state = explorer->state;
        snap.stats = explorer->Stats();
        snap.error = explorer->error;
    }
    snapDirty = true;
}

void Viewer::publishFailure(const std::string& message)
{
    std::cerr << message << "\n";

    std::lock_guard<std::mutex> lk(snapMutex);
    snap.state = State::END;
    snap.error = message;
    snapDirty = true;
}

void Viewer::onFramebufferResized(int width, int height)
{
    fbW = std::max(1, width);
    fbH = std::max(1, height);
}
