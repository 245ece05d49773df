#pragma once

#include "core/Common.hpp"
#include "core/Config.hpp"
#include "core/KnowledgeGrid.hpp"
#include "Explorer/Explorer.hpp"
#include "Thread/ThreadPool.hpp"

// Live window over one exploration. The exploration runs on a pool worker
// and publishes snapshots; the window thread only reads them.
class Viewer {
public:
    static Viewer& getInstance();

    // Main thread. Returns when the window is closed.
    void run(const AppConfig& config);

    void onFramebufferResized(int width, int height);

private:
    Viewer();
    ~Viewer();

    struct Snapshot
    {
        std::optional<KnowledgeGrid> grid;
        Pose pose{1, 1, Direction::East};
        State state{State::START};
        ExploreStats stats{};
        std::string error;
    };

    // window/gl
    void initWindowAndGL();
    void shutdownGL();
    void initInputCallbacks();
    void updateWindowTitle();

    // render
    void drawMaze();
    void rebuildMeshIfDirty();
    void rebuildMeshFromSnapshot(const Snapshot& s);

    // work
    void startExploration(int32_t seed);
    void cancelExploration();
    void publish(const KnowledgeGrid& grid, const Pose& pose, const Explorer* explorer);
    void publishFailure(const std::string& message);

private:
    // -------- window / gl state --------
    void* window = nullptr; // actually GLFWwindow*
    int fbW = 800;
    int fbH = 800;

    uint32_t program = 0;
    uint32_t vao = 0;
    uint32_t vbo = 0;
    int vertexCount = 0;

    // -------- exploration shared with the worker --------
    mutable std::mutex snapMutex;
    Snapshot snap;
    bool snapDirty = false;

    AppConfig config;
    int32_t seed = 0;
    std::shared_ptr<std::atomic<bool>> cancelFlag;
    std::future<void> job;

    ThreadPool pool{1};
};
