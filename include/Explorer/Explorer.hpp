#pragma once
#include "core/Common.hpp"
#include "core/KnowledgeGrid.hpp"
#include "Oracle/Oracle.hpp"

enum class State
{
    START,
    SCAN,        // inspect every unrecorded direction of the current cell
    DECIDE,      // pick the next move
    MOVE,        // turn and advance one cell
    GOAL,        // entered the goal cell
    STUCK,       // no open direction
    UNREACHABLE, // nothing reachable left to explore
    END          // cancelled or move limit reached
};

const char* StateName(State s);

// 16 * D * D, saturating at UINT32_MAX.
uint32_t AutoMoveLimit(int32_t mazeSize);

struct ExploreStats
{
    uint32_t moves{0};
    uint32_t turns{0};
    uint32_t queries{0};
};

// Scan-then-move explorer. Owns the knowledge grid and the pose; the oracle
// is only queried.
class Explorer
{
public:
    using StepCallback = std::function<void(const KnowledgeGrid&, const Pose&)>;

    Explorer(const EnvironmentOracle& oracle, int32_t mazeSize, Pose start);

    State state{State::START};
    uint32_t timeStep{0};

    std::vector<PointInfo> way; // cells entered, in order (start included)

    bool found{false};
    std::string error;

    std::atomic<bool>* cancel{nullptr};
    uint32_t maxMoves{0};       // 0: 16 * D * D
    StepCallback onStep;        // after every percept record and every move

    // One phase of the state machine.
    void update();

    // Until a terminal state. Returns `found`.
    bool Run();

    bool IsFinished() const;

    const KnowledgeGrid& Grid() const { return grid_; }
    const Pose& CurrentPose() const { return pose_; }
    const ExploreStats& Stats() const { return stats_; }
    std::optional<Direction> Target() const { return target_; }
    uint32_t MoveLimit() const;

private:
    void scan_();
    void decide_();
    void move_();

    void turnLeft_();
    void turnRight_();
    void turnToFace_(Direction target);
    void advance_();
    void notify_();

    const EnvironmentOracle& oracle_;
    KnowledgeGrid grid_;
    Pose pose_;
    std::optional<Direction> target_;
    ExploreStats stats_{};
};
