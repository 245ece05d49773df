#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

// Percept source answering for the slot directly ahead of a pose.
// Queries never change the oracle or the pose (taken by value).
class EnvironmentOracle
{
public:
    virtual ~EnvironmentOracle() = default;

    virtual bool IsWallAhead(Pose pose) const = 0;
    virtual bool IsPitAhead(Pose pose) const = 0;
    virtual bool IsGoalAhead(Pose pose) const = 0;

    // The cell the agent stands on.
    virtual bool IsGoalHere(Pose pose) const = 0;
};

// Answers from a ground-truth WorldMap.
class MapOracle final : public EnvironmentOracle
{
public:
    explicit MapOracle(WorldMap world);

    bool IsWallAhead(Pose pose) const override;
    bool IsPitAhead(Pose pose) const override;
    bool IsGoalAhead(Pose pose) const override;
    bool IsGoalHere(Pose pose) const override;

    const WorldMap& World() const { return world_; }

private:
    WorldMap world_;
};
