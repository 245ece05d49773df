#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

// The agent's partial map of a D x D maze, stored as a (2D+1) x (2D+1) grid
// in doubled coordinates:
//   even/even  wall intersection (always Intersection)
//   even/odd   wall segment      (Unknown -> Wall | NoWall)
//   odd/even   wall segment
//   odd/odd    cell              (Unknown -> Cell | Pit)
// Slots only ever leave Unknown once and never change afterwards.
class KnowledgeGrid
{
public:
    // Boundary ring known, `start` marked Cell, everything else Unknown.
    KnowledgeGrid(int32_t mazeSize, Point start);

    int32_t MazeSize() const { return mazeSize_; }
    int32_t Extent() const { return extent_; }
    bool InBounds(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && x < extent_ && y < extent_;
    }
    static bool IsCellSlot(int32_t x, int32_t y) { return (x & 1) == 1 && (y & 1) == 1; }

    Slot At(int32_t x, int32_t y) const;
    Slot At(Point p) const { return At(p.x, p.y); }

    Slot WallBetween(Point pos, Direction dir) const;
    void RecordWall(Point pos, Direction dir, bool present);

    Slot CellAt(Point pos, Direction dir) const;
    void RecordCell(Point pos, Direction dir, Hazard hazard);

    // Known NoWall and the neighbour is not a pit. Unknown walls are closed.
    bool IsPathOpen(Point pos, Direction dir) const;

    // Nothing left to learn in `dir` from `pos`.
    bool DirectionRecorded(Point pos, Direction dir) const;
    bool ScanComplete(Point pos) const;

    void Visit(Point pos);
    uint32_t VisitCount(Point pos) const;

    size_t UnknownCount() const;

private:
    void write_(int32_t x, int32_t y, Slot value);
    void checkBounds_(int32_t x, int32_t y) const;

    int32_t mazeSize_;
    int32_t extent_;
    std::vector<std::vector<Slot>> grid_;
    std::vector<uint32_t> visits_; // indexed y * extent + x
};
