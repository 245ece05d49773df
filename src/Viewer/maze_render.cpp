#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <algorithm>

static const Color kUnknown  {0.30f, 0.30f, 0.33f, 1.00f};
static const Color kWall     {0.05f, 0.05f, 0.05f, 1.00f};
static const Color kOpen     {0.85f, 0.85f, 0.85f, 1.00f};
static const Color kCell     {0.95f, 0.95f, 0.95f, 1.00f};
static const Color kVisited  {0.20f, 0.55f, 1.00f, 0.35f};
static const Color kPit      {0.95f, 0.20f, 0.20f, 1.00f};
static const Color kGoal     {0.20f, 0.85f, 0.25f, 1.00f};
static const Color kAgent    {1.00f, 0.55f, 0.05f, 1.00f};
static const Color kHeading  {0.10f, 0.10f, 0.10f, 1.00f};

static const Color& slotColor_(Slot s)
{
    switch (s)
    {
    case Slot::Unknown:      return kUnknown;
    case Slot::Wall:
    case Slot::Intersection: return kWall;
    case Slot::NoWall:       return kOpen;
    case Slot::Cell:         return kCell;
    case Slot::Pit:          return kPit;
    case Slot::Goal:         return kGoal;
    }
    return kUnknown;
}

void Viewer::rebuildMeshIfDirty()
{
    Snapshot local{};
    {
        std::lock_guard<std::mutex> lk(snapMutex);
        if (!snapDirty) return;
        local = snap;
        snapDirty = false;
    }
    rebuildMeshFromSnapshot(local);
}

void Viewer::rebuildMeshFromSnapshot(const Snapshot& s)
{
    if (!s.grid) { vertexCount = 0; return; }

    const KnowledgeGrid& grid = *s.grid;
    const int n = grid.Extent();

    std::vector<Vertex> verts;
    verts.reserve((size_t)n * (size_t)n * 12 + 24);

    const float cell = 2.0f / (float)n;
    const float startX = -1.0f;
    const float startY =  1.0f;

    auto rectOf = [&](int c, int r, float shrink, float& x0, float& y0, float& x1, float& y1) {
        const float pad = cell * (1.0f - shrink) * 0.5f;
        x0 = startX + (float)c * cell + pad;
        y1 = startY - (float)r * cell - pad;
        x1 = x0 + cell - 2.0f * pad;
        y0 = y1 - cell + 2.0f * pad;
    };

    for (int r = 0; r < n; ++r)
    {
        for (int c = 0; c < n; ++c)
        {
            float x0, y0, x1, y1;
            rectOf(c, r, 1.0f, x0, y0, x1, y1);
            PushRect(verts, x0, y0, x1, y1, slotColor_(grid.At(c, r)));

            if (KnowledgeGrid::IsCellSlot(c, r) && grid.VisitCount({c, r}) > 0)
            {
                Color v = kVisited;
                v.a = std::min(0.85f, kVisited.a * (float)grid.VisitCount({c, r}));
                PushRect(verts, x0, y0, x1, y1, v);
            }
        }
    }

    // agent, with a notch on the facing side
    {
        float x0, y0, x1, y1;
        rectOf(s.pose.x, s.pose.y, 0.60f, x0, y0, x1, y1);
        PushRect(verts, x0, y0, x1, y1, s.state == State::GOAL ? kGoal : kAgent);

        const float w = (x1 - x0) * 0.30f;
        const float mx = (x0 + x1) * 0.5f;
        const float my = (y0 + y1) * 0.5f;
        switch (s.pose.dir)
        {
        case Direction::North: PushRect(verts, mx - w * 0.5f, y1 - w, mx + w * 0.5f, y1, kHeading); break;
        case Direction::South: PushRect(verts, mx - w * 0.5f, y0, mx + w * 0.5f, y0 + w, kHeading); break;
        case Direction::East:  PushRect(verts, x1 - w, my - w * 0.5f, x1, my + w * 0.5f, kHeading); break;
        case Direction::West:  PushRect(verts, x0, my - w * 0.5f, x0 + w, my + w * 0.5f, kHeading); break;
        }
    }

    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(verts.size() * sizeof(Vertex)), verts.data(), GL_DYNAMIC_DRAW);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    vertexCount = (int)verts.size();
}

void Viewer::drawMaze()
{
    rebuildMeshIfDirty();

    if (vertexCount <= 0) return;

    // square viewport, centred
    const int sidePx = std::min(fbW, fbH);
    const int vpX = std::max(0, (fbW - sidePx) / 2);
    const int vpY = std::max(0, (fbH - sidePx) / 2);

    glViewport(vpX, vpY, sidePx, sidePx);

    glUseProgram(program);
    glBindVertexArray(vao);
    glDrawArrays(GL_TRIANGLES, 0, vertexCount);
    glBindVertexArray(0);
    glUseProgram(0);

    glViewport(0, 0, fbW, fbH);
}
