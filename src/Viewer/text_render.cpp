#include "Viewer/TextRenderer.hpp"

char TextRenderer::Arrow(Direction d)
{
    switch (d)
    {
    case Direction::North: return '^';
    case Direction::East:  return '>';
    case Direction::South: return 'v';
    case Direction::West:  return '<';
    }
    return '@';
}

std::string TextRenderer::Render(const KnowledgeGrid& grid, const Pose& pose)
{
    const int32_t n = grid.Extent();

    std::string out;
    out.reserve((size_t)n * (size_t)(2 * n + 1));

    for (int32_t y = 0; y < n; ++y)
    {
        const bool evenRow = (y & 1) == 0;
        for (int32_t x = 0; x < n; ++x)
        {
            char ch = '?';
            if (x == pose.x && y == pose.y)
            {
                ch = Arrow(pose.dir);
            }
            else
            {
                switch (grid.At(x, y))
                {
                case Slot::Unknown:      ch = '?'; break;
                case Slot::Intersection: ch = '+'; break;
                case Slot::Wall:         ch = evenRow ? '-' : '|'; break;
                case Slot::NoWall:       ch = '.'; break;
                case Slot::Cell:         ch = 'o'; break;
                case Slot::Pit:          ch = 'x'; break;
                case Slot::Goal:         ch = 'w'; break;
                }
            }

            if (x > 0) out.push_back(' ');
            out.push_back(ch);
        }
        out.push_back('\n');
    }
    return out;
}
