#include "core/MazeBuilder.hpp"
#include <vector>
#include <random>
#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

BuildOptions DefaultBuildOptions(int32_t size, int32_t seed)
{
    BuildOptions o;
    o.size = size;
    o.seed = seed;
    o.start = { 1, 2 * size - 1 };
    o.goal  = { 2 * size - 1, 1 };
    return o;
}

static bool isCellSlot_(int32_t x, int32_t y) { return (x & 1) == 1 && (y & 1) == 1; }

// BFS over open passages avoiding pits
static bool goalReachable_(const WorldMap& maze)
{
    const int32_t n = maze.Extent();
    std::vector<uint8_t> seen((size_t)n * (size_t)n, 0);
    std::queue<Point> q;

    q.push(maze.start);
    seen[(size_t)maze.start.y * n + maze.start.x] = 1;

    while (!q.empty())
    {
        const Point cur = q.front();
        q.pop();
        if (cur == maze.goal) return true;

        for (Direction d : kAllDirections)
        {
            const Point w = cur.Neighbor(d, Step::Wall);
            if (maze.At(w.x, w.y) != Slot::NoWall) continue;

            const Point c = cur.Neighbor(d, Step::Cell);
            if (maze.At(c.x, c.y) == Slot::Pit) continue;

            uint8_t& s = seen[(size_t)c.y * n + c.x];
            if (s) continue;
            s = 1;
            q.push(c);
        }
    }
    return false;
}

WorldMap MazeBuilder::Build(const BuildOptions& options)
{
    const int32_t SIZE = 2 * options.size + 1;

    if (options.size < 1)
        throw std::invalid_argument("maze size must be at least 1");

    auto insideCell = [&](Point p) {
        return p.x > 0 && p.y > 0 && p.x < SIZE - 1 && p.y < SIZE - 1 && isCellSlot_(p.x, p.y);
    };
    if (!insideCell(options.start) || !insideCell(options.goal))
        throw std::invalid_argument("start and goal must be cells inside the maze");

    WorldMap maze;
    maze.seed = options.seed;
    maze.size = options.size;
    maze.start = options.start;
    maze.goal = options.goal;
    maze.grid.assign(SIZE, std::vector<Slot>(SIZE, Slot::Wall));

    for (int32_t y = 0; y < SIZE; y += 2)
        for (int32_t x = 0; x < SIZE; x += 2)
            maze.grid[y][x] = Slot::Intersection;

    // uncarved cells stay Unknown until the walk reaches them
    for (int32_t y = 1; y < SIZE; y += 2)
        for (int32_t x = 1; x < SIZE; x += 2)
            maze.grid[y][x] = Slot::Unknown;

    std::mt19937 rng((uint32_t)options.seed);

    // Perfect maze (unique path), step=2 between cells
    std::vector<Point> st;
    st.push_back(options.start);
    maze.grid[options.start.y][options.start.x] = Slot::Cell;

    while (!st.empty())
    {
        Point cur = st.back();

        std::array<Direction, 4> dirs = kAllDirections;
        std::shuffle(dirs.begin(), dirs.end(), rng);

        bool moved = false;
        for (Direction dir : dirs)
        {
            const Point next = cur.Neighbor(dir, Step::Cell);
            if (!insideCell(next)) continue;
            if (maze.grid[next.y][next.x] != Slot::Unknown) continue; // only carve into unvisited

            const Point wall = cur.Neighbor(dir, Step::Wall);
            maze.grid[wall.y][wall.x] = Slot::NoWall;
            maze.grid[next.y][next.x] = Slot::Cell;

            st.push_back(next);
            moved = true;
            break;
        }

        if (!moved)
            st.pop_back();
    }

    // braid: open interior walls to create cycles
    std::vector<Point> candidates;
    candidates.reserve((size_t)SIZE * (size_t)SIZE / 2);

    for (int32_t y = 1; y < SIZE - 1; ++y)
    {
        for (int32_t x = 1; x < SIZE - 1; ++x)
        {
            if (isCellSlot_(x, y) || ((x & 1) == 0 && (y & 1) == 0)) continue;
            if (maze.grid[y][x] == Slot::Wall)
                candidates.push_back({ x, y });
        }
    }

    std::shuffle(candidates.begin(), candidates.end(), rng);

    int32_t opened = 0;
    for (const auto& w : candidates)
    {
        if (opened >= options.extraLoops) break;
        maze.grid[w.y][w.x] = Slot::NoWall;
        ++opened;
    }

    maze.grid[options.goal.y][options.goal.x] = Slot::Goal;

    // pits, never cutting the goal off
    std::vector<Point> cells;
    for (int32_t y = 1; y < SIZE; y += 2)
        for (int32_t x = 1; x < SIZE; x += 2)
            if (Point{ x, y } != options.start && Point{ x, y } != options.goal)
                cells.push_back({ x, y });

    std::shuffle(cells.begin(), cells.end(), rng);

    int32_t placed = 0;
    for (const auto& c : cells)
    {
        if (placed >= options.pitCount) break;

        maze.grid[c.y][c.x] = Slot::Pit;
        if (goalReachable_(maze))
            ++placed;
        else
            maze.grid[c.y][c.x] = Slot::Cell;
    }

    std::ostringstream info;
    info << options.size << "x" << options.size << " seed=" << options.seed
         << " loops=" << opened << " pits=" << placed;
    maze.info = info.str();

    return maze;
}

static bool slotFromChar_(char ch, Slot& out)
{
    switch (ch)
    {
    case '+': out = Slot::Intersection; return true;
    case '-':
    case '|': out = Slot::Wall; return true;
    case '.': out = Slot::NoWall; return true;
    case 'o': out = Slot::Cell; return true;
    case 'x': out = Slot::Pit; return true;
    case 'w': out = Slot::Goal; return true;
    default: return false;
    }
}

bool MazeBuilder::Parse(const std::string& text, WorldMap& out, std::string& outError)
{
    std::vector<std::vector<Slot>> rows;

    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;
        std::vector<Slot> row;
        for (char ch : line)
        {
            if (ch == ' ' || ch == '\t' || ch == '\r') continue;

            Slot s{};
            if (!slotFromChar_(ch, s))
            {
                outError = "Unexpected character '" + std::string(1, ch) +
                           "' on line " + std::to_string(lineNo) + ".";
                return false;
            }
            row.push_back(s);
        }
        if (!row.empty()) rows.push_back(std::move(row));
    }

    const int32_t n = (int32_t)rows.size();
    if (n < 3 || (n & 1) == 0)
    {
        outError = "Map needs an odd number of rows (at least 3), got " + std::to_string(n) + ".";
        return false;
    }

    for (int32_t y = 0; y < n; ++y)
    {
        if ((int32_t)rows[y].size() != n)
        {
            outError = "Map must be square: row " + std::to_string(y) + " has " +
                       std::to_string(rows[y].size()) + " slots, expected " + std::to_string(n) + ".";
            return false;
        }

        for (int32_t x = 0; x < n; ++x)
        {
            const Slot s = rows[y][x];
            const bool evenX = (x & 1) == 0;
            const bool evenY = (y & 1) == 0;
            const std::string where = " at (" + std::to_string(x) + ", " + std::to_string(y) + ").";

            if (evenX && evenY)
            {
                if (s != Slot::Intersection) { outError = "Expected '+'" + where; return false; }
            }
            else if (!evenX && !evenY)
            {
                if (s != Slot::Cell && s != Slot::Pit && s != Slot::Goal)
                {
                    outError = "Expected a cell (o, x, w)" + where;
                    return false;
                }
            }
            else
            {
                if (s != Slot::Wall && s != Slot::NoWall)
                {
                    outError = "Expected a wall (-, |, .)" + where;
                    return false;
                }
                const bool boundary = x == 0 || y == 0 || x == n - 1 || y == n - 1;
                if (boundary && s != Slot::Wall)
                {
                    outError = "Boundary is open" + where;
                    return false;
                }
            }
        }
    }

    WorldMap maze;
    maze.grid = std::move(rows);
    maze.size = (n - 1) / 2;
    maze.start = { 1, n - 2 };
    maze.goal = { -1, -1 };

    int32_t goals = 0;
    for (int32_t y = 1; y < n; y += 2)
        for (int32_t x = 1; x < n; x += 2)
            if (maze.grid[y][x] == Slot::Goal)
            {
                if (goals == 0) maze.goal = { x, y };
                ++goals;
            }

    maze.info = std::to_string(maze.size) + "x" + std::to_string(maze.size) +
                " goals=" + std::to_string(goals);

    out = std::move(maze);
    return true;
}

bool MazeBuilder::Load(const std::string& path, WorldMap& out, std::string& outError)
{
    std::ifstream file(path);
    if (!file)
    {
        outError = "Cannot open map file: " + path;
        return false;
    }

    std::stringstream buf;
    buf << file.rdbuf();
    if (!Parse(buf.str(), out, outError))
    {
        outError = path + ": " + outError;
        return false;
    }
    return true;
}

std::string MazeBuilder::Format(const WorldMap& world)
{
    std::string s;
    const int32_t n = world.Extent();
    for (int32_t y = 0; y < n; ++y)
    {
        for (int32_t x = 0; x < n; ++x)
        {
            char ch = '?';
            switch (world.grid[y][x])
            {
            case Slot::Intersection: ch = '+'; break;
            case Slot::Wall:         ch = (y & 1) == 0 ? '-' : '|'; break;
            case Slot::NoWall:       ch = '.'; break;
            case Slot::Cell:         ch = 'o'; break;
            case Slot::Pit:          ch = 'x'; break;
            case Slot::Goal:         ch = 'w'; break;
            case Slot::Unknown:      ch = '?'; break;
            }
            if (x > 0) s.push_back(' ');
            s.push_back(ch);
        }
        s.push_back('\n');
    }
    return s;
}
