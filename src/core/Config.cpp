#include "core/Config.hpp"

#include <sstream>

static bool parseInt_(const std::string& s, int32_t& out)
{
    if (s.empty()) return false;
    try
    {
        size_t used = 0;
        const long long v = std::stoll(s, &used);
        if (used != s.size()) return false;
        if (v < INT32_MIN || v > INT32_MAX) return false;
        out = (int32_t)v;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

static bool parseStart_(const std::string& s, Pose& out)
{
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ','))
        parts.push_back(item);

    if (parts.size() != 3) return false;

    Pose p{};
    if (!parseInt_(parts[0], p.x)) return false;
    if (!parseInt_(parts[1], p.y)) return false;
    if (!ParseDirection(parts[2], p.dir)) return false;

    out = p;
    return true;
}

bool ParseArgs(int argc, const char* const* argv, AppConfig& out, std::string& outError)
{
    AppConfig cfg;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        auto value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc)
            {
                outError = "Missing value for " + arg + ".";
                return false;
            }
            dst = argv[++i];
            return true;
        };

        auto number = [&](int32_t& dst, int32_t minValue) -> bool {
            std::string v;
            if (!value(v)) return false;
            if (!parseInt_(v, dst) || dst < minValue)
            {
                outError = "Invalid value for " + arg + ": " + v + ".";
                return false;
            }
            return true;
        };

        if (arg == "--size")       { if (!number(cfg.size, 1)) return false; }
        else if (arg == "--seed")  { if (!number(cfg.seed, INT32_MIN)) return false; }
        else if (arg == "--pits")  { if (!number(cfg.pits, 0)) return false; }
        else if (arg == "--loops") { if (!number(cfg.loops, 0)) return false; }
        else if (arg == "--delay") { if (!number(cfg.delayMs, 0)) return false; }
        else if (arg == "--batch") { if (!number(cfg.batch, 1)) return false; }
        else if (arg == "--max-moves")
        {
            int32_t m = 0;
            if (!number(m, 0)) return false;
            cfg.maxMoves = (uint32_t)m;
        }
        else if (arg == "--map")   { if (!value(cfg.mapPath)) return false; }
        else if (arg == "--start")
        {
            std::string v;
            if (!value(v)) return false;
            if (!parseStart_(v, cfg.start))
            {
                outError = "Invalid start pose '" + v + "', expected X,Y,DIR.";
                return false;
            }
            cfg.hasStart = true;
        }
        else if (arg == "--quiet")  cfg.quiet = true;
        else if (arg == "--viewer") cfg.viewer = true;
        else if (arg == "--help" || arg == "-h") cfg.help = true;
        else
        {
            outError = "Unknown option: " + arg;
            return false;
        }
    }

    out = cfg;
    return true;
}

std::string UsageText(const std::string& program)
{
    std::ostringstream os;
    os << "usage: " << program << " [options]\n"
       << "  --size N        maze side length in cells (default 4)\n"
       << "  --seed N        generator seed (default 0)\n"
       << "  --pits N        pits to place (default 2)\n"
       << "  --loops N       extra openings after carving (default 2)\n"
       << "  --map FILE      load a text map instead of generating one\n"
       << "  --start X,Y,DIR starting pose in doubled coordinates\n"
       << "  --delay MS      pause after every step\n"
       << "  --quiet         print only the final map\n"
       << "  --max-moves N   stop after N moves (default 16*size*size)\n"
       << "  --batch N       explore N seeds and print statistics\n"
       << "  --viewer        open the OpenGL viewer\n"
       << "With no options an interactive menu is shown.\n";
    return os.str();
}

Pose StartPoseFor(const AppConfig& config, int32_t mazeSize)
{
    if (config.hasStart) return config.start;
    return { 1, 2 * mazeSize - 1, Direction::East };
}
