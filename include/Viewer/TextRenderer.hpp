#pragma once
#include "core/Common.hpp"
#include "core/KnowledgeGrid.hpp"

// Console view of the agent's knowledge:
//   + intersection   - | wall   . no wall   o cell   x pit   w goal
//   ? unknown        ^ > v < agent
class TextRenderer
{
public:
    static std::string Render(const KnowledgeGrid& grid, const Pose& pose);

    static char Arrow(Direction d);
};
