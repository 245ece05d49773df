#pragma once
#include "core/Common.hpp"

#include <glad/glad.h>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

struct Vertex
{
    float x, y;
    float r, g, b, a;
};

struct Color
{
    float r, g, b, a;
};

// 向顶点数组添加一个矩形
inline void PushRect(std::vector<Vertex>& out,
                     float x0, float y0, float x1, float y1,
                     const Color& c)
{
    out.push_back({x0, y0, c.r, c.g, c.b, c.a});
    out.push_back({x1, y0, c.r, c.g, c.b, c.a});
    out.push_back({x1, y1, c.r, c.g, c.b, c.a});

    out.push_back({x0, y0, c.r, c.g, c.b, c.a});
    out.push_back({x1, y1, c.r, c.g, c.b, c.a});
    out.push_back({x0, y1, c.r, c.g, c.b, c.a});
}
