#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

// B: next seed   R: restart   Esc: quit
void Viewer::initInputCallbacks()
{
    GLFWwindow* win = static_cast<GLFWwindow*>(window);
    glfwSetWindowUserPointer(win, this);

    glfwSetKeyCallback(win, [](GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/)
    {
        auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (!self) return;
        if (action != GLFW_PRESS) return;

        if (key == GLFW_KEY_ESCAPE) {
            glfwSetWindowShouldClose(w, GLFW_TRUE);
            return;
        }
        if (key == GLFW_KEY_B) {
            // a loaded map has no seed to advance
            self->startExploration(self->config.mapPath.empty() ? self->seed + 1 : self->seed);
            return;
        }
        if (key == GLFW_KEY_R) {
            self->startExploration(self->seed);
            return;
        }
    });
}
