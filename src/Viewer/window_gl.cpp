#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <cstddef>

// Flat-coloured quads in clip space, one vertex = pos2 + rgba.
static const char* const kVertexShader = R"GLSL(
    #version 330 core
    layout(location = 0) in vec2 aPos;
    layout(location = 1) in vec4 aColor;
    out vec4 vColor;
    void main() { vColor = aColor; gl_Position = vec4(aPos, 0.0, 1.0); }
)GLSL";

static const char* const kFragmentShader = R"GLSL(
    #version 330 core
    in vec4 vColor;
    out vec4 FragColor;
    void main() { FragColor = vColor; }
)GLSL";

static GLuint compileStage_(GLenum type, const char* src, const char* label)
{
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    GLint ok = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (ok) return shader;

    char log[512];
    glGetShaderInfoLog(shader, sizeof(log), nullptr, log);
    glDeleteShader(shader);
    throw std::runtime_error(std::string(label) + " shader: " + log);
}

// Throws with the driver's log; nothing is leaked on failure.
static GLuint buildMazeProgram_()
{
    const GLuint vs = compileStage_(GL_VERTEX_SHADER, kVertexShader, "vertex");
    GLuint fs = 0;
    try
    {
        fs = compileStage_(GL_FRAGMENT_SHADER, kFragmentShader, "fragment");
    }
    catch (const std::runtime_error&)
    {
        glDeleteShader(vs);
        throw;
    }

    const GLuint prog = glCreateProgram();
    glAttachShader(prog, vs);
    glAttachShader(prog, fs);
    glLinkProgram(prog);
    glDeleteShader(vs);
    glDeleteShader(fs);

    GLint ok = 0;
    glGetProgramiv(prog, GL_LINK_STATUS, &ok);
    if (ok) return prog;

    char log[512];
    glGetProgramInfoLog(prog, sizeof(log), nullptr, log);
    glDeleteProgram(prog);
    throw std::runtime_error(std::string("maze program link: ") + log);
}

static void onFramebufferSize_(GLFWwindow* w, int width, int height)
{
    // no gl* here: this can fire before gladLoadGLLoader()
    if (auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w)))
        self->onFramebufferResized(width, height);
}

void Viewer::initWindowAndGL()
{
    if (!glfwInit())
        throw std::runtime_error("glfwInit failed");

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    GLFWwindow* win = glfwCreateWindow(fbW, fbH, "Maze Explorer", nullptr, nullptr);
    if (!win)
    {
        glfwTerminate();
        throw std::runtime_error("glfwCreateWindow failed");
    }
    window = win;

    glfwMakeContextCurrent(win);
    glfwSwapInterval(1);
    glfwSetWindowUserPointer(win, this);
    glfwSetFramebufferSizeCallback(win, onFramebufferSize_);

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress))
    {
        shutdownGL();
        throw std::runtime_error("gladLoadGLLoader failed");
    }

    try
    {
        program = buildMazeProgram_();
    }
    catch (const std::runtime_error&)
    {
        shutdownGL();
        throw;
    }

    glGenVertexArrays(1, &vao);
    glGenBuffers(1, &vbo);
    glBindVertexArray(vao);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(Vertex), (void*)offsetof(Vertex, x));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, sizeof(Vertex), (void*)offsetof(Vertex, r));
    glBindVertexArray(0);

    // visit tint is drawn over the cell colour
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    initInputCallbacks();
    updateWindowTitle();
}

void Viewer::shutdownGL()
{
    if (!window) return;

    if (program) { glDeleteProgram(program); program = 0; }
    if (vbo) { glDeleteBuffers(1, &vbo); vbo = 0; }
    if (vao) { glDeleteVertexArrays(1, &vao); vao = 0; }
    vertexCount = 0;

    glfwDestroyWindow(static_cast<GLFWwindow*>(window));
    window = nullptr;
    glfwTerminate();
}
