#pragma once

struct SDL_Window;
typedef void* SDL_GLContext;

namespace ringchart {

// Dear ImGui platform/renderer glue for an SDL2 window with an OpenGL 3 context.
class ImGuiBackend {
public:
    static void init(SDL_Window* window, SDL_GLContext glContext);
    static void shutdown();
    static void beginFrame();
    static void endFrame(SDL_Window* window, float clearGrey);
};

} // namespace ringchart
