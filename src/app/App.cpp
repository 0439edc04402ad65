#include "app/App.h"

#include <SDL.h>
#include <imgui.h>
#include <imgui_impl_sdl2.h>

#include "app/Config.h"
#include "ui/ImGuiBackend.h"
#include "ui/MainWindow.h"

namespace ringchart {

App* App::instance_ = nullptr;

App::App() {
    instance_ = this;
}

App::~App() {
    instance_ = nullptr;
}

App& App::instance() {
    return *instance_;
}

bool App::init(int /*argc*/, char* /*argv*/[]) {
    Config::instance().load();
    windowWidth_ = Config::instance().windowWidth;
    windowHeight_ = Config::instance().windowHeight;

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        SDL_Log("SDL_Init failed: %s", SDL_GetError());
        return false;
    }

    // Request OpenGL 3.3 Core
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);
    SDL_GL_SetAttribute(SDL_GL_MULTISAMPLEBUFFERS, 1);
    SDL_GL_SetAttribute(SDL_GL_MULTISAMPLESAMPLES, 4);

    Uint32 windowFlags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI;
    window_ = SDL_CreateWindow(
        "ringchart",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        windowWidth_, windowHeight_,
        windowFlags
    );
    if (!window_) {
        SDL_Log("SDL_CreateWindow failed: %s", SDL_GetError());
        return false;
    }

    glContext_ = SDL_GL_CreateContext(window_);
    if (!glContext_) {
        SDL_Log("SDL_GL_CreateContext failed: %s", SDL_GetError());
        return false;
    }
    SDL_GL_MakeCurrent(window_, glContext_);
    SDL_GL_SetSwapInterval(1); // vsync

    ImGuiBackend::init(window_, glContext_);
    MainWindow::instance().init();

    running_ = true;
    return true;
}

void App::run() {
    while (running_) {
        processEvents();
        ImGuiBackend::beginFrame();
        MainWindow::instance().draw();
        ImGuiBackend::endFrame(window_, 0.12f);
    }
}

void App::shutdown() {
    if (window_) {
        Config::instance().windowWidth = windowWidth_;
        Config::instance().windowHeight = windowHeight_;
        Config::instance().save();
    }

    if (ImGui::GetCurrentContext()) {
        ImGuiBackend::shutdown();
    }
    if (glContext_) {
        SDL_GL_DeleteContext(glContext_);
        glContext_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    SDL_Quit();
}

void App::processEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        ImGui_ImplSDL2_ProcessEvent(&event);
        if (event.type == SDL_QUIT) {
            running_ = false;
        }
        if (event.type == SDL_WINDOWEVENT &&
            event.window.event == SDL_WINDOWEVENT_CLOSE &&
            event.window.windowID == SDL_GetWindowID(window_)) {
            running_ = false;
        }
        if (event.type == SDL_WINDOWEVENT &&
            event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
            windowWidth_ = event.window.data1;
            windowHeight_ = event.window.data2;
        }
    }
}

} // namespace ringchart
