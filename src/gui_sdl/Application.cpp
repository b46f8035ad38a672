#include "gui_sdl/Application.hpp"

#include <chrono>
#include <cstdio>
#include <utility>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

namespace blockfall::gui_sdl {

Application::Application() = default;

Application::~Application() {
    shutdown();
}

bool Application::init(const char* title, int width, int height) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS) != 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }

    m_window = SDL_CreateWindow(
        title,
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        width, height,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
    );

    if (!m_window) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    m_renderer = SDL_CreateRenderer(
        m_window,
        -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC
    );

    if (!m_renderer) {
        std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError());
        return false;
    }

    // ---- ImGui setup ----
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = nullptr; // fixed layout, nothing to persist

    ImGui_ImplSDL2_InitForSDLRenderer(m_window, m_renderer);
    ImGui_ImplSDLRenderer2_Init(m_renderer);
    m_imguiReady = true;

    m_running = true;
    return true;
}

void Application::shutdown() {
    // If SDL wasn't initialized, skip.
    if (!SDL_WasInit(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS)) {
        return;
    }

    // Screens may hold ImGui state; drop them first
    m_screen.reset();

    if (m_imguiReady) {
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiReady = false;
    }

    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }

    SDL_Quit();
}

void Application::setScreen(std::unique_ptr<Screen> screen) {
    m_screen = std::move(screen);
    // Time spent before the switch does not belong to the new screen
    m_lastFrame = Clock::now();
    m_carry = Clock::duration::zero();
}

void Application::getWindowSize(int& w, int& h) const {
    w = 0; h = 0;
    if (m_window) SDL_GetWindowSize(m_window, &w, &h);
}

void Application::beginImGuiFrame() {
    // Clear screen FIRST so Screen can draw SDL stuff and ImGui can overlay on top
    SDL_SetRenderDrawColor(m_renderer, 0, 0, 0, 255);
    SDL_RenderClear(m_renderer);

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();
}

void Application::endImGuiFrame() {
    ImGui::Render();
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);
    SDL_RenderPresent(m_renderer);
}

void Application::dispatchEvent(const SDL_Event& e) {
    if (e.type == SDL_QUIT) {
        m_running = false;
        return;
    }
    if (!m_screen) return;

    if (e.type == SDL_WINDOWEVENT
        && (e.window.event == SDL_WINDOWEVENT_FOCUS_LOST
            || e.window.event == SDL_WINDOWEVENT_MINIMIZED)) {
        m_screen->onFocusLost(*this);
        return;
    }

    // Keyboard input belongs to ImGui while one of its widgets is active
    if ((e.type == SDL_KEYDOWN || e.type == SDL_KEYUP) && ImGui::GetIO().WantTextInput) {
        return;
    }

    m_screen->handleEvent(*this, e);
}

Screen::FrameTime Application::takeFrameTime(Clock::time_point now) {
    m_carry += now - m_lastFrame;
    m_lastFrame = now;

    const auto whole = std::chrono::duration_cast<Screen::FrameTime>(m_carry);
    m_carry -= whole;
    return whole;
}

int Application::run() {
    const auto frameBudget = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / TargetFps));
    m_lastFrame = Clock::now();
    m_carry = Clock::duration::zero();

    SDL_Event e;
    while (m_running) {
        const auto frameStart = Clock::now();

        while (SDL_PollEvent(&e)) {
            ImGui_ImplSDL2_ProcessEvent(&e);
            dispatchEvent(e);
        }

        const auto elapsed = takeFrameTime(Clock::now());
        if (m_screen && m_running) {
            m_screen->update(*this, elapsed);
        }

        beginImGuiFrame();
        if (m_screen) {
            m_screen->render(*this);
        }
        endImGuiFrame();

        // Cap the loop when vsync is unavailable
        const auto spent = Clock::now() - frameStart;
        if (spent < frameBudget) {
            const auto rest = std::chrono::duration_cast<std::chrono::milliseconds>(frameBudget - spent);
            SDL_Delay(static_cast<Uint32>(rest.count()));
        }
    }

    return 0;
}

} // namespace blockfall::gui_sdl
