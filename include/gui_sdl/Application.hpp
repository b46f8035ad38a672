#pragma once

#include <chrono>
#include <memory>

#include <SDL.h>

#include "gui_sdl/Screen.hpp"

namespace blockfall::gui_sdl {

// Owns the SDL window, the renderer and the Dear ImGui context, and runs
// the frame loop for the current Screen.
class Application {
public:
    static constexpr int TargetFps = 60;

    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool init(const char* title, int width, int height);
    int run();

    void requestQuit() { m_running = false; }

    void setScreen(std::unique_ptr<Screen> screen);

    SDL_Window* window() const { return m_window; }
    SDL_Renderer* renderer() const { return m_renderer; }

    void getWindowSize(int& w, int& h) const;

private:
    using Clock = std::chrono::steady_clock;

    void shutdown();
    void dispatchEvent(const SDL_Event& e);
    Screen::FrameTime takeFrameTime(Clock::time_point now);
    void beginImGuiFrame();
    void endImGuiFrame();

private:
    bool m_running{false};
    bool m_imguiReady{false};

    SDL_Window* m_window{nullptr};
    SDL_Renderer* m_renderer{nullptr};

    std::unique_ptr<Screen> m_screen;

    Clock::time_point m_lastFrame{};
    Clock::duration m_carry{}; // not yet handed to the screen
};

} // namespace blockfall::gui_sdl
