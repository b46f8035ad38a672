#pragma once

#include <chrono>

#include <SDL.h>

namespace blockfall::gui_sdl {

class Application;

// One full-window view driven by Application's frame loop
class Screen {
public:
    using FrameTime = std::chrono::milliseconds;

    virtual ~Screen() = default;

    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;

    // Whole milliseconds since the previous frame; sub-millisecond
    // remainders are carried by Application into the next frame
    virtual void update(Application& app, FrameTime elapsed) = 0;

    virtual void render(Application& app) = 0;

    // The window lost keyboard focus or was minimized
    virtual void onFocusLost(Application&) {}
};

} // namespace blockfall::gui_sdl
