#pragma once

#include "core/GameState.hpp"
#include "controller/InputAction.hpp"
#include <chrono>
#include <optional>

namespace blockfall::controller {

class GameController {
public:
    using Duration = std::chrono::milliseconds;

    // Longest single step a host may request
    static constexpr double MaxStepSeconds = 3600.0;

    // Rounds seconds to a Duration; nullopt for negative, non-finite or
    // over-long values
    static std::optional<Duration> durationFromSeconds(double seconds);

    /// Controller does not own the GameState; caller keeps it alive.
    explicit GameController(blockfall::core::GameState& game);

    /// Handle a single discrete player action (e.g. key press).
    void handleAction(InputAction action);

    // Called once per frame with the time elapsed since the previous frame.
    // The elapsed time is forwarded to GameState::tick unless paused.
    void update(Duration elapsed);

    bool isPaused() const noexcept { return paused_; }

    // Clear the pause flag (e.g. after the host starts a fresh game)
    void resetTiming();

private:
    blockfall::core::GameState& game_;
    bool paused_{false};
};

} // namespace blockfall::controller
