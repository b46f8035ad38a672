#include "controller/GameController.hpp"

#include <cmath>

namespace blockfall::controller {

std::optional<GameController::Duration> GameController::durationFromSeconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0 || seconds > MaxStepSeconds) {
        return std::nullopt;
    }
    return std::chrono::round<Duration>(std::chrono::duration<double>(seconds));
}

GameController::GameController(blockfall::core::GameState& game)
    : game_{game}
{
}

void GameController::handleAction(InputAction action) {
    // If the game is over, only a fresh GameState from outside helps;
    // controller doesn't auto-reset here.
    if (game_.isGameOver()) {
        return;
    }

    if (action == InputAction::PauseResume) {
        paused_ = !paused_;
        return;
    }

    if (paused_) {
        return;
    }

    switch (action) {
    case InputAction::MoveLeft:
        game_.moveLeft();
        break;
    case InputAction::MoveRight:
        game_.moveRight();
        break;
    case InputAction::SoftDrop:
        game_.softDrop();
        break;
    case InputAction::HardDrop:
        game_.hardDrop();
        break;
    case InputAction::RotateCW:
        game_.rotateClockwise();
        break;
    case InputAction::RotateCCW:
        game_.rotateCounterClockwise();
        break;
    case InputAction::Hold:
        game_.hold();
        break;
    case InputAction::PauseResume:
        break;
    }
}

void GameController::update(Duration elapsed) {
    if (paused_ || game_.isGameOver()) {
        return;
    }
    if (elapsed < Duration::zero()) {
        return;
    }

    game_.tick(std::chrono::duration<double>(elapsed).count());
}

void GameController::resetTiming() {
    paused_ = false;
}

} // namespace blockfall::controller
