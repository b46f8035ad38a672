#pragma once

namespace blockfall::controller {

// Discrete player commands, independent of the device that produced them
// (keyboard, console line, scripted replay).
enum class InputAction {
    MoveLeft,
    MoveRight,
    SoftDrop,
    HardDrop,
    RotateCW,
    RotateCCW,
    Hold,
    PauseResume // handled by the controller, never reaches GameState
};

} // namespace blockfall::controller
