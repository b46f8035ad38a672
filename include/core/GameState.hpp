#pragma once

#include "Board.hpp"
#include "Tetromino.hpp"
#include "BagRandomizer.hpp"
#include "GameConfig.hpp"
#include "GameSnapshot.hpp"
#include <optional>
#include <vector>

namespace blockfall::core {

enum class GameStatus {
    Running,
    GameOver
};

// The game-state engine. Owns the board, the bag, the hold slot and the
// active piece. Time only advances through tick(); the engine never reads
// a clock.
//
// Player commands that would put the piece out of bounds or into locked
// cells are dropped without any observable effect. Once the game is over,
// every command is a no-op.
class GameState {
public:
    // Throws std::invalid_argument if the configuration is invalid
    explicit GameState(const GameConfig& config = GameConfig{});

    // Start from a prepared board; its dimensions must match the config
    GameState(const GameConfig& config, Board initialBoard);

    const GameConfig& config() const noexcept { return config_; }
    const Board& board() const noexcept { return board_; }
    const std::optional<Tetromino>& activeTetromino() const noexcept { return activeTetromino_; }
    const std::optional<TetrominoType>& heldType() const noexcept { return heldType_; }
    bool holdUsed() const noexcept { return holdUsed_; }

    // Upcoming kinds, head first
    std::vector<TetrominoType> nextTypes(int count) const { return bag_.peek(count); }

    // Where the active piece would come to rest on a hard drop
    std::optional<Tetromino> ghostTetromino() const;

    std::uint64_t linesCleared() const noexcept { return linesCleared_; }
    std::uint64_t lockedPieces() const noexcept { return lockedPieces_; }
    double elapsedSeconds() const noexcept { return elapsedSeconds_; }
    double lockTimer() const noexcept { return lockTimer_; }
    double dropTimer() const noexcept { return dropTimer_; }

    GameStatus status() const noexcept { return status_; }
    bool isGameOver() const noexcept { return status_ == GameStatus::GameOver; }

    // True if moving the active piece one row down would be invalid
    bool isGrounded() const noexcept;

    GameSnapshot snapshot(int nextCount = 2) const;

    // Player actions
    void move(int dx);  // dx is -1 or +1
    void moveLeft() { move(-1); }
    void moveRight() { move(1); }
    void softDrop();    // move down one, if possible (never locks)
    void hardDrop();    // drop to the bottom, lock and spawn

    void rotate(int direction); // +1 clockwise, -1 counter-clockwise
    void rotateClockwise() { rotate(1); }
    void rotateCounterClockwise() { rotate(-1); }

    void hold();

    // Advance lock delay and gravity by dtSeconds (must be finite and >= 0)
    void tick(double dtSeconds);

private:
    GameConfig config_;
    Board board_;
    BagRandomizer bag_;

    std::optional<Tetromino> activeTetromino_;
    std::optional<TetrominoType> heldType_;
    bool holdUsed_{false};

    double dropTimer_{0.0};
    double lockTimer_{0.0};
    double elapsedSeconds_{0.0};

    std::uint64_t linesCleared_{0};
    std::uint64_t lockedPieces_{0};

    GameStatus status_{GameStatus::Running};

    bool canAct() const noexcept {
        return status_ == GameStatus::Running && activeTetromino_.has_value();
    }

    bool spawnNewTetromino();
    void lockActiveTetrominoAndProcessLines();

    // Helpers that apply a change only if the result fits on the board
    bool tryMove(int dRow, int dCol);
    bool tryRotate(int direction);

    void resetLockTimerIfGrounded() noexcept;
};

} // namespace blockfall::core
