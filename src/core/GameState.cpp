#include "core/GameState.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace blockfall::core {

namespace {

const GameConfig& validated(const GameConfig& config) {
    config.validate();
    return config;
}

BagRandomizer makeBag(const GameConfig& config) {
    return config.seed ? BagRandomizer{*config.seed} : BagRandomizer{};
}

PieceView viewOf(const Tetromino& t) {
    return PieceView{t.type(), t.blocks(), t.color()};
}

} // namespace

GameState::GameState(const GameConfig& config)
    : config_(validated(config))
    , board_{config_.rows, config_.cols}
    , bag_{makeBag(config_)}
{
    spawnNewTetromino();
}

GameState::GameState(const GameConfig& config, Board initialBoard)
    : config_(validated(config))
    , board_{std::move(initialBoard)}
    , bag_{makeBag(config_)}
{
    if (board_.rows() != config_.rows || board_.cols() != config_.cols) {
        throw std::invalid_argument("GameState: initial board dimensions do not match the configuration");
    }
    spawnNewTetromino();
}

bool GameState::isGrounded() const noexcept {
    if (!activeTetromino_) return false;

    for (const auto& b : activeTetromino_->blocks()) {
        const int below = b.row + 1;
        if (below >= board_.rows() || board_.isOccupied(below, b.col)) {
            return true;
        }
    }
    return false;
}

std::optional<Tetromino> GameState::ghostTetromino() const {
    if (!activeTetromino_) return std::nullopt;

    Tetromino ghost = *activeTetromino_;
    while (true) {
        const Position prev = ghost.origin();
        ghost.setOrigin(Position{prev.row + 1, prev.col});
        if (!board_.canPlace(ghost.blocks())) {
            ghost.setOrigin(prev);
            break;
        }
    }
    return ghost;
}

GameSnapshot GameState::snapshot(int nextCount) const {
    GameSnapshot snap;
    snap.rows = board_.rows();
    snap.cols = board_.cols();
    snap.cells.reserve(static_cast<std::size_t>(snap.rows * snap.cols));
    for (int r = 0; r < snap.rows; ++r) {
        for (int c = 0; c < snap.cols; ++c) {
            snap.cells.push_back(board_.cellColor(r, c));
        }
    }

    if (activeTetromino_) {
        snap.active = viewOf(*activeTetromino_);
        if (!isGameOver()) {
            if (auto ghost = ghostTetromino()) {
                snap.ghost = viewOf(*ghost);
            }
        }
    }

    snap.held = heldType_;
    snap.next = bag_.peek(nextCount);
    snap.linesCleared = linesCleared_;
    snap.lockedPieces = lockedPieces_;
    snap.elapsedSeconds = elapsedSeconds_;
    snap.gameOver = isGameOver();
    return snap;
}

void GameState::move(int dx) {
    if (!canAct()) return;
    if (dx != -1 && dx != 1) return;

    if (tryMove(0, dx)) {
        resetLockTimerIfGrounded();
    }
}

void GameState::softDrop() {
    if (!canAct()) return;

    // No lock here even if the piece cannot fall; lock delay decides that
    if (tryMove(1, 0)) {
        resetLockTimerIfGrounded();
    }
}

void GameState::hardDrop() {
    if (!canAct()) return;

    // Drop until we can't move further
    while (tryMove(1, 0)) {
        // keep dropping
    }

    lockActiveTetrominoAndProcessLines();
    spawnNewTetromino();
}

void GameState::rotate(int direction) {
    if (!canAct()) return;
    if (direction != -1 && direction != 1) return;

    if (tryRotate(direction)) {
        resetLockTimerIfGrounded();
    }
}

void GameState::hold() {
    if (!canAct() || holdUsed_) return;

    // Set before the branch: a spawn from the empty-slot branch clears it again
    holdUsed_ = true;

    const TetrominoType current = activeTetromino_->type();

    if (!heldType_) {
        heldType_ = current;
        spawnNewTetromino();
    } else {
        Tetromino swapped{*heldType_, Rotation::R0, config_.spawn};
        heldType_ = current;
        activeTetromino_ = swapped;
        if (!board_.canPlace(swapped.blocks())) {
            status_ = GameStatus::GameOver;
        }
    }

    lockTimer_ = 0.0;
}

void GameState::tick(double dtSeconds) {
    if (!std::isfinite(dtSeconds) || dtSeconds < 0.0) {
        throw std::invalid_argument("GameState::tick: dt must be a finite, non-negative number of seconds");
    }
    if (!canAct()) return;

    elapsedSeconds_ += dtSeconds;

    if (isGrounded()) {
        lockTimer_ += dtSeconds;
        if (lockTimer_ >= config_.lockDelaySeconds) {
            lockActiveTetrominoAndProcessLines();
            if (!spawnNewTetromino()) {
                return;
            }
        }
    } else {
        lockTimer_ = 0.0;
    }

    dropTimer_ += dtSeconds;
    if (dropTimer_ >= config_.dropIntervalSeconds) {
        dropTimer_ = 0.0;
        softDrop();
    }
}

bool GameState::spawnNewTetromino() {
    activeTetromino_ = Tetromino{bag_.draw(), Rotation::R0, config_.spawn};
    holdUsed_ = false;
    lockTimer_ = 0.0;

    if (!board_.canPlace(activeTetromino_->blocks())) {
        // Cannot spawn -> game over. The piece stays visible but never touches the board.
        status_ = GameStatus::GameOver;
        return false;
    }
    return true;
}

void GameState::lockActiveTetrominoAndProcessLines() {
    if (!activeTetromino_) return;

    board_.commit(activeTetromino_->blocks(), activeTetromino_->color());
    ++lockedPieces_;

    const int lines = board_.clearFullLines();
    linesCleared_ += static_cast<std::uint64_t>(lines);
}

bool GameState::tryMove(int dRow, int dCol) {
    if (!activeTetromino_) return false;

    Tetromino moved = *activeTetromino_;
    Position origin = moved.origin();
    origin.row += dRow;
    origin.col += dCol;
    moved.setOrigin(origin);

    if (board_.canPlace(moved.blocks())) {
        activeTetromino_ = moved;
        return true;
    }
    return false;
}

bool GameState::tryRotate(int direction) {
    if (!activeTetromino_) return false;

    Tetromino rotated = *activeTetromino_;
    rotated.rotate(direction);

    // No wall kicks: a rotation that collides is simply not applied
    if (board_.canPlace(rotated.blocks())) {
        activeTetromino_ = rotated;
        return true;
    }
    return false;
}

void GameState::resetLockTimerIfGrounded() noexcept {
    if (isGrounded()) {
        lockTimer_ = 0.0;
    }
}

} // namespace blockfall::core
